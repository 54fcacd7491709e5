#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace cadence::util {

/*
  Randomness used for due-batch ordering and inter-post jitter.

  Injected so tests can use a fixed seed.
*/
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Uniform in [lo, hi].
  virtual double Uniform(double lo, double hi) = 0;

  virtual void Shuffle(std::vector<std::size_t>& items) = 0;
};

class SeededRandom final : public RandomSource {
 public:
  explicit SeededRandom(std::uint64_t seed);

  double Uniform(double lo, double hi) override;
  void   Shuffle(std::vector<std::size_t>& items) override;

 private:
  std::mt19937_64 rng_;
};

std::uint64_t SeedFromDevice();

} // namespace cadence::util
