#include "random.hpp"

#include <algorithm>

namespace cadence::util {

SeededRandom::SeededRandom(std::uint64_t seed) : rng_(seed) {
}

double SeededRandom::Uniform(double lo, double hi) {
  if (hi <= lo) return lo;
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(rng_);
}

void SeededRandom::Shuffle(std::vector<std::size_t>& items) {
  std::shuffle(items.begin(), items.end(), rng_);
}

std::uint64_t SeedFromDevice() {
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32) ^ device();
}

} // namespace cadence::util
