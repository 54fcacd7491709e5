#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cadence::util {

/*
  Time utilities.

  Calendar math is done on proleptic Gregorian day numbers so that adding days
  never depends on the local timezone or DST transitions.
*/

struct CivilDate {
  int      year  = 1970;
  unsigned month = 1;
  unsigned day   = 1;

  bool operator==(const CivilDate&) const = default;
};

// "YYYY-MM-DD"; nullopt on malformed or out-of-range input.
std::optional<CivilDate> ParseDate(std::string_view text);
std::string              FormatDate(const CivilDate& date);

std::int64_t DaysFromCivil(const CivilDate& date);
CivilDate    CivilFromDays(std::int64_t days);
CivilDate    AddDays(const CivilDate& date, std::int64_t days);

// "HH:MM" <-> minutes since midnight.
std::optional<int> ParseTimeOfDay(std::string_view text);
std::string        FormatTimeOfDay(int minutes_since_midnight);

// Wall-clock reading at minute resolution, local time.
struct LocalMinute {
  std::string date;   // YYYY-MM-DD
  std::string time;   // HH:MM
  int         second = 0;
};

/*
  Wall clock seen by the dispatcher.

  Injected so tests can drive ticks without sleeping.
*/
class WallClock {
 public:
  virtual ~WallClock() = default;

  virtual LocalMinute Now() = 0;

  virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemWallClock final : public WallClock {
 public:
  LocalMinute Now() override;

  void SleepFor(std::chrono::milliseconds duration) override;
};

std::string   Today();
std::string   NowIso8601();
std::uint64_t NowUnixMillis();

} // namespace cadence::util
