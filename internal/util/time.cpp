#include "time.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace cadence::util {

namespace {

bool IsLeap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned DaysInMonth(int year, unsigned month) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeap(year)) return 29;
  return kDays[month - 1];
}

template <typename T>
bool ParseDigits(std::string_view text, T& out) {
  if (text.empty()) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

std::tm LocalTm(std::time_t t) {
  std::tm lt{};
  localtime_r(&t, &lt);
  return lt;
}

} // namespace

std::optional<CivilDate> ParseDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

  CivilDate date;
  if (!ParseDigits(text.substr(0, 4), date.year)) return std::nullopt;
  if (!ParseDigits(text.substr(5, 2), date.month)) return std::nullopt;
  if (!ParseDigits(text.substr(8, 2), date.day)) return std::nullopt;

  if (date.month < 1 || date.month > 12) return std::nullopt;
  if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) return std::nullopt;
  return date;
}

std::string FormatDate(const CivilDate& date) {
  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month << '-' << std::setw(2) << date.day;
  return out.str();
}

// Howard Hinnant's days_from_civil / civil_from_days.
std::int64_t DaysFromCivil(const CivilDate& date) {
  const std::int64_t y   = static_cast<std::int64_t>(date.year) - (date.month <= 2 ? 1 : 0);
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto         yoe = static_cast<unsigned>(y - era * 400);
  const unsigned     mp  = date.month > 2 ? date.month - 3 : date.month + 9;
  const unsigned     doy = (153 * mp + 2) / 5 + date.day - 1;
  const unsigned     doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilDate CivilFromDays(std::int64_t days) {
  days += 719468;
  const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const auto         doe = static_cast<unsigned>(days - era * 146097);
  const unsigned     yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y   = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned     doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned     mp  = (5 * doy + 2) / 153;

  CivilDate date;
  date.day   = doy - (153 * mp + 2) / 5 + 1;
  date.month = mp < 10 ? mp + 3 : mp - 9;
  date.year  = static_cast<int>(y + (date.month <= 2 ? 1 : 0));
  return date;
}

CivilDate AddDays(const CivilDate& date, std::int64_t days) {
  return CivilFromDays(DaysFromCivil(date) + days);
}

std::optional<int> ParseTimeOfDay(std::string_view text) {
  if (text.size() != 5 || text[2] != ':') return std::nullopt;

  int hour   = 0;
  int minute = 0;
  if (!ParseDigits(text.substr(0, 2), hour) || !ParseDigits(text.substr(3, 2), minute)) return std::nullopt;
  if (hour > 23 || minute > 59) return std::nullopt;
  return hour * 60 + minute;
}

std::string FormatTimeOfDay(int minutes_since_midnight) {
  std::ostringstream out;
  out << std::setfill('0') << std::setw(2) << minutes_since_midnight / 60 << ':' << std::setw(2) << minutes_since_midnight % 60;
  return out.str();
}

LocalMinute SystemWallClock::Now() {
  const auto lt = LocalTm(std::time(nullptr));

  LocalMinute now;
  now.date   = FormatDate({lt.tm_year + 1900, static_cast<unsigned>(lt.tm_mon + 1), static_cast<unsigned>(lt.tm_mday)});
  now.time   = FormatTimeOfDay(lt.tm_hour * 60 + lt.tm_min);
  now.second = lt.tm_sec;
  return now;
}

void SystemWallClock::SleepFor(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

std::string Today() {
  const auto lt = LocalTm(std::time(nullptr));
  return FormatDate({lt.tm_year + 1900, static_cast<unsigned>(lt.tm_mon + 1), static_cast<unsigned>(lt.tm_mday)});
}

std::string NowIso8601() {
  const auto lt = LocalTm(std::time(nullptr));
  std::ostringstream out;
  out << std::put_time(&lt, "%Y-%m-%dT%H:%M:%S");
  return out.str();
}

std::uint64_t NowUnixMillis() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace cadence::util
