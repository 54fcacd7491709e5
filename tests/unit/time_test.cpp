#include "internal/util/time.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#include "internal/model/schedule_record.hpp"
#include "internal/util/random.hpp"

namespace {

using cadence::util::CivilDate;

void TestParseDate() {
  auto date = cadence::util::ParseDate("2024-02-29");
  assert(date.has_value());
  assert((*date == CivilDate{2024, 2, 29}));

  assert(!cadence::util::ParseDate("2023-02-29"));
  assert(!cadence::util::ParseDate("2024-13-01"));
  assert(!cadence::util::ParseDate("2024-00-10"));
  assert(!cadence::util::ParseDate("2024-1-01"));
  assert(!cadence::util::ParseDate("2024/01/01"));
  assert(!cadence::util::ParseDate("20x4-01-01"));
  assert(!cadence::util::ParseDate(""));
}

void TestDateArithmetic() {
  const CivilDate start{2025, 12, 30};
  assert(cadence::util::FormatDate(cadence::util::AddDays(start, 0)) == "2025-12-30");
  assert(cadence::util::FormatDate(cadence::util::AddDays(start, 2)) == "2026-01-01");
  assert(cadence::util::FormatDate(cadence::util::AddDays({2024, 2, 28}, 1)) == "2024-02-29");
  assert(cadence::util::FormatDate(cadence::util::AddDays({2024, 3, 1}, -1)) == "2024-02-29");

  assert(cadence::util::DaysFromCivil({1970, 1, 1}) == 0);
  assert(cadence::util::DaysFromCivil({2000, 3, 1}) == 11017);
  assert((cadence::util::CivilFromDays(11017) == CivilDate{2000, 3, 1}));
}

void TestTimeOfDay() {
  assert(cadence::util::ParseTimeOfDay("00:00") == 0);
  assert(cadence::util::ParseTimeOfDay("09:05") == 545);
  assert(cadence::util::ParseTimeOfDay("23:59") == 1439);
  assert(!cadence::util::ParseTimeOfDay("24:00"));
  assert(!cadence::util::ParseTimeOfDay("9:05"));
  assert(!cadence::util::ParseTimeOfDay("09:60"));

  assert(cadence::util::FormatTimeOfDay(0) == "00:00");
  assert(cadence::util::FormatTimeOfDay(545) == "09:05");
  assert(cadence::util::FormatTimeOfDay(1439) == "23:59");
}

void TestSystemClockShape() {
  cadence::util::SystemWallClock clock;
  const auto                     now = clock.Now();
  assert(cadence::util::ParseDate(now.date).has_value());
  assert(cadence::util::ParseTimeOfDay(now.time).has_value());
  assert(now.second >= 0 && now.second <= 60);
  assert(cadence::util::ParseDate(cadence::util::Today()).has_value());
}

void TestRowIds() {
  using cadence::model::KindOf;
  using cadence::model::ParentOf;
  using cadence::model::PostKind;

  assert(ParentOf("0").empty());
  assert(ParentOf("1") == "0");
  assert(ParentOf("1.2") == "1");
  assert(ParentOf("2.1.3") == "2.1");

  assert(KindOf("0") == PostKind::kSelf);
  assert(KindOf("") == PostKind::kSelf);
  assert(KindOf("3") == PostKind::kComment);

  assert((cadence::model::SplitRowId("2.1.3") == std::vector<std::string>{"2", "1", "3"}));
  assert(cadence::model::ParsePostKind("self") == PostKind::kSelf);
  assert(!cadence::model::ParsePostKind("Self"));
}

void TestSeededRandomIsReproducible() {
  std::vector<std::size_t> a(8);
  std::iota(a.begin(), a.end(), 0);
  auto b = a;

  cadence::util::SeededRandom first(123);
  cadence::util::SeededRandom second(123);
  first.Shuffle(a);
  second.Shuffle(b);
  assert(a == b);

  std::sort(a.begin(), a.end());
  for (std::size_t i = 0; i < a.size(); ++i) assert(a[i] == i);

  for (int i = 0; i < 100; ++i) {
    const double v = first.Uniform(2.0, 7.0);
    assert(v >= 2.0 && v <= 7.0);
  }
  assert(first.Uniform(5.0, 5.0) == 5.0);
}

} // namespace

int main() {
  TestParseDate();
  TestDateArithmetic();
  TestTimeOfDay();
  TestSystemClockShape();
  TestRowIds();
  TestSeededRandomIsReproducible();

  std::cout << "cadence_unit_time: pass\n";
  return 0;
}
