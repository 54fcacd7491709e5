#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cadence::schedule {

/*
  Minimal RFC 4180 codec.

  Fields containing a comma, quote, CR or LF are quoted; embedded quotes are
  doubled. The reader accepts LF and CRLF line endings and quoted fields that
  span lines.
*/

using CsvRow = std::vector<std::string>;

std::string EncodeCsvField(std::string_view field);
std::string EncodeCsvRow(const CsvRow& row);

// Throws std::runtime_error on an unterminated quoted field.
std::vector<CsvRow> DecodeCsv(std::string_view text);

} // namespace cadence::schedule
