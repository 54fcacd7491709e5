#include "csv_codec.hpp"

#include <stdexcept>

namespace cadence::schedule {

std::string EncodeCsvField(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }

  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string EncodeCsvRow(const CsvRow& row) {
  std::string out;
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i > 0) out.push_back(',');
    out += EncodeCsvField(row[i]);
  }
  out.push_back('\n');
  return out;
}

std::vector<CsvRow> DecodeCsv(std::string_view text) {
  std::vector<CsvRow> rows;
  CsvRow              row;
  std::string         field;
  bool                in_quotes     = false;
  bool                row_has_data  = false;

  auto end_field = [&] {
    row.push_back(std::move(field));
    field.clear();
  };
  auto end_row = [&] {
    end_field();
    rows.push_back(std::move(row));
    row.clear();
    row_has_data = false;
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];

    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    switch (c) {
      case '"':
        in_quotes    = true;
        row_has_data = true;
        break;
      case ',':
        end_field();
        row_has_data = true;
        break;
      case '\r':
        if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        [[fallthrough]];
      case '\n':
        if (row_has_data || !field.empty() || !row.empty()) {
          end_row();
        }
        break;
      default:
        field.push_back(c);
        row_has_data = true;
        break;
    }
  }

  if (in_quotes) {
    throw std::runtime_error("unterminated quoted CSV field");
  }
  if (row_has_data || !field.empty() || !row.empty()) {
    end_row();
  }

  return rows;
}

} // namespace cadence::schedule
