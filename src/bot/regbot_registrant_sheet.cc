#include "regbot_registrant_sheet.h"
#include "logger.h"
#include "regbot_text_utils.h"
#include <fstream>
#include <map>
#include <sstream>

namespace regbot {

namespace {

const char kUtf8Bom[] = "\xEF\xBB\xBF";

bool IsBlankRecord(const std::vector<std::string>& record) {
  for (const auto& field : record) {
    if (!Trim(field).empty()) {
      return false;
    }
  }
  return true;
}

}  // namespace

const std::vector<std::string>& RegistrantSheet::RequiredColumns() {
  static const std::vector<std::string> columns = {
      "FullName", "DOB_Day", "DOB_Month", "DOB_Year", "Phone", "Email", "IDNumber"};
  return columns;
}

std::vector<std::vector<std::string>> RegistrantSheet::ParseRecords(const std::string& csv_text) {
  std::string text = StartsWith(csv_text, kUtf8Bom) ? csv_text.substr(3) : csv_text;

  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool in_quotes = false;
  bool field_started = false;

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];

    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field += c;
      }
      continue;
    }

    switch (c) {
      case '"':
        in_quotes = true;
        field_started = true;
        break;
      case ',':
        record.push_back(field);
        field.clear();
        field_started = true;
        break;
      case '\r':
        break;
      case '\n':
        if (field_started || !field.empty() || !record.empty()) {
          record.push_back(field);
        }
        records.push_back(record);
        record.clear();
        field.clear();
        field_started = false;
        break;
      default:
        field += c;
        field_started = true;
        break;
    }
  }

  if (in_quotes) {
    throw SheetError("unterminated quoted field");
  }
  if (field_started || !field.empty() || !record.empty()) {
    record.push_back(field);
    records.push_back(record);
  }

  return records;
}

std::vector<RegistrantRow> RegistrantSheet::Parse(const std::string& csv_text) {
  std::vector<std::vector<std::string>> records = ParseRecords(csv_text);

  // Leading blank lines are not a header
  size_t header_at = 0;
  while (header_at < records.size() && IsBlankRecord(records[header_at])) {
    ++header_at;
  }
  if (header_at == records.size()) {
    throw SheetError("sheet has no header row");
  }

  std::map<std::string, size_t> column_of;
  const auto& header = records[header_at];
  for (size_t i = 0; i < header.size(); ++i) {
    column_of.emplace(Trim(header[i]), i);
  }

  for (const auto& name : RequiredColumns()) {
    if (column_of.find(name) == column_of.end()) {
      throw SheetError("missing required column: " + name);
    }
  }

  auto cell = [&column_of](const std::vector<std::string>& record, const std::string& name) {
    auto it = column_of.find(name);
    if (it == column_of.end() || it->second >= record.size()) {
      return std::string();
    }
    return Trim(record[it->second]);
  };

  std::vector<RegistrantRow> rows;
  for (size_t r = header_at + 1; r < records.size(); ++r) {
    const auto& record = records[r];
    if (IsBlankRecord(record)) {
      continue;
    }

    RegistrantRow row;
    row.index = static_cast<int>(r - header_at - 1);
    row.full_name = cell(record, "FullName");
    row.dob_day = cell(record, "DOB_Day");
    row.dob_month = cell(record, "DOB_Month");
    row.dob_year = cell(record, "DOB_Year");
    row.phone = cell(record, "Phone");
    row.email = cell(record, "Email");
    row.id_number = cell(record, "IDNumber");

    std::string session = cell(record, "SessionName");
    if (!session.empty()) {
      row.session_name = session;
    }

    rows.push_back(std::move(row));
  }

  LOG_INFO("Sheet", "Parsed " + std::to_string(rows.size()) + " registrant rows");
  return rows;
}

std::vector<RegistrantRow> RegistrantSheet::ParseFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw SheetError("cannot open " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return Parse(buffer.str());
}

}  // namespace regbot
