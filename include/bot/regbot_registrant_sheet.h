#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "regbot_types.h"

namespace regbot {

class SheetError : public std::runtime_error {
public:
  explicit SheetError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * RegistrantSheet - CSV ingestion of registrant rows
 *
 * The first record is the header. Columns are matched by exact (trimmed)
 * name in any order; FullName, DOB_Day, DOB_Month, DOB_Year, Phone, Email
 * and IDNumber are required, SessionName is optional and unknown columns
 * (SalesDate included) are ignored. Row indexes count data records from 0,
 * skipped blank lines included, so they match the sheet the operator sees.
 */
class RegistrantSheet {
public:
  static const std::vector<std::string>& RequiredColumns();

  // Throws SheetError on a missing required column or unterminated quote
  static std::vector<RegistrantRow> Parse(const std::string& csv_text);

  static std::vector<RegistrantRow> ParseFile(const std::string& path);

  // RFC 4180 records: quoted fields may hold commas, "" and newlines
  static std::vector<std::vector<std::string>> ParseRecords(const std::string& csv_text);
};

}  // namespace regbot
