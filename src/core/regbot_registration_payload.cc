#include "regbot_registration_payload.h"
#include "regbot_text_utils.h"
#include <algorithm>

namespace regbot {

std::string NormalizeIntegerField(const std::string& field_name, const std::string& value) {
  std::string trimmed = Trim(value);
  if (trimmed.empty()) {
    throw InvalidRowError(field_name + " is empty");
  }

  // Decimal digits, optionally followed by a zero fraction ("1990.0")
  size_t point = trimmed.find('.');
  std::string digits = trimmed.substr(0, point);
  std::string fraction = point == std::string::npos ? "" : trimmed.substr(point + 1);
  auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(), is_digit) ||
      (point != std::string::npos &&
       (fraction.empty() || !std::all_of(fraction.begin(), fraction.end(), is_digit)))) {
    throw InvalidRowError(field_name + " is not a number: '" + trimmed + "'");
  }
  if (fraction.find_first_not_of('0') != std::string::npos) {
    throw InvalidRowError(field_name + " is not a whole number: '" + trimmed + "'");
  }

  size_t first = digits.find_first_not_of('0');
  std::string significant = first == std::string::npos ? "0" : digits.substr(first);
  if (significant.size() > static_cast<size_t>(kMaxIntegerFieldDigits)) {
    throw InvalidRowError(field_name + " is out of range: '" + trimmed + "'");
  }
  return significant;
}

FormFields BuildRegistrationPayload(const std::string& day_id,
                                    const std::string& session_id,
                                    const RegistrantRow& row,
                                    const std::string& captcha_text) {
  FormFields fields;
  fields["Action"] = "DangKyThamDu";
  fields["idNgayBanHang"] = day_id;
  fields["idPhien"] = session_id;
  fields["HoTen"] = Trim(row.full_name);
  fields["NgaySinh_Ngay"] = NormalizeIntegerField("DOB_Day", row.dob_day);
  fields["NgaySinh_Thang"] = NormalizeIntegerField("DOB_Month", row.dob_month);
  fields["NgaySinh_Nam"] = NormalizeIntegerField("DOB_Year", row.dob_year);
  fields["SoDienThoai"] = Trim(row.phone);
  fields["Email"] = Trim(row.email);
  fields["CCCD"] = Trim(row.id_number);
  fields["Captcha"] = Trim(captcha_text);
  return fields;
}

}  // namespace regbot
