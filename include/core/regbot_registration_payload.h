#pragma once

#include <stdexcept>
#include <string>
#include "regbot_types.h"

namespace regbot {

// Row data that cannot be turned into a submission
class InvalidRowError : public std::runtime_error {
public:
  explicit InvalidRowError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Build the DangKyThamDu request fields.
 *
 * Keys: Action, idNgayBanHang, idPhien, HoTen, NgaySinh_Ngay, NgaySinh_Thang,
 * NgaySinh_Nam, SoDienThoai, Email, CCCD, Captcha. Text values are trimmed,
 * date-of-birth values are normalised to integer strings ("5.0" -> "5").
 * Throws InvalidRowError when a date-of-birth cell is not a whole number.
 */
FormFields BuildRegistrationPayload(const std::string& day_id,
                                    const std::string& session_id,
                                    const RegistrantRow& row,
                                    const std::string& captcha_text);

// Date-of-birth cells never need more than a four digit year
constexpr int kMaxIntegerFieldDigits = 4;

// "5", "5.0", " 05 " -> "5". Only plain decimal text is accepted, with at most
// kMaxIntegerFieldDigits significant digits; throws InvalidRowError otherwise.
std::string NormalizeIntegerField(const std::string& field_name, const std::string& value);

}  // namespace regbot
