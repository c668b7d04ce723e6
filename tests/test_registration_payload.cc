#include <gtest/gtest.h>
#include <set>
#include "regbot_registration_payload.h"
#include "regbot_test_fakes.h"

using namespace regbot;

TEST(RegistrationPayloadTest, HasExactlyTheSiteKeys) {
  RegistrantRow row = fakes::MakeRow(0, "  Tran Thi B ");
  FormFields fields = BuildRegistrationPayload("77", "101", row, " x7k2 ");

  std::set<std::string> keys;
  for (const auto& entry : fields) {
    keys.insert(entry.first);
  }
  std::set<std::string> expected = {"Action", "idNgayBanHang", "idPhien", "HoTen",
                                    "NgaySinh_Ngay", "NgaySinh_Thang", "NgaySinh_Nam",
                                    "SoDienThoai", "Email", "CCCD", "Captcha"};
  EXPECT_EQ(keys, expected);

  EXPECT_EQ(fields["Action"], "DangKyThamDu");
  EXPECT_EQ(fields["idNgayBanHang"], "77");
  EXPECT_EQ(fields["idPhien"], "101");
  EXPECT_EQ(fields["HoTen"], "Tran Thi B");
  EXPECT_EQ(fields["Captcha"], "x7k2");
}

TEST(RegistrationPayloadTest, DateOfBirthCellsBecomeIntegers) {
  RegistrantRow row = fakes::MakeRow(0, "A");
  row.dob_day = "5.0";
  row.dob_month = " 07 ";
  row.dob_year = "1990.0";
  FormFields fields = BuildRegistrationPayload("1", "2", row, "c");
  EXPECT_EQ(fields["NgaySinh_Ngay"], "5");
  EXPECT_EQ(fields["NgaySinh_Thang"], "7");
  EXPECT_EQ(fields["NgaySinh_Nam"], "1990");
}

TEST(RegistrationPayloadTest, NonNumericDateOfBirthIsAnInvalidRow) {
  RegistrantRow row = fakes::MakeRow(0, "A");
  row.dob_day = "fifth";
  EXPECT_THROW(BuildRegistrationPayload("1", "2", row, "c"), InvalidRowError);

  EXPECT_THROW(NormalizeIntegerField("DOB_Month", ""), InvalidRowError);
  EXPECT_THROW(NormalizeIntegerField("DOB_Month", "5.5"), InvalidRowError);
  EXPECT_EQ(NormalizeIntegerField("DOB_Month", "12"), "12");
}

TEST(RegistrationPayloadTest, OnlyPlainDecimalDateOfBirthIsAccepted) {
  EXPECT_EQ(NormalizeIntegerField("DOB_Year", "0001990.00"), "1990");
  EXPECT_EQ(NormalizeIntegerField("DOB_Day", "0"), "0");

  for (const char* cell : {"1e30", "1e19", "0x7", "-5", "+5", "5.", ".5", "5,0", "inf", "nan",
                           "1 990", "19900"}) {
    EXPECT_THROW(NormalizeIntegerField("DOB_Year", cell), InvalidRowError) << cell;
  }
}
