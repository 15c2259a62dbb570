#include "DateTimeSensors.h"
#include <gtest/gtest.h>

namespace {

std::tm sample_time() {
    std::tm t = {};
    t.tm_year = 2025 - 1900;
    t.tm_mon = 2;
    t.tm_mday = 7;
    t.tm_hour = 9;
    t.tm_min = 5;
    t.tm_sec = 3;
    return t;
}

struct DateCase {
    const char* label;
    const char* expected;
};

class DateTimeValueTest : public ::testing::TestWithParam<DateCase> {};

}  // namespace

TEST_P(DateTimeValueTest, FormatsLabel) {
    auto value = date_time_value(GetParam().label, sample_time());
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(GetParam().expected, *value);
}

INSTANTIATE_TEST_SUITE_P(Labels, DateTimeValueTest, ::testing::Values(
    DateCase{"DATE_year", "2025"},
    DateCase{"DATE_month", "03"},
    DateCase{"DATE_day", "07"},
    DateCase{"DATE_hour", "09"},
    DateCase{"DATE_minute", "05"},
    DateCase{"DATE_second", "03"},
    DateCase{"DATE_m_d_h_m_1", "03月07日  09:05"},
    DateCase{"DATE_m_d_h_m_2", "03/07  09:05"},
    DateCase{"DATE_m_d_1", "03月07日"},
    DateCase{"DATE_m_d_2", "03-07"},
    DateCase{"DATE_y_m_d_1", "2025年03月07日"},
    DateCase{"DATE_y_m_d_2", "2025-03-07"},
    DateCase{"DATE_y_m_d_3", "2025/03/07"},
    DateCase{"DATE_y_m_d_4", "2025 03 07"},
    DateCase{"DATE_h_m_s_1", "09:05:03"},
    DateCase{"DATE_h_m_s_2", "09时05分03秒"},
    DateCase{"DATE_h_m_s_3", "09 05 03"},
    DateCase{"DATE_h_m_1", "09时05分"},
    DateCase{"DATE_h_m_2", "09 : 05"},
    DateCase{"DATE_h_m_3", "09:05"}));

TEST(DateTimeValue, UnknownLabels) {
    EXPECT_FALSE(date_time_value("cpu_temp", sample_time()).has_value());
    EXPECT_FALSE(date_time_value("DATE_unknown", sample_time()).has_value());
    EXPECT_FALSE(date_time_value("DATE", sample_time()).has_value());
}
