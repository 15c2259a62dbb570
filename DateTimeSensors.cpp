#include "DateTimeSensors.h"
#include <cstdio>
#include <map>

static std::string two_digits(int v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d", v);
    return buf;
}

std::optional<std::string> date_time_value(const std::string& label, const std::tm& local) {
    if (label.compare(0, 5, "DATE_") != 0) return std::nullopt;

    const std::string year = std::to_string(local.tm_year + 1900);
    const std::string month = two_digits(local.tm_mon + 1);
    const std::string day = two_digits(local.tm_mday);
    const std::string hour = two_digits(local.tm_hour);
    const std::string minute = two_digits(local.tm_min);
    const std::string second = two_digits(local.tm_sec);

    const std::map<std::string, std::string> values = {
        {"DATE_year", year},
        {"DATE_month", month},
        {"DATE_day", day},
        {"DATE_hour", hour},
        {"DATE_minute", minute},
        {"DATE_second", second},
        {"DATE_m_d_h_m_1", month + "月" + day + "日  " + hour + ":" + minute},
        {"DATE_m_d_h_m_2", month + "/" + day + "  " + hour + ":" + minute},
        {"DATE_m_d_1", month + "月" + day + "日"},
        {"DATE_m_d_2", month + "-" + day},
        {"DATE_y_m_d_1", year + "年" + month + "月" + day + "日"},
        {"DATE_y_m_d_2", year + "-" + month + "-" + day},
        {"DATE_y_m_d_3", year + "/" + month + "/" + day},
        {"DATE_y_m_d_4", year + " " + month + " " + day},
        {"DATE_h_m_s_1", hour + ":" + minute + ":" + second},
        {"DATE_h_m_s_2", hour + "时" + minute + "分" + second + "秒"},
        {"DATE_h_m_s_3", hour + " " + minute + " " + second},
        {"DATE_h_m_1", hour + "时" + minute + "分"},
        {"DATE_h_m_2", hour + " : " + minute},
        {"DATE_h_m_3", hour + ":" + minute},
    };

    auto it = values.find(label);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

std::tm local_now() {
    std::time_t t = std::time(nullptr);
    std::tm local = {};
    localtime_r(&t, &local);
    return local;
}
