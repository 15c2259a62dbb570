#ifndef DATE_TIME_SENSORS_H
#define DATE_TIME_SENSORS_H

#include <ctime>
#include <optional>
#include <string>

// Value of a synthetic DATE_* label (e.g. "DATE_h_m_s_1" -> "13:05:09") for the given
// local time. Returns nullopt for labels that are not date/time labels.
std::optional<std::string> date_time_value(const std::string& label, const std::tm& local);

std::tm local_now();

#endif // DATE_TIME_SENSORS_H
