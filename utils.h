#ifndef UTILS_H
#define UTILS_H

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

inline void warn_invalid_env(const char* name, const char* value) {
    std::cerr << "[Config] Ignoring invalid " << name << "=" << value << std::endl;
}

inline int getenv_int(const char* name, int def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        warn_invalid_env(name, v);
        return def;
    }
}

inline double getenv_double(const char* name, double def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    try {
        return std::stod(v);
    } catch (const std::exception&) {
        warn_invalid_env(name, v);
        return def;
    }
}

inline bool getenv_bool(const char* name, bool def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    std::string s(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    warn_invalid_env(name, v);
    return def;
}

inline std::string getenv_string(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    return std::string(v);
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Decode one UTF-8 sequence starting at s[i], advancing i. Invalid bytes map to '?'.
inline uint32_t utf8_next(const std::string& s, size_t& i) {
    unsigned char c = static_cast<unsigned char>(s[i++]);
    if (c < 0x80) return c;
    int extra = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return '?';
    for (int k = 0; k < extra; ++k) {
        if (i >= s.size()) return '?';
        unsigned char cc = static_cast<unsigned char>(s[i]);
        if ((cc & 0xC0) != 0x80) return '?';
        cp = (cp << 6) | (cc & 0x3F);
        ++i;
    }
    return cp;
}

#endif // UTILS_H
