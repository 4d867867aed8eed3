#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

// ISO-8601 "YYYY-MM-DDTHH:MM:SSZ" helpers; all values are UTC, second resolution.

inline std::string to_utc_iso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto secs = time_point_cast<seconds>(tp);
    std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline std::string now_utc_iso8601() {
    return to_utc_iso8601(std::chrono::system_clock::now());
}

// Returns nullopt for anything that is not exactly the format above.
inline std::optional<std::chrono::system_clock::time_point>
parse_utc_iso8601(const std::string& s) {
    if (s.size() != 20 || s.back() != 'Z') return std::nullopt;

    std::tm tm{};
    std::istringstream iss(s);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (iss.fail()) return std::nullopt;

#if defined(_WIN32)
    std::time_t t = _mkgmtime(&tm);
#else
    std::time_t t = timegm(&tm);
#endif
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}
