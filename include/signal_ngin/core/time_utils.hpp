// include/signal_ngin/core/time_utils.hpp
#pragma once

#include <time.h>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace core {

// Thread-safe localtime / gmtime; nullptr on failure
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Inverse of safe_gmtime; tm is read as UTC
 */
inline EpochSeconds utc_to_epoch(std::tm* tm) {
#ifdef _WIN32
    return static_cast<EpochSeconds>(_mkgmtime(tm));
#else
    return static_cast<EpochSeconds>(timegm(tm));
#endif
}

/**
 * @brief Format a bar timestamp as UTC ISO-8601 (YYYY-MM-DDTHH:MM:SSZ)
 */
inline std::string format_epoch_utc(EpochSeconds seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm result;
    if (safe_gmtime(&t, &result) == nullptr) {
        return std::to_string(seconds);
    }
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &result);
    return std::string(buffer);
}

/**
 * @brief Parse YYYY-MM-DDTHH:MM:SS as UTC; a trailing "Z" is accepted
 * @return Epoch seconds, or nothing if the text is not in that form
 */
inline std::optional<EpochSeconds> parse_iso_utc(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail())
        return std::nullopt;

    std::string rest;
    iss >> rest;
    if (!rest.empty() && rest != "Z")
        return std::nullopt;
    return utc_to_epoch(&tm);
}

}  // namespace core
}  // namespace signal_ngin
