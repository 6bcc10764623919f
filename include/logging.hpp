//
//  logging.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace cutplan {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Fixed-precision seconds for log lines ("12.345s").
inline std::string seconds_str(double seconds, int precision = 3) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << seconds << "s";
    return oss.str();
}

}  // namespace cutplan

inline constexpr cutplan::LogVerbosity cp_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return cutplan::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return cutplan::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return cutplan::LogVerbosity::Info;
    }
    // Everything else (timeline/resolver/plan/etc.) treated as debug-level.
    return cutplan::LogVerbosity::Debug;
}

inline bool cp_should_log(const char* level) {
    const auto current = cutplan::get_log_verbosity();
    const auto sev = cp_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void cp_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[CutPlan][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[CutPlan][" << level << "] " << msg << std::endl;
    }
}

#define CP_LOG(level, message)                                              \
    do {                                                                    \
        if (cp_should_log(level)) {                                         \
            std::ostringstream _cp_log_ss;                                  \
            _cp_log_ss << message;                                          \
            cp_log_impl(level, _cp_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
