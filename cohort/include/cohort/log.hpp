#pragma once
// Log: tagged lines on stderr
//
// Warnings always print. Detail lines print only when the owning
// component was configured verbose.

#include <iostream>
#include <string>

namespace cohort {
namespace log {

inline void warn(const char* tag, const std::string& msg) {
    std::cerr << "[" << tag << "] " << msg << "\n";
}

inline void detail(bool verbose, const char* tag, const std::string& msg) {
    if (verbose) {
        std::cerr << "[" << tag << "] " << msg << "\n";
    }
}

} // namespace log
} // namespace cohort
