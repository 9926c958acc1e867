#pragma once

#define COHORT_VERSION "0.4.1"
#define COHORT_TABLE_FORMAT_VERSION 1

namespace cohort {
namespace version {

// Mirrored tables written by a newer format are not read back
inline bool table_format_compatible(int format) {
    return format >= 1 && format <= COHORT_TABLE_FORMAT_VERSION;
}

} // namespace version
} // namespace cohort
