#pragma once
// TimeFormat.hpp - Timestamp and size formatting used across the UI

#include <optional>
#include <string>
#include "Types.hpp"

namespace babel::timefmt {

// H:MM:SS.mmm, e.g. 0:03:07.250
std::string formatTimestamp(Duration t);

// "???" when the duration is unknown
std::string formatTotal(std::optional<Duration> t);

// Inverse of formatTimestamp. Also accepts MM:SS.mmm and SS.mmm.
std::optional<Duration> parseTimestamp(std::string_view text);

// Minute/second/millisecond split used by the segment editors
struct MinSecMs {
    i64 minutes{0};
    i64 seconds{0};
    i64 millis{0};
};

MinSecMs split(Duration t);
Duration join(const MinSecMs& parts);

// "12.34 MiB"
std::string formatMiB(u64 bytes);

} // namespace babel::timefmt
