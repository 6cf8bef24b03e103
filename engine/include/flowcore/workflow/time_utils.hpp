#pragma once

#include "flowcore/workflow/core.hpp"
#include <optional>
#include <string>

namespace flowcore {
namespace workflow {

// ISO 8601 UTC with microseconds, e.g. 2024-05-01T12:00:00.000123Z
std::string format_iso8601(TimePoint tp);

std::string iso8601_now();

// Accepts the format produced by format_iso8601, with or without the
// fractional part
std::optional<TimePoint> parse_iso8601(const std::string& text);

} // namespace workflow
} // namespace flowcore
