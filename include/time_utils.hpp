#pragma once

#include <string>
#include <optional>
#include "project_record.hpp"

// Parse git's "%ci" output, e.g. "2024-01-15 10:30:00 +0100".
// The local part is read first, then the UTC offset is applied when it parses.
std::optional<TimePoint> parseCommitTimestamp(const std::string& text);

// Parse an ISO-8601 UTC timestamp such as "2024-01-15T10:30:00Z"
std::optional<TimePoint> parseIsoTimestamp(const std::string& text);

// Format as "2024-01-15T10:30:00Z"
std::string formatIsoTimestamp(const TimePoint& time);

// Format as "2024-01-15"
std::string formatDate(const TimePoint& time);

// Whole days elapsed from `then` to `now`, rounded toward negative infinity
long daysBetween(const TimePoint& then, const TimePoint& now);
