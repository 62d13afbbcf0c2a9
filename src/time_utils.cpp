#include "time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <algorithm>

namespace {

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
        [](unsigned char ch) { return std::isspace(ch); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();
    return first < last ? std::string(first, last) : std::string();
}

// Offset in seconds east of UTC for "Z", "+0100", "-05:30"
std::optional<long> parseUtcOffset(const std::string& text) {
    if (text == "Z" || text == "z") {
        return 0L;
    }
    if (text.size() < 3 || (text[0] != '+' && text[0] != '-')) {
        return std::nullopt;
    }

    std::string digits;
    for (size_t i = 1; i < text.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(text[i]))) {
            digits += text[i];
        } else if (text[i] != ':') {
            return std::nullopt;
        }
    }
    if (digits.size() != 4 && digits.size() != 2) {
        return std::nullopt;
    }

    long hours = std::stol(digits.substr(0, 2));
    long minutes = digits.size() == 4 ? std::stol(digits.substr(2, 2)) : 0;
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }
    long offset = hours * 3600 + minutes * 60;
    return text[0] == '-' ? -offset : offset;
}

std::optional<TimePoint> parseTimestamp(const std::string& input) {
    std::string text = trim(input);
    // "YYYY-MM-DD HH:MM:SS" is the shortest accepted form
    if (text.size() < 19) {
        return std::nullopt;
    }
    if (text[10] == 'T') {
        text[10] = ' ';
    }

    // Everything after the seconds field is the offset marker and is handled separately
    std::string local = text.substr(0, 19);
    std::string offsetText = trim(text.substr(19));

    std::tm tm = {};
    std::istringstream ss(local);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    if (!offsetText.empty()) {
        if (auto offset = parseUtcOffset(offsetText)) {
            seconds -= *offset;
        }
    }

    return std::chrono::system_clock::from_time_t(seconds);
}

std::string formatUtc(const TimePoint& time, const char* format) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm = {};
    gmtime_r(&seconds, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

} // namespace

std::optional<TimePoint> parseCommitTimestamp(const std::string& text) {
    return parseTimestamp(text);
}

std::optional<TimePoint> parseIsoTimestamp(const std::string& text) {
    return parseTimestamp(text);
}

std::string formatIsoTimestamp(const TimePoint& time) {
    return formatUtc(time, "%Y-%m-%dT%H:%M:%SZ");
}

std::string formatDate(const TimePoint& time) {
    return formatUtc(time, "%Y-%m-%d");
}

long daysBetween(const TimePoint& then, const TimePoint& now) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now - then).count();
    long days = static_cast<long>(seconds / 86400);
    if (seconds % 86400 < 0) {
        --days;
    }
    return days;
}
