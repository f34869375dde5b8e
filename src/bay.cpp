#include "bay.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>

namespace parkwatch {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

bool parse_int_field(std::string_view text, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > text.size()) return false;
    auto first = text.data() + pos;
    auto [ptr, ec] = std::from_chars(first, first + len, out);
    return ec == std::errc{} && ptr == first + len;
}

constexpr std::int64_t max_epoch_seconds =
    std::chrono::duration_cast<std::chrono::seconds>(timestamp::duration::max()).count();
constexpr std::int64_t min_epoch_seconds =
    std::chrono::duration_cast<std::chrono::seconds>(timestamp::duration::min()).count();

} // anonymous namespace

occupancy_state parse_occupancy(std::string_view status) {
    auto s = trim(status);
    if (iequals(s, "unoccupied") || iequals(s, "available") ||
        iequals(s, "free") || iequals(s, "vacant")) {
        return occupancy_state::available;
    }
    if (iequals(s, "present") || iequals(s, "occupied")) {
        return occupancy_state::occupied;
    }
    return occupancy_state::unknown;
}

const char* to_string(occupancy_state s) {
    switch (s) {
        case occupancy_state::available: return "available";
        case occupancy_state::occupied:  return "occupied";
        case occupancy_state::unknown:   return "unknown";
    }
    return "unknown";
}

std::int64_t to_epoch_seconds(timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

timestamp from_epoch_seconds(std::int64_t s) {
    return timestamp(std::chrono::seconds(s));
}

std::optional<timestamp> checked_epoch_seconds(std::int64_t s) {
    if (s > max_epoch_seconds || s < min_epoch_seconds) return std::nullopt;
    return from_epoch_seconds(s);
}

std::optional<timestamp> checked_epoch_seconds(double s) {
    if (!std::isfinite(s)) return std::nullopt;
    if (s >= static_cast<double>(max_epoch_seconds) || s <= static_cast<double>(min_epoch_seconds)) {
        return std::nullopt;
    }
    return from_epoch_seconds(static_cast<std::int64_t>(s));
}

std::optional<timestamp> parse_iso8601(std::string_view text) {
    text = trim(text);
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 19) return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    std::tm tm{};
    int year, month, day, hour, minute, second;
    if (!parse_int_field(text, 0, 4, year) || !parse_int_field(text, 5, 2, month) ||
        !parse_int_field(text, 8, 2, day) || !parse_int_field(text, 11, 2, hour) ||
        !parse_int_field(text, 14, 2, minute) || !parse_int_field(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    auto rest = text.substr(19);
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        while (!rest.empty() && std::isdigit(static_cast<unsigned char>(rest.front()))) {
            rest.remove_prefix(1);
        }
    }
    if (!rest.empty() && rest != "Z" && rest != "+00:00") return std::nullopt;

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    const std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return checked_epoch_seconds(static_cast<std::int64_t>(t));
}

} // namespace parkwatch
