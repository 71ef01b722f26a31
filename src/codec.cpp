#include "argtree/codec.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace argtree::detail {

namespace {

std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool allDigits(std::string_view s) {
    if (s.empty()) return false;
    for (const char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

bool parseBool(std::string_view s, bool& out) {
    const auto t = trimWs(s);
    if (t == "1" || t == "true" || t == "True" || t == "TRUE" || t == "on" || t == "yes") {
        out = true;
        return true;
    }
    if (t == "0" || t == "false" || t == "False" || t == "FALSE" || t == "off" || t == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parseSigned(std::string_view s, long long& out, bool& overflow) {
    overflow = false;
    const auto t = trimWs(s);
    const auto digits = (!t.empty() && (t.front() == '-' || t.front() == '+')) ? t.substr(1) : t;
    if (!allDigits(digits)) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno == ERANGE) {
        overflow = true;
        return false;
    }
    if (errno != 0 || !end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

bool parseUnsigned(std::string_view s, unsigned long long& out, bool& overflow) {
    overflow = false;
    const auto t = trimWs(s);
    const auto digits = (!t.empty() && t.front() == '+') ? t.substr(1) : t;
    // strtoull accepts a leading '-' and wraps; reject it up front.
    if (!allDigits(digits)) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(tmp.c_str(), &end, 10);
    if (errno == ERANGE) {
        overflow = true;
        return false;
    }
    if (errno != 0 || !end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

bool parseDouble(std::string_view s, double& out, bool& overflow) {
    overflow = false;
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (errno == ERANGE && std::isinf(v)) {
        overflow = true;
        return false;
    }
    out = v;
    return true;
}

namespace {

struct DurationUnit {
    std::string_view suffix;
    double millis;
};

// Two-letter suffixes come first so "ms" is not read as "m".
constexpr DurationUnit kDurationUnits[] = {
    {"ns", 1e-6}, {"us", 1e-3}, {"ms", 1.0}, {"s", 1e3}, {"m", 6e4}, {"h", 3.6e6},
};

const DurationUnit* matchUnit(std::string_view rest) {
    for (const auto& u : kDurationUnits) {
        if (rest.substr(0, u.suffix.size()) == u.suffix) return &u;
    }
    return nullptr;
}

} // namespace

// Go style durations: "300ms", "1.5h", "2h45m", "-1m30s".
bool parseDuration(std::string_view s, std::chrono::milliseconds& out) {
    auto rest = trimWs(s);
    double sign = 1.0;
    if (!rest.empty() && (rest.front() == '+' || rest.front() == '-')) {
        if (rest.front() == '-') sign = -1.0;
        rest.remove_prefix(1);
    }
    if (rest.empty()) return false;
    if (rest == "0") {
        out = std::chrono::milliseconds(0);
        return true;
    }

    double total = 0.0;
    while (!rest.empty()) {
        const auto numLen = std::min(rest.find_first_not_of("0123456789."), rest.size());
        const auto number = rest.substr(0, numLen);
        if (number.empty() || number.find_first_of("0123456789") == std::string_view::npos) return false;
        const auto dot = number.find('.');
        if (dot != std::string_view::npos && number.find('.', dot + 1) != std::string_view::npos) return false;

        const auto* unit = matchUnit(rest.substr(numLen));
        if (!unit) return false;
        double value = 0.0;
        bool overflow = false;
        if (!parseDouble(number, value, overflow)) return false;
        total += value * unit->millis;
        rest.remove_prefix(numLen + unit->suffix.size());
    }

    total *= sign;
    if (!(std::fabs(total) < static_cast<double>(std::numeric_limits<std::int64_t>::max()))) return false;
    out = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(total)));
    return true;
}

std::string formatDouble(double v) {
    std::ostringstream oss;
    oss.precision(17);
    oss << v;
    // Prefer the shortest representation that reads back to the same value.
    for (int p = 1; p < 17; ++p) {
        std::ostringstream shortOss;
        shortOss.precision(p);
        shortOss << v;
        if (std::strtod(shortOss.str().c_str(), nullptr) == v) return shortOss.str();
    }
    return oss.str();
}

void throwInvalid(std::string_view type, std::string_view raw) {
    throw Error(ErrorCode::InvalidFormat, "invalid " + std::string(type) + " value \"" + std::string(raw) + "\"");
}

void throwOverflow(std::string_view type, std::string_view raw) {
    throw Error(ErrorCode::Overflow, "value \"" + std::string(raw) + "\" out of range for " + std::string(type));
}

} // namespace argtree::detail
