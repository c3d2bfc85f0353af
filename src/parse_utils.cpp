#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

namespace {

std::string lower(std::string val) {
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return val;
}

bool all_digits(const std::string& val) {
    return !val.empty() &&
           std::all_of(val.begin(), val.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::out_of_range&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    unsigned long long mult = 1;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("kb")) {
        mult = 1024ull;
        val.erase(val.size() - 2);
    } else if (ends_with("mb")) {
        mult = 1024ull * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("gb")) {
        mult = 1024ull * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("k")) {
        mult = 1024ull;
        val.pop_back();
    } else if (ends_with("m")) {
        mult = 1024ull * 1024;
        val.pop_back();
    } else if (ends_with("g")) {
        mult = 1024ull * 1024 * 1024;
        val.pop_back();
    } else if (ends_with("b")) {
        val.pop_back();
    }
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

LogLevel parse_log_level(const std::string& value, bool& ok) {
    ok = true;
    std::string val = lower(value);
    if (val == "debug")
        return LogLevel::DEBUG;
    if (val == "info")
        return LogLevel::INFO;
    if (val == "warning" || val == "warn")
        return LogLevel::WARNING;
    if (val == "error")
        return LogLevel::ERR;
    ok = false;
    return LogLevel::INFO;
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    std::string val = lower(value);
    if (val.empty() || val == "1" || val == "true" || val == "yes" || val == "on")
        return true;
    if (val == "0" || val == "false" || val == "no" || val == "off")
        return false;
    ok = false;
    return false;
}
