#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <system_error>

namespace {

template <typename T> bool parse_whole(const std::string& text, T& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+')
        ++first;
    if (first == last)
        return false;
    auto res = std::from_chars(first, last, out);
    return res.ec == std::errc() && res.ptr == last;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    int v = 0;
    if (!parse_whole(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return v;
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!value.empty() && value[0] == '-')
        return 0;
    unsigned long long v = 0;
    if (!parse_whole(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<size_t>(v);
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    if (val.empty() || val[0] == '-')
        return 0;
    unsigned long long mult = 1;
    if (val.size() >= 2 && val.back() == 'b' &&
        (val[val.size() - 2] == 'k' || val[val.size() - 2] == 'm' || val[val.size() - 2] == 'g'))
        val.pop_back();
    switch (val.back()) {
    case 'k':
        mult = 1024ull;
        val.pop_back();
        break;
    case 'm':
        mult = 1024ull * 1024;
        val.pop_back();
        break;
    case 'g':
        mult = 1024ull * 1024 * 1024;
        val.pop_back();
        break;
    case 'b':
        val.pop_back();
        break;
    default:
        break;
    }
    unsigned long long base = 0;
    if (!parse_whole(val, base))
        return 0;
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    char unit = value.back();
    std::string num = value;
    if (unit == 's' || unit == 'm' || unit == 'h' || unit == 'd') {
        num.pop_back();
    } else if (std::isdigit(static_cast<unsigned char>(unit))) {
        unit = 's';
    } else {
        return std::chrono::seconds(0);
    }
    long long n = 0;
    if (!parse_whole(num, n) || n < 0)
        return std::chrono::seconds(0);
    ok = true;
    switch (unit) {
    case 'm':
        return std::chrono::minutes(n);
    case 'h':
        return std::chrono::hours(n);
    case 'd':
        return std::chrono::hours(24 * n);
    default:
        return std::chrono::seconds(n);
    }
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    const std::string v = lower(value);
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
