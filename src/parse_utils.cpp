#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static bool all_digits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

static bool to_ull(const std::string& value, unsigned long long& out) {
    if (!all_digits(value))
        return false;
    try {
        out = std::stoull(value);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!to_ull(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<unsigned int>(v);
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!to_ull(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<size_t>(v);
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (value.empty())
        return 0;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // "kb" and "k" are the same unit; a bare "b" is handled below.
    if (val.size() > 1 && val.back() == 'b' &&
        !std::isdigit(static_cast<unsigned char>(val[val.size() - 2])))
        val.pop_back();
    unsigned long long mult = 1;
    switch (val.empty() ? '\0' : val.back()) {
    case 'k':
        mult = 1024ull;
        break;
    case 'm':
        mult = 1024ull * 1024;
        break;
    case 'g':
        mult = 1024ull * 1024 * 1024;
        break;
    case 'b':
        break;
    default:
        mult = 0;
        break;
    }
    if (mult != 0)
        val.pop_back();
    else
        mult = 1;
    unsigned long long base = 0;
    if (!to_ull(val, base))
        return 0;
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}
