#pragma once

#include <cstddef>
#include <string_view>

// Leading number of a line, kept as decimal digit strings so that values of
// any length compare exactly.
struct NumericKey {
    bool present = false;
    bool negative = false;
    std::string_view integral; // no leading zeros
    std::string_view fraction; // no trailing zeros
};

namespace detail {

constexpr bool is_blank(const char c) {
    return c == ' ' || c == '\t';
}

constexpr bool is_digit(const char c) {
    return c >= '0' && c <= '9';
}

inline int compare_magnitude(const NumericKey& a, const NumericKey& b) {
    if (a.integral.size() != b.integral.size()) {
        return a.integral.size() < b.integral.size() ? -1 : 1;
    }
    if (const int cmp = a.integral.compare(b.integral); cmp != 0) {
        return cmp < 0 ? -1 : 1;
    }
    if (const int cmp = a.fraction.compare(b.fraction); cmp != 0) {
        return cmp < 0 ? -1 : 1;
    }
    return 0;
}

} // namespace detail

inline NumericKey parse_numeric_key(const std::string_view line) {
    NumericKey key;

    std::size_t pos = 0;
    while (pos < line.size() && detail::is_blank(line[pos])) {
        ++pos;
    }

    if (pos < line.size() && line[pos] == '-') {
        key.negative = true;
        ++pos;
    }

    const std::size_t intStart = pos;
    while (pos < line.size() && detail::is_digit(line[pos])) {
        ++pos;
    }
    std::string_view integral = line.substr(intStart, pos - intStart);

    std::string_view fraction;
    if (pos < line.size() && line[pos] == '.') {
        const std::size_t fracStart = ++pos;
        while (pos < line.size() && detail::is_digit(line[pos])) {
            ++pos;
        }
        fraction = line.substr(fracStart, pos - fracStart);
    }

    if (integral.empty() && fraction.empty()) {
        return {};
    }

    while (!integral.empty() && integral.front() == '0') {
        integral.remove_prefix(1);
    }
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.remove_suffix(1);
    }

    key.present = true;
    key.integral = integral;
    key.fraction = fraction;
    if (integral.empty() && fraction.empty()) {
        key.negative = false; // -0 == 0
    }
    return key;
}

// Absent keys sort before every number.
inline int compare(const NumericKey& a, const NumericKey& b) {
    if (a.present != b.present) {
        return a.present ? 1 : -1;
    }
    if (!a.present) {
        return 0;
    }
    if (a.negative != b.negative) {
        return a.negative ? -1 : 1;
    }
    const int cmp = detail::compare_magnitude(a, b);
    return a.negative ? -cmp : cmp;
}

inline bool operator<(const NumericKey& a, const NumericKey& b) {
    return compare(a, b) < 0;
}
