#pragma once

#include "type_traits.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#ifndef RSP_DISABLE_FAST_FLOAT
#include <fast_float/fast_float.h>
#else
#include <cstdlib>
#endif

// Conversion of field values into the types records are made of: counts
// and identifiers (integers), amounts and coordinates (floating point),
// text (std::string) and values a row may leave out (std::optional).

namespace rs {

template <typename T>
constexpr bool is_count_v = std::is_integral_v<T> &&
                            !std::is_same_v<T, bool> &&
                            !std::is_same_v<T, char>;

template <typename T>
constexpr bool is_amount_v =
    std::is_same_v<T, float> || std::is_same_v<T, double>;

////////////////
// numbers
////////////////

// the whole value has to be a number, no surrounding blanks, no sign other
// than a leading '-', eg. "1204", "-75.16", "3e5"
template <typename T>
[[nodiscard]] std::optional<T> to_num(std::string_view s) {
    static_assert(is_count_v<T> || is_amount_v<T>,
                  "to_num converts to integers, float and double only");

    const auto* const begin = s.data();
    const auto* const end = s.data() + s.size();
    if (begin == end) {
        return std::nullopt;
    }

    T value{};
    if constexpr (is_count_v<T>) {
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
    } else {
#ifndef RSP_DISABLE_FAST_FLOAT
        auto [ptr, ec] = fast_float::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
#else
        // strtod skips leading blanks and needs a terminated string
        if (*begin == ' ' || *begin == '\t' || *begin == '+') {
            return std::nullopt;
        }

        std::string terminated{s};
        char* parse_end = nullptr;
        if constexpr (std::is_same_v<T, float>) {
            value = std::strtof(terminated.c_str(), &parse_end);
        } else {
            value = std::strtod(terminated.c_str(), &parse_end);
        }

        if (parse_end != terminated.c_str() + terminated.size()) {
            return std::nullopt;
        }
#endif
    }
    return value;
}

////////////////
// extract
////////////////

namespace error {
template <typename T>
struct unsupported_type {
    constexpr static bool value = false;
};
} /* namespace error */

// Converts s into value. An optional target never fails: an empty or
// unconvertible value leaves it empty.
template <typename T>
[[nodiscard]] bool extract(std::string_view s, T& value) {
    if constexpr (is_instance_of_v<std::optional, T>) {
        typename T::value_type present{};
        if (!s.empty() && extract(s, present)) {
            value = std::move(present);
        } else {
            value.reset();
        }
        return true;
    } else if constexpr (std::is_same_v<T, std::string>) {
        value.assign(s);
        return true;
    } else if constexpr (is_count_v<T> || is_amount_v<T>) {
        auto number = to_num<T>(s);
        if (!number) {
            return false;
        }
        value = *number;
        return true;
    } else {
        static_assert(error::unsupported_type<T>::value,
                      "values can be read as integers, float, double, "
                      "std::string or std::optional of those");
        return false;
    }
}

} /* namespace rs */
