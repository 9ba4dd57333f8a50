#pragma once
#include <cmath>
#include <type_traits>

// Value restrictions used by rs::field_reader, eg.
//   fields.require<rs::non_negative<int64_t>>("population")
// reads an integer and marks the record invalid when it is below zero.
// A restriction is any default constructible type with an rs_valid method,
// an error method is optional.

namespace rs {

////////////////
// non negative
////////////////

// counts, areas and amounts, floating point values also have to be finite
template <typename T>
struct non_negative {
    static_assert(std::is_arithmetic_v<T>,
                  "non_negative restricts numeric values only");

    [[nodiscard]] bool rs_valid(const T& value) const {
        if constexpr (std::is_floating_point_v<T>) {
            if (!std::isfinite(value)) {
                return false;
            }
        }
        return value >= T{0};
    }

    [[nodiscard]] const char* error() const {
        return "negative or non finite value";
    }
};

} /* namespace rs */
