#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace rs {

constexpr inline size_t zip_code_length = 5;

// reduces a zip code to its first five characters, eg. both
// "19104-1234" and "191041234" give "19104", nullopt unless all
// five of them are digits
[[nodiscard]] inline std::optional<std::string> normalize_zip(
    std::string_view zip) {
    if (zip.size() < zip_code_length) {
        return std::nullopt;
    }

    auto code = zip.substr(0, zip_code_length);
    if (!std::all_of(code.begin(), code.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        })) {
        return std::nullopt;
    }
    return std::string{code};
}

// restriction accepting values normalize_zip can reduce
struct zip_code {
    [[nodiscard]] bool rs_valid(const std::string& value) const {
        return normalize_zip(value).has_value();
    }

    [[nodiscard]] const char* error() const {
        return "invalid zip code";
    }
};

} /* namespace rs */
