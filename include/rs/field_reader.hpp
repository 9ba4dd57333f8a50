#pragma once
#include "column_filter.hpp"
#include "extract.hpp"
#include "function_traits.hpp"
#include "restrictions.hpp"
#include <string>
#include <string_view>
#include <type_traits>

namespace rs {
RSP_INIT_HAS_METHOD(rs_valid)
RSP_INIT_HAS_METHOD(error)

////////////////
// replace validator
////////////////

// replace restriction types with the type they operate on
// eg. no_validator_t<rs::non_negative<int>> <=> int
template <typename T, typename U = void>
struct no_validator {
    using type = T;
};

template <typename T>
struct no_validator<T, typename std::enable_if_t<has_m_rs_valid_t<T>>> {
    using type = typename member_wrapper<decltype(&T::rs_valid)>::arg_type;
};

template <typename T>
using no_validator_t = typename no_validator<T>::type;

////////////////
// field reader
////////////////

// Reads typed values out of a filtered row. A value which cannot be
// converted, or which does not satisfy its restriction, does not stop the
// reading: the failure is recorded, the fallback is returned and valid()
// turns false, so the record built from the row can be flagged.
class field_reader {
public:
    explicit field_reader(const filtered_row& row) : row_{row} {
    }

    template <typename T>
    no_validator_t<T> get(size_t i, no_validator_t<T> fallback = {}) {
        if (i >= row_.size()) {
            set_error_missing_column(std::to_string(i));
            return fallback;
        }
        return get_impl<T>(i, std::move(fallback));
    }

    template <typename T>
    no_validator_t<T> get(std::string_view column,
                          no_validator_t<T> fallback = {}) {
        auto i = row_.position_of(column);
        if (!i) {
            set_error_missing_column(column);
            return fallback;
        }
        return get_impl<T>(*i, std::move(fallback));
    }

    // same as get, but the value also has to be present in the source row
    // and must not be empty
    template <typename T>
    no_validator_t<T> require(std::string_view column,
                              no_validator_t<T> fallback = {}) {
        auto i = row_.position_of(column);
        if (!i) {
            set_error_missing_column(column);
            return fallback;
        }

        if (row_.defaulted(*i) || row_[*i].empty()) {
            set_error_required(column);
            return fallback;
        }
        return get_impl<T>(*i, std::move(fallback));
    }

    [[nodiscard]] bool valid() const {
        return failures_ == 0;
    }

    [[nodiscard]] size_t failures() const {
        return failures_;
    }

    // describes the first failure
    [[nodiscard]] const std::string& error_msg() const {
        return error_;
    }

    [[nodiscard]] const filtered_row& row() const {
        return row_;
    }

private:
    template <typename T>
    no_validator_t<T> get_impl(size_t i, no_validator_t<T> fallback) {
        const auto& raw = row_[i];

        no_validator_t<T> value;
        if (!extract(raw, value)) {
            set_error_invalid_conversion(i, raw);
            return fallback;
        }

        if constexpr (has_m_rs_valid_t<T>) {
            if (T validator; !validator.rs_valid(value)) {
                if constexpr (has_m_error_t<T>) {
                    set_error_validate(validator.error(), i, raw);
                } else {
                    set_error_validate("validation error", i, raw);
                }
                return fallback;
            }
        }

        return value;
    }

    ////////////////
    // error
    ////////////////

    std::string error_sufix(size_t i, std::string_view value) const {
        std::string error;
        error.reserve(32);
        error.append("at column \'")
            .append(row_.column(i))
            .append("\': \'")
            .append(value)
            .append("\'");
        return error;
    }

    void add_failure(std::string msg) {
        if (failures_++ == 0) {
            error_ = std::move(msg);
        }
    }

    void set_error_invalid_conversion(size_t i, std::string_view value) {
        add_failure("invalid conversion " + error_sufix(i, value));
    }

    void set_error_validate(const char* const error, size_t i,
                            std::string_view value) {
        add_failure(std::string{error} + " " + error_sufix(i, value));
    }

    void set_error_required(std::string_view column) {
        add_failure("missing required value at column \'" +
                    std::string{column} + "\'");
    }

    void set_error_missing_column(std::string_view column) {
        add_failure("column not used: \'" + std::string{column} + "\'");
    }

    ////////////////
    // members
    ////////////////

    const filtered_row& row_;
    size_t failures_{0};
    std::string error_;
};

} /* namespace rs */
