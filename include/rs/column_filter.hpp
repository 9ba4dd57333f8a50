#pragma once
#include "header.hpp"
#include "tokenizer.hpp"
#include <algorithm>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rs {

////////////////
// filtered row
////////////////

// Values of the used columns of one row, in the order the columns were
// requested. The values are overwritten when the next row is filtered into
// it, the column names are shared with the filter and stay valid.
class filtered_row {
public:
    [[nodiscard]] size_t size() const {
        return values_.size();
    }

    [[nodiscard]] const std::string& operator[](size_t i) const {
        return values_[i];
    }

    [[nodiscard]] const std::string& at(size_t i) const {
        if (i >= values_.size()) {
            throw std::out_of_range{"filtered_row: value " +
                                    std::to_string(i) + " out of range"};
        }
        return values_[i];
    }

    [[nodiscard]] const std::string& at(std::string_view column) const {
        auto i = position_of(column);
        if (!i) {
            throw std::out_of_range{"filtered_row: column not used: " +
                                    std::string{column}};
        }
        return values_[*i];
    }

    // position of a used column within the row
    [[nodiscard]] std::optional<size_t> position_of(
        std::string_view column) const {
        if (!columns_) {
            return std::nullopt;
        }

        auto it = std::find(columns_->begin(), columns_->end(), column);
        if (it == columns_->end()) {
            return std::nullopt;
        }
        return static_cast<size_t>(std::distance(columns_->begin(), it));
    }

    // the value was not present in the source row
    [[nodiscard]] bool defaulted(size_t i) const {
        return defaulted_.at(i);
    }

    [[nodiscard]] const std::string& column(size_t i) const {
        if (!columns_) {
            throw std::out_of_range{"filtered_row: no columns"};
        }
        return columns_->at(i);
    }

    [[nodiscard]] const std::vector<std::string>& values() const {
        return values_;
    }

private:
    std::shared_ptr<const std::vector<std::string>> columns_;
    std::vector<std::string> values_;
    std::vector<bool> defaulted_;

    friend class column_filter;
};

////////////////
// column filter
////////////////

[[nodiscard]] inline std::optional<std::string> first_duplicate(
    const std::vector<std::string>& columns) {
    for (auto it = columns.begin(); it != columns.end(); ++it) {
        if (std::find(std::next(it), columns.end(), *it) != columns.end()) {
            return *it;
        }
    }
    return std::nullopt;
}

// Projects raw rows onto the used columns. Header positions are resolved
// once, columns missing from the header or from a short row take the
// default value given for them.
class column_filter {
public:
    column_filter() = default;

    column_filter(std::vector<std::string> used_columns,
                  const header_index& header,
                  std::vector<std::string> default_values = {})
        : used_{std::make_shared<const std::vector<std::string>>(
              std::move(used_columns))},
          defaults_{std::move(default_values)} {
        defaults_.resize(used_->size());
        positions_.reserve(used_->size());
        for (const auto& column : *used_) {
            positions_.push_back(header.position_of(column));
        }
    }

    void apply(const raw_row& row, filtered_row& out) const {
        if (out.columns_ != used_) {
            out.columns_ = used_;
        }
        out.values_.resize(size());
        out.defaulted_.resize(size());

        for (size_t i = 0; i < size(); ++i) {
            const auto& position = positions_[i];
            if (position && *position < row.size()) {
                out.values_[i].assign(row[*position]);
                out.defaulted_[i] = false;
            } else {
                out.values_[i].assign(defaults_[i]);
                out.defaulted_[i] = true;
            }
        }
    }

    [[nodiscard]] filtered_row apply(const raw_row& row) const {
        filtered_row out;
        apply(row, out);
        return out;
    }

    [[nodiscard]] size_t size() const {
        return used_ ? used_->size() : 0;
    }

    [[nodiscard]] const std::vector<std::string>& used_columns() const {
        static const std::vector<std::string> none;
        return used_ ? *used_ : none;
    }

    // position of the i-th used column within the header
    [[nodiscard]] std::optional<size_t> header_position(size_t i) const {
        return positions_.at(i);
    }

    [[nodiscard]] const std::string& default_value(size_t i) const {
        return defaults_.at(i);
    }

private:
    std::shared_ptr<const std::vector<std::string>> used_;
    std::vector<std::string> defaults_;
    std::vector<std::optional<size_t>> positions_;
};

} /* namespace rs */
