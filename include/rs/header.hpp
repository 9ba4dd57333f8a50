#pragma once
#include "tokenizer.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rs {

////////////////
// header index
////////////////

// Maps column names of the header row to their positions. When a name
// appears multiple times the last occurrence wins, the repeated names are
// kept in duplicates().
class header_index {
public:
    header_index() = default;

    explicit header_index(const raw_row& row) {
        names_.reserve(row.size());
        positions_.reserve(row.size());

        for (size_t i = 0; i < row.size(); ++i) {
            std::string name{row[i]};
            auto [it, inserted] = positions_.try_emplace(name, i);
            if (!inserted) {
                it->second = i;
                if (std::find(duplicates_.begin(), duplicates_.end(), name) ==
                    duplicates_.end()) {
                    duplicates_.push_back(name);
                }
            }
            names_.push_back(std::move(name));
        }
    }

    [[nodiscard]] std::optional<size_t> position_of(
        std::string_view name) const {
        auto it = positions_.find(std::string{name});
        if (it == positions_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool contains(std::string_view name) const {
        return position_of(name).has_value();
    }

    // number of columns of the header row
    [[nodiscard]] size_t size() const {
        return names_.size();
    }

    [[nodiscard]] bool empty() const {
        return names_.empty();
    }

    [[nodiscard]] const std::vector<std::string>& names() const {
        return names_;
    }

    [[nodiscard]] const std::vector<std::string>& duplicates() const {
        return duplicates_;
    }

private:
    std::vector<std::string> names_;
    std::vector<std::string> duplicates_;
    std::unordered_map<std::string, size_t> positions_;
};

} /* namespace rs */
