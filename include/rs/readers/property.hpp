#pragma once
#include "../column_filter.hpp"
#include "../field_reader.hpp"
#include "../restrictions.hpp"
#include "zip_code.hpp"
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace rs {

struct property_entry {
    std::string zip_code;
    double market_value{0};
    double total_livable_area{0};
    bool valid{false};
};

class property_reader {
public:
    [[nodiscard]] std::vector<std::string> used_columns() const {
        return {"zip_code", "market_value", "total_livable_area"};
    }

    [[nodiscard]] property_entry build_record(const filtered_row& row) const {
        field_reader fields{row};

        property_entry entry;
        entry.zip_code = normalize_zip(fields.require<rs::zip_code>("zip_code"))
                             .value_or("");
        entry.market_value =
            fields.require<rs::non_negative<double>>("market_value");
        entry.total_livable_area =
            fields.require<rs::non_negative<double>>("total_livable_area");
        entry.valid = fields.valid();

        if (!entry.valid) {
            SPDLOG_DEBUG("invalid property entry: {}", fields.error_msg());
        }
        return entry;
    }
};

} /* namespace rs */
