#pragma once
#include "../column_filter.hpp"
#include "../field_reader.hpp"
#include "../restrictions.hpp"
#include "zip_code.hpp"
#include <cstdint>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace rs {

struct population_entry {
    std::string zip_code;
    int64_t population{0};
    bool valid{false};
};

class population_reader {
public:
    [[nodiscard]] std::vector<std::string> used_columns() const {
        return {"zip_code", "population"};
    }

    [[nodiscard]] population_entry build_record(const filtered_row& row) const {
        field_reader fields{row};

        population_entry entry;
        entry.zip_code = normalize_zip(fields.require<rs::zip_code>("zip_code"))
                             .value_or("");
        entry.population =
            fields.require<rs::non_negative<int64_t>>("population");
        entry.valid = fields.valid();

        if (!entry.valid) {
            SPDLOG_DEBUG("invalid population entry: {}", fields.error_msg());
        }
        return entry;
    }
};

} /* namespace rs */
