#pragma once
#include "../column_filter.hpp"
#include "../field_reader.hpp"
#include "zip_code.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace rs {

struct service_request {
    std::string id;
    std::string service_name;
    std::string status;
    std::string zip_code;
    std::string requested_datetime;
    std::optional<double> lat;
    std::optional<double> lon;
    bool valid{false};
};

class service_request_reader {
public:
    [[nodiscard]] std::vector<std::string> used_columns() const {
        return {"service_request_id", "service_name", "status",  "zipcode",
                "requested_datetime", "lat",          "lon"};
    }

    [[nodiscard]] std::string default_value(std::string_view column) const {
        if (column == "status") {
            return "unknown";
        }
        return "";
    }

    [[nodiscard]] service_request build_record(const filtered_row& row) const {
        field_reader fields{row};

        service_request request;
        request.id = fields.require<std::string>("service_request_id");
        request.service_name = fields.require<std::string>("service_name");
        request.status = fields.get<std::string>("status");
        request.zip_code =
            normalize_zip(fields.require<rs::zip_code>("zipcode")).value_or("");
        request.requested_datetime =
            fields.get<std::string>("requested_datetime");

        // coordinates are often left out, a missing one is not an error
        request.lat = fields.get<std::optional<double>>("lat");
        request.lon = fields.get<std::optional<double>>("lon");
        request.valid = fields.valid();

        if (!request.valid) {
            SPDLOG_DEBUG("invalid service request: {}", fields.error_msg());
        }
        return request;
    }
};

} /* namespace rs */
