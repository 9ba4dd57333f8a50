#pragma once
#include <exception>
#include <string>

namespace rs {

////////////////
// error code
////////////////

enum class error_code {
    none,
    file_not_open,
    io,
    empty_stream,
    malformed_quoting,
    duplicate_header,
    invalid_delimiter,
    empty_used_columns,
    duplicate_used_column
};

[[nodiscard]] inline const char* to_string(error_code code) {
    switch (code) {
    case error_code::none:
        return "none";
    case error_code::file_not_open:
        return "file not open";
    case error_code::io:
        return "read failure";
    case error_code::empty_stream:
        return "empty stream";
    case error_code::malformed_quoting:
        return "malformed quoting";
    case error_code::duplicate_header:
        return "duplicate header";
    case error_code::invalid_delimiter:
        return "invalid delimiter";
    case error_code::empty_used_columns:
        return "empty used columns";
    case error_code::duplicate_used_column:
        return "duplicate used column";
    }
    return "unknown";
}

////////////////
// exception
////////////////

class exception : public std::exception {
    std::string msg_;
    error_code code_;

public:
    exception(std::string msg, error_code code = error_code::none)
        : msg_{std::move(msg)}, code_{code} {
    }

    [[nodiscard]] char const* what() const noexcept override {
        return msg_.c_str();
    }

    [[nodiscard]] error_code code() const noexcept {
        return code_;
    }
};

// the stream could not be opened or read
class io_error : public exception {
public:
    io_error(std::string msg, error_code code = error_code::io)
        : exception{std::move(msg), code} {
    }
};

class empty_stream_error : public exception {
public:
    empty_stream_error(std::string msg)
        : exception{std::move(msg), error_code::empty_stream} {
    }
};

class malformed_quoting_error : public exception {
public:
    malformed_quoting_error(std::string msg)
        : exception{std::move(msg), error_code::malformed_quoting} {
    }
};

[[noreturn]] inline void throw_error(std::string msg, error_code code) {
    switch (code) {
    case error_code::file_not_open:
    case error_code::io:
        throw io_error{std::move(msg), code};
    case error_code::empty_stream:
        throw empty_stream_error{std::move(msg)};
    case error_code::malformed_quoting:
        throw malformed_quoting_error{std::move(msg)};
    default:
        throw exception{std::move(msg), code};
    }
}

} /* namespace rs */
