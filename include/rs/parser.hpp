#pragma once
#include "column_filter.hpp"
#include "common.hpp"
#include "exception.hpp"
#include "function_traits.hpp"
#include "header.hpp"
#include "setup.hpp"
#include "source.hpp"
#include "tokenizer.hpp"
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace rs {
RSP_INIT_HAS_METHOD(used_columns)
RSP_INIT_HAS_METHOD(build_record)
RSP_INIT_HAS_METHOD(default_value)

template <typename Reader>
using record_t = std::decay_t<decltype(std::declval<const Reader&>().build_record(
    std::declval<const filtered_row&>()))>;

// Reads records out of a delimited text stream. The first row is the
// header, every following row is projected onto the columns the reader
// uses and handed to the reader to build a record:
//
//   rs::parser<rs::population_reader> p{"population.csv"};
//   for (const auto& entry : p.records()) { ... }
template <typename Reader, typename... Options>
class parser {
    static_assert(has_m_used_columns_t<Reader>,
                  "reader needs to define a 'used_columns' method");
    static_assert(has_m_build_record_t<Reader>,
                  "reader needs to define a 'build_record' method");

    constexpr static auto string_error = setup<Options...>::string_error;
    constexpr static auto throw_on_error = setup<Options...>::throw_on_error;
    constexpr static auto strict_quotes = setup<Options...>::strict_quotes;
    constexpr static auto unique_header = setup<Options...>::unique_header;
    constexpr static auto chunk_size = setup<Options...>::chunk_size;

public:
    using record_type = record_t<Reader>;

    parser(const std::string& file_name, Reader reader = {},
           char delimiter = default_delimiter)
        : source_name_{file_name}, source_{file_name, chunk_size},
          tokenizer_{delimiter}, reader_{std::move(reader)} {
        start();
    }

    // reads from a stream owned by the caller
    parser(FILE* file, Reader reader = {}, char delimiter = default_delimiter)
        : source_name_{"<stream>"}, source_{file, chunk_size},
          tokenizer_{delimiter}, reader_{std::move(reader)} {
        start();
    }

    // reads from a memory block owned by the caller, the block has to
    // outlive the parser
    parser(const char* const data, size_t size, Reader reader = {},
           char delimiter = default_delimiter)
        : source_name_{"<buffer>"}, source_{data, size},
          tokenizer_{delimiter}, reader_{std::move(reader)} {
        start();
    }

    parser(parser&& other) = default;
    parser& operator=(parser&& other) = default;

    parser() = delete;
    parser(const parser& other) = delete;
    parser& operator=(const parser& other) = delete;

    [[nodiscard]] bool valid() const {
        return error_ == error_code::none;
    }

    [[nodiscard]] error_code error() const {
        return error_;
    }

    [[nodiscard]] const std::string& error_msg() const {
        assert_string_error_defined<string_error>();
        return error_msg_;
    }

    [[nodiscard]] bool eof() const {
        return eof_;
    }

    // returns the record built from the next row, or nullopt once the
    // stream ended or a fatal error occurred
    std::optional<record_type> parse_next() {
        if (eof_) {
            return std::nullopt;
        }

        if (!tokenizer_.read_row(source_)) {
            if (source_.failed()) {
                handle_error_read();
            } else {
                eof_ = true;
                SPDLOG_DEBUG("{}: end of stream, {} rows read", source_name_,
                             rows_);
            }
            return std::nullopt;
        }

        if (tokenizer_.malformed() && !handle_malformed_row()) {
            return std::nullopt;
        }

        filter_.apply(tokenizer_.row(), row_);
        ++rows_;
        return reader_.build_record(row_);
    }

    [[nodiscard]] const header_index& header() const {
        return header_;
    }

    [[nodiscard]] bool field_exists(std::string_view field) const {
        return header_.contains(field);
    }

    [[nodiscard]] const std::vector<std::string>& used_columns() const {
        return filter_.used_columns();
    }

    // physical lines consumed so far, header included
    [[nodiscard]] size_t line() const {
        return tokenizer_.line();
    }

    // data rows read so far
    [[nodiscard]] size_t rows() const {
        return rows_;
    }

    [[nodiscard]] const Reader& reader() const {
        return reader_;
    }

    ////////////////
    // iterator
    ////////////////

    struct iterable {
        struct iterator {
            using value = record_type;

            iterator() : parser_{nullptr}, value_{} {
            }

            iterator(parser<Reader, Options...>* parser)
                : parser_{parser}, value_{} {
            }

            iterator(const iterator& other) = default;
            iterator(iterator&& other) = default;

            value& operator*() {
                return value_;
            }

            value* operator->() {
                return &value_;
            }

            iterator& operator++() {
                if (!parser_) {
                    return *this;
                }

                auto next = parser_->parse_next();
                if (!next) {
                    parser_ = nullptr;
                } else {
                    value_ = std::move(*next);
                }
                return *this;
            }

            iterator& operator++(int) {
                return ++*this;
            }

            friend bool operator==(const iterator& lhs, const iterator& rhs) {
                return lhs.parser_ == rhs.parser_;
            }

            friend bool operator!=(const iterator& lhs, const iterator& rhs) {
                return !(lhs == rhs);
            }

        private:
            parser<Reader, Options...>* parser_;
            value value_;
        };

        iterable(parser<Reader, Options...>* parser) : parser_{parser} {
        }

        iterator begin() {
            return ++iterator{parser_};
        }

        iterator end() {
            return iterator{};
        }

    private:
        parser<Reader, Options...>* parser_;
    };

    // lazy single pass range over the remaining records
    auto records() {
        return iterable{this};
    }

private:
    ////////////////
    // session start
    ////////////////

    void start() {
        if (!source_.is_open()) {
            handle_error_file_not_open();
            return;
        }

        if (!tokenizer_.valid_delimiter()) {
            handle_error_invalid_delimiter();
            return;
        }

        auto used = reader_.used_columns();
        if (used.empty()) {
            handle_error_empty_used_columns();
            return;
        }

        if (auto duplicate = first_duplicate(used)) {
            handle_error_duplicate_used_column(*duplicate);
            return;
        }

        if (!tokenizer_.read_row(source_)) {
            if (source_.failed()) {
                handle_error_read();
            } else {
                handle_error_empty_stream();
            }
            return;
        }

        if (tokenizer_.malformed() && !handle_malformed_row()) {
            return;
        }

        header_ = header_index{tokenizer_.row()};

        if constexpr (unique_header) {
            if (!header_.duplicates().empty()) {
                handle_error_duplicate_header(header_.duplicates().front());
                return;
            }
        }

        auto defaults = default_values(used);
        filter_ = column_filter{std::move(used), header_, std::move(defaults)};

        SPDLOG_DEBUG("{}: header with {} columns, {} used, {} duplicates",
                     source_name_, header_.size(), filter_.size(),
                     header_.duplicates().size());
    }

    std::vector<std::string> default_values(
        const std::vector<std::string>& used) const {
        std::vector<std::string> values;
        if constexpr (has_m_default_value_t<Reader>) {
            values.reserve(used.size());
            for (const auto& column : used) {
                values.emplace_back(reader_.default_value(column));
            }
        }
        return values;
    }

    bool handle_malformed_row() {
        if constexpr (strict_quotes) {
            handle_error_malformed_quoting();
            return false;
        } else {
            SPDLOG_DEBUG("{} {}: malformed quoting at byte {}", source_name_,
                         tokenizer_.row_begin_line(),
                         tokenizer_.malformed_position());
            return true;
        }
    }

    ////////////////
    // error
    ////////////////

    std::string error_prefix() const {
        return source_name_ + " " + std::to_string(tokenizer_.row_begin_line()) +
               ": ";
    }

    void set_error(error_code code, std::string msg) {
        error_ = code;
        eof_ = true;
        SPDLOG_ERROR("{}", msg);

        if constexpr (string_error) {
            error_msg_ = std::move(msg);
        } else if constexpr (throw_on_error) {
            throw_error(std::move(msg), code);
        }
    }

    void handle_error_file_not_open() {
        set_error(error_code::file_not_open,
                  source_name_ + " could not be opened");
    }

    void handle_error_read() {
        set_error(error_code::io, error_prefix() + "read failure, errno: " +
                                      std::to_string(source_.last_errno()));
    }

    void handle_error_empty_stream() {
        set_error(error_code::empty_stream,
                  source_name_ + ": stream contains no header row");
    }

    void handle_error_invalid_delimiter() {
        set_error(error_code::invalid_delimiter,
                  source_name_ +
                      ": delimiter cannot be a quote or a line terminator");
    }

    void handle_error_empty_used_columns() {
        set_error(error_code::empty_used_columns,
                  source_name_ + ": reader uses no columns");
    }

    void handle_error_duplicate_used_column(const std::string& column) {
        set_error(error_code::duplicate_used_column,
                  source_name_ + ": column used multiple times: " + column);
    }

    void handle_error_duplicate_header(const std::string& column) {
        set_error(error_code::duplicate_header,
                  error_prefix() + "header contains duplicates: " + column);
    }

    void handle_error_malformed_quoting() {
        set_error(error_code::malformed_quoting,
                  error_prefix() + "malformed quoting at byte " +
                      std::to_string(tokenizer_.malformed_position()));
    }

    ////////////////
    // members
    ////////////////

    std::string source_name_;
    buffered_source source_;
    tokenizer<Options...> tokenizer_;
    Reader reader_;

    header_index header_;
    column_filter filter_;
    filtered_row row_;

    error_code error_{error_code::none};
    std::string error_msg_;
    bool eof_{false};
    size_t rows_{0};
};

} /* namespace rs */
