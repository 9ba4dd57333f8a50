#pragma once
#include "common.hpp"
#include "setup.hpp"
#include "source.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rs {

////////////////
// raw row
////////////////

// Fields of one row in file order. All field bytes live in one buffer, the
// fields are offsets into it. Views returned by the row are valid until the
// next row is read.
class raw_row {
public:
    raw_row() {
        data_.reserve(initial_row_capacity);
    }

    [[nodiscard]] size_t size() const {
        return fields_.size();
    }

    [[nodiscard]] bool empty() const {
        return fields_.empty();
    }

    [[nodiscard]] std::string_view operator[](size_t i) const {
        const auto& [begin, end] = fields_[i];
        return std::string_view{data_.data() + begin, end - begin};
    }

    [[nodiscard]] std::string_view at(size_t i) const {
        if (i >= fields_.size()) {
            throw std::out_of_range{"raw_row: field " + std::to_string(i) +
                                    " out of range, size: " +
                                    std::to_string(fields_.size())};
        }
        return (*this)[i];
    }

    [[nodiscard]] std::vector<std::string> to_vector() const {
        std::vector<std::string> ret;
        ret.reserve(fields_.size());
        for (size_t i = 0; i < fields_.size(); ++i) {
            ret.emplace_back((*this)[i]);
        }
        return ret;
    }

    // number of field bytes stored for the row
    [[nodiscard]] size_t byte_size() const {
        return data_.size();
    }

private:
    void clear() {
        data_.clear();
        fields_.clear();
        field_begin_ = 0;
    }

    void push_back(int c) {
        data_.push_back(static_cast<char>(c));
    }

    void close_field() {
        fields_.emplace_back(field_begin_, data_.size());
        field_begin_ = data_.size();
    }

    std::string data_;
    std::vector<std::pair<size_t, size_t>> fields_;
    size_t field_begin_{0};

    template <typename...>
    friend class tokenizer;
};

////////////////
// tokenizer
////////////////

template <typename... Options>
class tokenizer {
    using quote = typename setup<Options...>::quote;
    constexpr static bool ignore_empty = setup<Options...>::ignore_empty;

    enum class state { unquoted, quoted, quote_pending };

public:
    explicit tokenizer(char delimiter = default_delimiter)
        : delim_{static_cast<unsigned char>(delimiter)} {
    }

    [[nodiscard]] bool valid_delimiter() const {
        return !quote::match(delim_) && !is_line_terminator(delim_);
    }

    // reads one logical row from the source, returns false if the stream
    // ended before any byte of a new row was read, or if the source failed
    bool read_row(buffered_source& source) {
        while (read_row_impl(source)) {
            if constexpr (ignore_empty) {
                if (blank_) {
                    continue;
                }
            }
            ++rows_;
            return !source.failed();
        }
        return false;
    }

    [[nodiscard]] const raw_row& row() const {
        return row_;
    }

    // the last row contained a quote followed by a regular character, or
    // a quote which was never closed
    [[nodiscard]] bool malformed() const {
        return malformed_;
    }

    [[nodiscard]] size_t malformed_position() const {
        return malformed_position_;
    }

    // physical lines consumed so far
    [[nodiscard]] size_t line() const {
        return line_;
    }

    [[nodiscard]] size_t row_begin_line() const {
        return row_begin_line_;
    }

    [[nodiscard]] size_t rows() const {
        return rows_;
    }

    [[nodiscard]] size_t position() const {
        return position_;
    }

private:
    ////////////////
    // state machine
    ////////////////

    bool read_row_impl(buffered_source& source) {
        row_.clear();
        malformed_ = false;
        blank_ = false;
        row_begin_line_ = line_ + 1;

        auto st = state::unquoted;
        bool consumed_any = false;
        bool quoted_any = false;

        while (true) {
            const int c = source.consume();

            if (c == end_of_stream) {
                if (!consumed_any) {
                    return false;
                }

                // eg: ...,"hello\0 -> hello
                if (st == state::quoted) {
                    set_malformed(position_);
                }
                row_.close_field();
                ++line_;
                return true;
            }

            ++position_;
            consumed_any = true;

            switch (st) {
            case state::unquoted:
                if (c == delim_) {
                    row_.close_field();
                } else if (quote::match(c)) {
                    quoted_any = true;
                    st = state::quoted;
                } else if (is_line_terminator(c)) {
                    blank_ = row_.empty() && row_.byte_size() == 0 &&
                             !quoted_any;
                    end_line(source, c);
                    row_.close_field();
                    return true;
                } else {
                    row_.push_back(c);
                }
                break;

            case state::quoted:
                if (quote::match(c)) {
                    st = state::quote_pending;
                } else {
                    if (c == '\n' || (c == '\r' && source.peek() != '\n')) {
                        ++line_;
                    }
                    row_.push_back(c);
                }
                break;

            case state::quote_pending:
                if (quote::match(c)) {
                    // eg: ...,"hel""lo",... -> hel"lo
                    row_.push_back(c);
                    st = state::quoted;
                } else if (c == delim_) {
                    row_.close_field();
                    st = state::unquoted;
                } else if (is_line_terminator(c)) {
                    end_line(source, c);
                    row_.close_field();
                    return true;
                } else {
                    // eg: ...,"hel"lo,... -> hel, lo
                    set_malformed(position_ - 1);
                    row_.close_field();
                    row_.push_back(c);
                    st = state::unquoted;
                }
                break;
            }
        }
    }

    void end_line(buffered_source& source, int c) {
        if (c == '\r' && source.peek() == '\n') {
            source.consume();
            ++position_;
        }
        ++line_;
    }

    void set_malformed(size_t position) {
        if (!malformed_) {
            malformed_ = true;
            malformed_position_ = position;
        }
    }

    ////////////////
    // members
    ////////////////

    int delim_;
    raw_row row_;

    bool malformed_{false};
    bool blank_{false};
    size_t malformed_position_{0};

    size_t line_{0};
    size_t row_begin_line_{0};
    size_t rows_{0};
    size_t position_{0};
};

} /* namespace rs */
