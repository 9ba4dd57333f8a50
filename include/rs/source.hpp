#pragma once
#include "common.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <sys/types.h>
#include <utility>

#include <spdlog/spdlog.h>

namespace rs {

////////////////
// buffered source
////////////////

// Byte source over a FILE* or a memory block. The buffer has a fixed size,
// bytes are handed out one at a time and the buffer is refilled only once
// all of them were consumed.
class buffered_source {
public:
    explicit buffered_source(const std::string& file_name,
                             size_t chunk_size = default_chunk_size)
        : file_{std::fopen(file_name.c_str(), "rb")}, owns_file_{true},
          chunk_size_{chunk_size} {
        if (!file_) {
            last_errno_ = errno;
            SPDLOG_ERROR("{} could not be opened", file_name);
            return;
        }
        allocate();
    }

    // reads from a stream owned by the caller, the stream is not closed
    explicit buffered_source(FILE* file,
                             size_t chunk_size = default_chunk_size)
        : file_{file}, owns_file_{false}, chunk_size_{chunk_size} {
        if (file_) {
            allocate();
        }
    }

    // reads directly from a memory block owned by the caller, a null block
    // of size zero is an empty stream
    buffered_source(const char* const data, size_t size)
        : view_{data}, in_memory_{data != nullptr || size == 0},
          filled_{data ? size : 0}, bytes_read_{filled_}, eof_{true} {
    }

    buffered_source(buffered_source&& other) noexcept
        : file_{other.file_}, owns_file_{other.owns_file_},
          chunk_size_{other.chunk_size_}, buff_{other.buff_},
          view_{other.view_}, in_memory_{other.in_memory_},
          curr_{other.curr_}, filled_{other.filled_},
          bytes_read_{other.bytes_read_}, last_errno_{other.last_errno_},
          eof_{other.eof_}, failed_{other.failed_} {
        other.file_ = nullptr;
        other.buff_ = nullptr;
        other.view_ = nullptr;
        other.in_memory_ = false;
    }

    buffered_source& operator=(buffered_source&& other) noexcept {
        if (this != &other) {
            release();

            file_ = other.file_;
            owns_file_ = other.owns_file_;
            chunk_size_ = other.chunk_size_;
            buff_ = other.buff_;
            view_ = other.view_;
            in_memory_ = other.in_memory_;
            curr_ = other.curr_;
            filled_ = other.filled_;
            bytes_read_ = other.bytes_read_;
            last_errno_ = other.last_errno_;
            eof_ = other.eof_;
            failed_ = other.failed_;

            other.file_ = nullptr;
            other.buff_ = nullptr;
            other.view_ = nullptr;
            other.in_memory_ = false;
        }
        return *this;
    }

    buffered_source(const buffered_source& other) = delete;
    buffered_source& operator=(const buffered_source& other) = delete;

    ~buffered_source() {
        release();
    }

    [[nodiscard]] bool is_open() const {
        return file_ != nullptr || in_memory_;
    }

    [[nodiscard]] bool failed() const {
        return failed_;
    }

    [[nodiscard]] int last_errno() const {
        return last_errno_;
    }

    [[nodiscard]] size_t bytes_read() const {
        return bytes_read_;
    }

    [[nodiscard]] size_t chunk_size() const {
        return chunk_size_;
    }

    [[nodiscard]] bool exhausted() const {
        return curr_ == filled_ && (eof_ || failed_ || !is_open());
    }

    // replaces the buffer contents with the next chunk of the stream,
    // returns the number of bytes read, 0 on end of stream and -1 if the
    // stream could not be read
    ssize_t refill() {
        if (failed_) {
            return -1;
        }

        if (eof_ || !file_) {
            return 0;
        }

        curr_ = 0;
        filled_ = std::fread(buff_, 1, chunk_size_, file_);
        bytes_read_ += filled_;

        if (filled_ < chunk_size_) {
            if (std::ferror(file_)) {
                handle_error_read();
                return -1;
            }
            eof_ = true;
        }

        return static_cast<ssize_t>(filled_);
    }

    [[nodiscard]] int peek() {
        if (curr_ == filled_ && !refill_until_data()) {
            return end_of_stream;
        }
        return static_cast<unsigned char>(data()[curr_]);
    }

    int consume() {
        if (curr_ == filled_ && !refill_until_data()) {
            return end_of_stream;
        }
        return static_cast<unsigned char>(data()[curr_++]);
    }

private:
    void allocate() {
        if (chunk_size_ == 0) {
            chunk_size_ = default_chunk_size;
        }
        buff_ = static_cast<char*>(strict_realloc(nullptr, chunk_size_));
    }

    void release() {
        std::free(buff_);
        buff_ = nullptr;

        if (file_ && owns_file_) {
            std::fclose(file_);
        }
        file_ = nullptr;
    }

    [[nodiscard]] const char* data() const {
        return view_ ? view_ : buff_;
    }

    // a read may return zero bytes without reaching the end of the stream
    bool refill_until_data() {
        while (true) {
            auto n = refill();
            if (n > 0) {
                return true;
            }
            if (n == -1 || eof_) {
                return false;
            }
        }
    }

    void handle_error_read() {
        last_errno_ = errno;
        failed_ = true;
        filled_ = 0;
        curr_ = 0;
        SPDLOG_ERROR("read failure after {} bytes, errno: {}", bytes_read_,
                     last_errno_);
    }

    ////////////////
    // members
    ////////////////

    FILE* file_{nullptr};
    bool owns_file_{false};
    size_t chunk_size_{default_chunk_size};

    char* buff_{nullptr};
    const char* view_{nullptr};
    bool in_memory_{false};
    size_t curr_{0};
    size_t filled_{0};

    size_t bytes_read_{0};
    int last_errno_{0};
    bool eof_{false};
    bool failed_{false};
};

} /* namespace rs */
