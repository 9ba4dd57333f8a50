#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <new>
#include <string>

namespace rs {

constexpr inline char default_delimiter = ',';
constexpr inline size_t default_chunk_size = 16 * 1024;
constexpr inline size_t initial_row_capacity = 128;

// returned by peek/consume when no more bytes can be read
constexpr inline int end_of_stream = -1;

template <bool StringError>
void assert_string_error_defined() {
    static_assert(StringError,
                  "'string_error' needs to be enabled to use 'error_msg'");
}

[[nodiscard]] inline void* strict_realloc(void* ptr, size_t size) {
    ptr = std::realloc(ptr, size);
    if (!ptr) {
        throw std::bad_alloc{};
    }

    return ptr;
}

[[nodiscard]] inline bool is_line_terminator(int c) {
    return c == '\n' || c == '\r';
}

} /* namespace rs */
