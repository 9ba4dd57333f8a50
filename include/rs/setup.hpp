#pragma once
#include "common.hpp"
#include "type_traits.hpp"

namespace rs {

////////////////
// quote
////////////////

template <char C>
struct quote {
    static_assert(C != '\0', "string terminator cannot be used as a quote");
    static_assert(C != '\n' && C != '\r',
                  "line terminator cannot be used as a quote");

    constexpr static char value = C;

    [[nodiscard]] static bool match(int c) {
        return c == static_cast<unsigned char>(C);
    }
};

template <typename T>
struct is_quote : std::false_type {};

template <char C>
struct is_quote<quote<C>> : std::true_type {};

////////////////
// chunk size
////////////////

template <size_t N>
struct chunk_size {
    static_assert(N > 0, "chunk size needs to be greater than zero");
    constexpr static size_t value = N;
};

template <typename T>
struct is_chunk_size : std::false_type {};

template <size_t N>
struct is_chunk_size<chunk_size<N>> : std::true_type {};

////////////////
// flags
////////////////

class string_error;
class throw_on_error;
class ignore_empty;
class strict_quotes;
class unique_header;

////////////////
// setup implementation
////////////////

template <typename... Options>
struct setup {
private:
    template <typename T>
    struct is_string_error : std::is_same<T, rs::string_error> {};

    template <typename T>
    struct is_throw_on_error : std::is_same<T, rs::throw_on_error> {};

    template <typename T>
    struct is_ignore_empty : std::is_same<T, rs::ignore_empty> {};

    template <typename T>
    struct is_strict_quotes : std::is_same<T, rs::strict_quotes> {};

    template <typename T>
    struct is_unique_header : std::is_same<T, rs::unique_header> {};

    constexpr static auto count_quote = count_v<is_quote, Options...>;
    constexpr static auto count_chunk_size = count_v<is_chunk_size, Options...>;
    constexpr static auto count_string_error =
        count_v<is_string_error, Options...>;
    constexpr static auto count_throw_on_error =
        count_v<is_throw_on_error, Options...>;
    constexpr static auto count_ignore_empty =
        count_v<is_ignore_empty, Options...>;
    constexpr static auto count_strict_quotes =
        count_v<is_strict_quotes, Options...>;
    constexpr static auto count_unique_header =
        count_v<is_unique_header, Options...>;

    constexpr static auto number_of_valid_setup_types =
        count_quote + count_chunk_size + count_string_error +
        count_throw_on_error + count_ignore_empty + count_strict_quotes +
        count_unique_header;

public:
    using quote = find_first_t<is_quote, rs::quote<'"'>, Options...>;

    constexpr static size_t chunk_size =
        find_first_t<is_chunk_size, rs::chunk_size<default_chunk_size>,
                     Options...>::value;

    constexpr static bool string_error = (count_string_error == 1);
    constexpr static bool throw_on_error = (count_throw_on_error == 1);
    constexpr static bool ignore_empty = (count_ignore_empty == 1);
    constexpr static bool strict_quotes = (count_strict_quotes == 1);
    constexpr static bool unique_header = (count_unique_header == 1);

private:
    static_assert(count_quote <= 1, "quote defined multiple times");
    static_assert(count_chunk_size <= 1, "chunk_size defined multiple times");
    static_assert(count_string_error <= 1,
                  "string_error defined multiple times");
    static_assert(count_throw_on_error <= 1,
                  "throw_on_error defined multiple times");
    static_assert(count_ignore_empty <= 1,
                  "ignore_empty defined multiple times");
    static_assert(count_strict_quotes <= 1,
                  "strict_quotes defined multiple times");
    static_assert(count_unique_header <= 1,
                  "unique_header defined multiple times");

    static_assert(count_throw_on_error + count_string_error <= 1,
                  "cannot define both throw_on_error and string_error");

    static_assert(number_of_valid_setup_types == sizeof...(Options),
                  "one or multiple invalid setup parameters defined");
};

template <typename... Options>
struct setup<setup<Options...>> : setup<Options...> {};

} /* namespace rs */
