#pragma once

#include <cstdlib>
#include <type_traits>

namespace rs {

////////////////
// ternary
////////////////

template <bool B, typename T, typename U>
struct ternary {
    using type = U;
};

template <typename T, typename U>
struct ternary<true, T, U> {
    using type = T;
};

template <bool B, typename T, typename U>
using ternary_t = typename ternary<B, T, U>::type;

////////////////
// count
////////////////

template <template <typename...> class Trait, typename... Ts>
struct count {
    static constexpr size_t value = (size_t{0} + ... +
                                     static_cast<size_t>(Trait<Ts>::value));
};

template <template <typename...> class Trait, typename... Ts>
constexpr size_t count_v = count<Trait, Ts...>::value;

////////////////
// find first
////////////////

// first type of the pack matching Trait, Default if none does
template <template <typename...> class Trait, typename Default,
          typename... Ts>
struct find_first {
    using type = Default;
};

template <template <typename...> class Trait, typename Default, typename T,
          typename... Ts>
struct find_first<Trait, Default, T, Ts...> {
    using type =
        ternary_t<Trait<T>::value, T,
                  typename find_first<Trait, Default, Ts...>::type>;
};

template <template <typename...> class Trait, typename Default,
          typename... Ts>
using find_first_t = typename find_first<Trait, Default, Ts...>::type;

////////////////
// is instance of
////////////////

template <template <typename...> class Template, typename T>
struct is_instance_of {
    constexpr static bool value = false;
};

template <template <typename...> class Template, typename... Ts>
struct is_instance_of<Template, Template<Ts...>> {
    constexpr static bool value = true;
};

template <template <typename...> class Template, typename... Ts>
constexpr bool is_instance_of_v = is_instance_of<Template, Ts...>::value;

} /* namespace rs */
