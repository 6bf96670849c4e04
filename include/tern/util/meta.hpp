#ifndef TERN_META_HPP
#define TERN_META_HPP

#include <concepts>
#include <type_traits>

namespace tern {

template <typename T, typename... Ts>
concept one_of = (std::is_same_v<T, Ts> || ...);

template <typename T>
concept signed_or_unsigned = one_of<
    std::remove_cv_t<T>,
    signed char,
    short,
    int,
    long,
    long long,
    unsigned char,
    unsigned short,
    unsigned int,
    unsigned long,
    unsigned long long>;

template <typename T>
concept no_cv_floating = one_of<T, float, double, long double>;

} // namespace tern

#endif
