/**
 * is_detected.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The parts of the detector idiom the input and combinator checks need.
 * See: https://en.cppreference.com/w/cpp/experimental/is_detected
 */

#ifndef MONCMB_DETAIL_IS_DETECTED_HPP
#define MONCMB_DETAIL_IS_DETECTED_HPP

#include <type_traits>

namespace moncmb {
namespace detail {

template <typename AlwaysVoid,
    template <typename...> typename Op, typename... Args>
struct detector : std::false_type {};

template <template <typename...> typename Op, typename... Args>
struct detector<std::void_t<Op<Args...>>, Op, Args...> : std::true_type {};

template <template <typename...> typename Op, typename... Args>
inline constexpr bool is_detected_v = detector<void, Op, Args...>::value;

// Only looks at Op<Args...> when it's well-formed
template <typename Expected, typename AlwaysVoid,
    template <typename...> typename Op, typename... Args>
struct exact_detector : std::false_type {};

template <typename Expected,
    template <typename...> typename Op, typename... Args>
struct exact_detector<Expected, std::void_t<Op<Args...>>, Op, Args...>
    : std::is_same<Expected, Op<Args...>> {};

template <typename Expected,
    template <typename...> typename Op, typename... Args>
inline constexpr bool is_detected_exact_v =
    exact_detector<Expected, void, Op, Args...>::value;

template <typename To, typename AlwaysVoid,
    template <typename...> typename Op, typename... Args>
struct convertible_detector : std::false_type {};

template <typename To,
    template <typename...> typename Op, typename... Args>
struct convertible_detector<To, std::void_t<Op<Args...>>, Op, Args...>
    : std::is_convertible<Op<Args...>, To> {};

template <typename To,
    template <typename...> typename Op, typename... Args>
inline constexpr bool is_detected_convertible_v =
    convertible_detector<To, void, Op, Args...>::value;

} /* namespace detail */
} /* namespace moncmb */

#endif /* MONCMB_DETAIL_IS_DETECTED_HPP */
