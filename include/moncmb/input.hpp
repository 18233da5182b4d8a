/**
 * input.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The input protocol. The combinators never look at the representation of
 * their input, they only use these three operations:
 *  - is_empty(): true if there are no more elements
 *  - first(): the current element, throws empty_input_error when empty
 *  - rest(): a new input without the current element, throws
 *    empty_input_error when empty
 * None of them may mutate the observable state of the input, calling rest()
 * twice on the same input gives two equal inputs.
 */

#ifndef MONCMB_INPUT_HPP
#define MONCMB_INPUT_HPP

#include <type_traits>
#include "detail.hpp"
#include "error.hpp"

namespace moncmb {

namespace detail {

template <typename I>
using is_empty_t = decltype(std::declval<I const&>().is_empty());

template <typename I>
using first_t = decltype(std::declval<I const&>().first());

template <typename I>
using rest_t = decltype(std::declval<I const&>().rest());

} /* namespace detail */

/**
 * Input concept check.
 */
template <typename I>
inline constexpr bool is_input_v =
       std::is_copy_constructible_v<I>
    && detail::is_detected_convertible_v<bool, detail::is_empty_t, I>
    && detail::is_detected_v<detail::first_t, I>
    && detail::is_detected_exact_v<I, detail::rest_t, I>;

/**
 * The type of a single element of the input.
 */
template <typename I>
using element_t = detail::remove_cvref_t<detail::first_t<I>>;

/**
 * Every combinator can use this at the beginning of the apply function to
 * check the input type.
 */
#define moncmb_assert_input(i)                                  \
static_assert(                                                  \
    ::moncmb::is_input_v<i>,                                    \
    "An input must be copyable and have the const member "      \
    "functions is_empty(), first() and rest()!"                 \
    " (note: rest() has to return the same input type!)"        \
)

} /* namespace moncmb */

#endif /* MONCMB_INPUT_HPP */
