/**
 * macros.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Common macros used in the library.
 */

#ifndef MONCMB_DETAIL_MACROS_HPP
#define MONCMB_DETAIL_MACROS_HPP

#include <cassert>
#include <type_traits>
#include <utility>
#include "remove_cvref.hpp"

/**
 * Assertion with a custom message. Only for internal invariants, input
 * contract violations are reported with exceptions.
 */
#define moncmb_assert(msg, ...) assert(((void)msg, (__VA_ARGS__)))

#define moncmb_cat(x, y) moncmb_prelude_cat(x, y)

#define moncmb_unique_id(prefix) moncmb_cat(prefix, __LINE__)

/**
 * Simplifies forwarding syntax, we don't have to provide the template argument.
 */
#define moncmb_fwd(...) ::std::forward<decltype(__VA_ARGS__)>(__VA_ARGS__)

/**
 * A simple concept emulation macro. Does SFINAE in a safe way.
 */
#define moncmb_requires_t(...) \
moncmb_prelude_requires_t1(moncmb_unique_id(moncmb_concept_req), __VA_ARGS__)

/**
 * Generates an is_self_v template variable, so forwarding constructors don't
 * hijack copy and move construction.
 */
#define moncmb_self_check(type) \
moncmb_prelude_self_check(type, moncmb_unique_id(moncmb_self_type))

/**
 * Generates a getter with all member-qualifiers for owned values.
 */
#define moncmb_getter(name, ...)                                        \
[[nodiscard]]                                                           \
constexpr auto& name() & noexcept {                                     \
    return __VA_ARGS__;                                                 \
}                                                                       \
[[nodiscard]]                                                           \
constexpr auto const& name() const& noexcept {                          \
    return __VA_ARGS__;                                                 \
}                                                                       \
[[nodiscard]]                                                           \
constexpr auto&& name() && noexcept {                                   \
    return std::move(__VA_ARGS__);                                      \
}

/**
 * Returns an expression with automatic noexcept qualifier. Only for computed,
 * non-owned values.
 */
#define moncmb_return(...) \
noexcept(noexcept(__VA_ARGS__)) -> decltype(__VA_ARGS__) { return __VA_ARGS__; }

// Macro details

#define moncmb_prelude_cat(x, y) x ## y

#define moncmb_prelude_requires_t1(id, ...)                         \
bool id = false,                                                    \
::std::enable_if_t<id || (__VA_ARGS__), ::std::nullptr_t> = nullptr

#define moncmb_prelude_self_check(type, id)                      \
template <typename id>                                           \
static constexpr bool is_self_v =                                \
    ::std::is_same_v<::moncmb::detail::remove_cvref_t<id>, type>

#endif /* MONCMB_DETAIL_MACROS_HPP */
