/**
 * make_input.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Picks the natural input type for a source, so the entry points can be
 * called with strings, streams and containers directly.
 */

#ifndef MONCMB_INPUTS_MAKE_INPUT_HPP
#define MONCMB_INPUTS_MAKE_INPUT_HPP

#include <ios>
#include <string>
#include <string_view>
#include <type_traits>
#include "../detail.hpp"
#include "../input.hpp"
#include "sequence_input.hpp"
#include "stream_input.hpp"
#include "string_input.hpp"

namespace moncmb {

namespace detail {

template <typename T>
inline constexpr bool is_char_v =
       std::is_same_v<T, char>
    || std::is_same_v<T, wchar_t>
    || std::is_same_v<T, char16_t>
    || std::is_same_v<T, char32_t>;

// Character arrays and pointers, the C strings
template <typename T>
inline constexpr bool is_c_string_v =
    (std::is_array_v<T> || std::is_pointer_v<T>)
 && is_char_v<std::remove_cv_t<std::remove_pointer_t<std::decay_t<T>>>>;

template <typename T>
struct is_string_view : std::false_type {};

template <typename CharT, typename Traits>
struct is_string_view<std::basic_string_view<CharT, Traits>> : std::true_type {};

template <typename T>
struct is_string : std::false_type {};

template <typename CharT, typename Traits, typename Alloc>
struct is_string<std::basic_string<CharT, Traits, Alloc>> : std::true_type {};

} /* namespace detail */

template <typename Src>
[[nodiscard]] auto make_input(Src&& src) {
    using src_t = detail::remove_cvref_t<Src>;

    if constexpr (is_input_v<src_t>) {
        return src_t(moncmb_fwd(src));
    }
    else if constexpr (detail::is_c_string_v<src_t>) {
        using char_t = std::remove_cv_t<std::remove_pointer_t<std::decay_t<src_t>>>;
        return basic_string_input<char_t>(std::basic_string_view<char_t>(src));
    }
    else if constexpr (detail::is_string_view<src_t>::value) {
        using char_t = typename src_t::value_type;
        using traits_t = typename src_t::traits_type;
        return basic_string_input<char_t, traits_t>(src);
    }
    else if constexpr (detail::is_string<src_t>::value) {
        static_assert(
            std::is_lvalue_reference_v<Src>,
            "A temporary string can't be parsed, the results would dangle!"
        );
        using char_t = typename src_t::value_type;
        using traits_t = typename src_t::traits_type;
        return basic_string_input<char_t, traits_t>(
            std::basic_string_view<char_t, traits_t>(src)
        );
    }
    else if constexpr (std::is_base_of_v<std::ios_base, src_t>) {
        static_assert(
            std::is_lvalue_reference_v<Src>
         && !std::is_const_v<std::remove_reference_t<Src>>,
            "A stream can only be read through a non-const lvalue!"
        );
        using char_t = typename src_t::char_type;
        using traits_t = typename src_t::traits_type;
        return basic_stream_input<char_t, traits_t>(src);
    }
    else {
        static_assert(
            std::is_lvalue_reference_v<Src>,
            "A temporary source can't be parsed, the results would dangle!"
        );
        return sequence_input<src_t>(src);
    }
}

/**
 * The input type make_input produces for an lvalue source.
 */
template <typename Src>
using input_for_t = decltype(make_input(std::declval<Src&>()));

} /* namespace moncmb */

#endif /* MONCMB_INPUTS_MAKE_INPUT_HPP */
