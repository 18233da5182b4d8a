/**
 * string_input.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * An input over a character sequence. Only a view, the characters must
 * outlive every input (and every result) derived from it.
 */

#ifndef MONCMB_INPUTS_STRING_INPUT_HPP
#define MONCMB_INPUTS_STRING_INPUT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include "../error.hpp"

namespace moncmb {

template <typename CharT, typename Traits = std::char_traits<CharT>>
class basic_string_input {
public:
    using view_type = std::basic_string_view<CharT, Traits>;

private:
    view_type m_View;

public:
    constexpr basic_string_input() noexcept = default;

    constexpr basic_string_input(view_type v) noexcept
        : m_View(v) {
    }

    constexpr basic_string_input(CharT const* s)
        : m_View(s) {
    }

    [[nodiscard]] constexpr bool is_empty() const noexcept {
        return m_View.empty();
    }

    [[nodiscard]] constexpr CharT first() const {
        if (is_empty()) {
            throw empty_input_error("first");
        }
        return m_View.front();
    }

    [[nodiscard]] constexpr basic_string_input rest() const {
        if (is_empty()) {
            throw empty_input_error("rest");
        }
        return basic_string_input(m_View.substr(1));
    }

    [[nodiscard]] constexpr view_type const& view() const noexcept {
        return m_View;
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept {
        return m_View.size();
    }
};

template <typename CharT, typename Traits>
[[nodiscard]] constexpr bool operator==(
    basic_string_input<CharT, Traits> const& l,
    basic_string_input<CharT, Traits> const& r) noexcept {

    return l.view() == r.view();
}

template <typename CharT, typename Traits>
[[nodiscard]] constexpr bool operator!=(
    basic_string_input<CharT, Traits> const& l,
    basic_string_input<CharT, Traits> const& r) noexcept {

    return !(l == r);
}

using string_input = basic_string_input<char>;
using wstring_input = basic_string_input<wchar_t>;

} /* namespace moncmb */

#endif /* MONCMB_INPUTS_STRING_INPUT_HPP */
