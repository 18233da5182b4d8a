/**
 * sequence_input.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * An input over any random-access source, like a token vector. It's a
 * pointer to the source and a cursor, so stepping is free.
 */

#ifndef MONCMB_INPUTS_SEQUENCE_INPUT_HPP
#define MONCMB_INPUTS_SEQUENCE_INPUT_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include "../detail.hpp"
#include "../error.hpp"

namespace moncmb {

namespace detail {

/**
 * Concept for the sequence source.
 * The source has to have:
 *  - An operator[](std::size_t) that returns the element at the given index
 *  - A length std::size can read: a .size() member, or a built-in array
 */

template <typename T>
using element_at_t = decltype(std::declval<T>()[std::declval<std::size_t>()]);

template <typename T>
using msize_t = decltype(std::size(std::declval<T>()));

template <typename T>
inline constexpr bool is_sequence_source_v =
       is_detected_v<element_at_t, T const&>
    && is_detected_v<msize_t, T const&>;

} /* namespace detail */

template <typename Src>
class sequence_input {
public:
    static_assert(
        detail::is_sequence_source_v<Src>,
        "The sequence source must have a subscript operator [std::size_t] and "
        "a .size() member (or be a built-in array)!"
    );

    using source_type = Src;

private:
    Src const*  m_Source;
    std::size_t m_Cursor;

public:
    constexpr sequence_input(Src const& src, std::size_t idx = 0U)
        : m_Source(std::addressof(src)), m_Cursor(idx) {
        moncmb_assert(
            "The starting index must be in the bounds of the source!",
            idx <= std::size(src)
        );
    }

    // The input would outlive the source
    sequence_input(Src const&& src, std::size_t idx = 0U) = delete;

    [[nodiscard]] constexpr bool is_empty() const noexcept {
        return m_Cursor >= std::size(*m_Source);
    }

    [[nodiscard]] constexpr decltype(auto) first() const {
        if (is_empty()) {
            throw empty_input_error("first");
        }
        return (*m_Source)[m_Cursor];
    }

    [[nodiscard]] constexpr sequence_input rest() const {
        if (is_empty()) {
            throw empty_input_error("rest");
        }
        return sequence_input(*m_Source, m_Cursor + 1);
    }

    [[nodiscard]] constexpr auto const& source() const noexcept {
        return *m_Source;
    }

    [[nodiscard]] constexpr std::size_t cursor() const noexcept {
        return m_Cursor;
    }
};

template <typename Src>
sequence_input(Src const&) -> sequence_input<Src>;

template <typename Src>
sequence_input(Src const&, std::size_t) -> sequence_input<Src>;

/**
 * Two views are equal when they look at the same position of the same source.
 */
template <typename Src>
[[nodiscard]] constexpr bool operator==(
    sequence_input<Src> const& l, sequence_input<Src> const& r) noexcept {

    return std::addressof(l.source()) == std::addressof(r.source())
        && l.cursor() == r.cursor();
}

template <typename Src>
[[nodiscard]] constexpr bool operator!=(
    sequence_input<Src> const& l, sequence_input<Src> const& r) noexcept {

    return !(l == r);
}

} /* namespace moncmb */

#endif /* MONCMB_INPUTS_SEQUENCE_INPUT_HPP */
