/**
 * result_pair.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * What the combinators return. Every parser returns the sequence of all the
 * ways it could consume a prefix of its input. An empty sequence is a failure,
 * more than one element means the grammar was ambiguous at that point.
 */

#ifndef MONCMB_RESULT_PAIR_HPP
#define MONCMB_RESULT_PAIR_HPP

#include <type_traits>
#include <vector>
#include "detail.hpp"

namespace moncmb {

/**
 * A single successful partial parse: the produced value and the input that
 * is left unconsumed after it.
 */
template <typename T, typename Input>
class result_pair {
public:
    using value_type = T;
    using input_type = Input;

private:
    value_type m_Value;
    input_type m_Remaining;

public:
    template <typename TFwd, typename InputFwd>
    constexpr result_pair(TFwd&& val, InputFwd&& rem)
        noexcept(
            std::is_nothrow_constructible_v<value_type, TFwd&&>
         && std::is_nothrow_constructible_v<input_type, InputFwd&&>
        )
        : m_Value(moncmb_fwd(val)), m_Remaining(moncmb_fwd(rem)) {
    }

    moncmb_getter(value, m_Value)
    moncmb_getter(remaining, m_Remaining)
};

template <typename T, typename Input>
[[nodiscard]] bool operator==(
    result_pair<T, Input> const& l, result_pair<T, Input> const& r) {

    return l.value() == r.value() && l.remaining() == r.remaining();
}

template <typename T, typename Input>
[[nodiscard]] bool operator!=(
    result_pair<T, Input> const& l, result_pair<T, Input> const& r) {

    return !(l == r);
}

/**
 * The full output of a parser.
 */
template <typename T, typename Input>
using results = std::vector<result_pair<T, Input>>;

} /* namespace moncmb */

#endif /* MONCMB_RESULT_PAIR_HPP */
