/**
 * plus.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Non-deterministic choice. Runs both alternatives on the same input and keeps
 * every interpretation: first all the results of the left one, then all the
 * results of the right one.
 */

#ifndef MONCMB_PARSERS_PLUS_HPP
#define MONCMB_PARSERS_PLUS_HPP

#include <iterator>
#include <type_traits>
#include "combinator.hpp"

namespace moncmb {

template <typename P1, typename P2>
class plus_t : public combinator<plus_t<P1, P2>> {
private:
    template <typename Input>
    using value_t = parser_value_t<P1, Input>;

    P1 m_First;
    P2 m_Second;

public:
    template <typename P1Fwd, typename P2Fwd>
    constexpr plus_t(P1Fwd&& p1, P2Fwd&& p2)
        noexcept(
            std::is_nothrow_constructible_v<P1, P1Fwd&&>
         && std::is_nothrow_constructible_v<P2, P2Fwd&&>
        )
        : m_First(moncmb_fwd(p1)), m_Second(moncmb_fwd(p2)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> results<value_t<Input>, Input> {
        moncmb_assert_parser(P1, Input);
        moncmb_assert_parser(P2, Input);
        static_assert(
            std::is_same_v<value_t<Input>, parser_value_t<P2, Input>>,
            "The alternatives of plus must produce the same value type!"
        );

        auto res = m_First.apply(in);
        auto p2_inv = m_Second.apply(in);
        res.insert(
            res.end(),
            std::make_move_iterator(p2_inv.begin()),
            std::make_move_iterator(p2_inv.end())
        );
        return res;
    }
};

template <typename P1Fwd, typename P2Fwd>
plus_t(P1Fwd, P2Fwd) -> plus_t<P1Fwd, P2Fwd>;

template <typename P1, typename P2, typename... Ps,
    moncmb_requires_t(detail::all_combinators_cvref_v<P1, P2, Ps...>)>
[[nodiscard]] constexpr auto plus(P1&& p1, P2&& p2, Ps&&... ps) {
    if constexpr (sizeof...(Ps) == 0) {
        return plus_t(moncmb_fwd(p1), moncmb_fwd(p2));
    }
    else {
        return plus_t(moncmb_fwd(p1), plus(moncmb_fwd(p2), moncmb_fwd(ps)...));
    }
}

/**
 * Operator for keeping both interpretations.
 */
template <typename P1, typename P2,
    moncmb_requires_t(detail::all_combinators_cvref_v<P1, P2>)>
[[nodiscard]] constexpr auto operator+(P1&& p1, P2&& p2)
    moncmb_return(plus_t(moncmb_fwd(p1), moncmb_fwd(p2)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_PLUS_HPP */
