/**
 * and.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Sequencing that throws values away. and_p(p1, ..., pn) keeps the value of
 * the last parser, prog1(p1, ..., pn) keeps the value of the first one. Both
 * are bind with a continuation that ignores its argument.
 */

#ifndef MONCMB_PARSERS_AND_HPP
#define MONCMB_PARSERS_AND_HPP

#include <iterator>
#include <type_traits>
#include "combinator.hpp"

namespace moncmb {

template <typename P1, typename P2>
class and_t : public combinator<and_t<P1, P2>> {
private:
    template <typename Input>
    using value_t = parser_value_t<P2, Input>;

    P1 m_First;
    P2 m_Second;

public:
    template <typename P1Fwd, typename P2Fwd>
    constexpr and_t(P1Fwd&& p1, P2Fwd&& p2)
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

        results<value_t<Input>, Input> res;
        auto p1_inv = m_First.apply(in);
        for (auto const& p1_res : p1_inv) {
            auto p2_inv = m_Second.apply(p1_res.remaining());
            res.insert(
                res.end(),
                std::make_move_iterator(p2_inv.begin()),
                std::make_move_iterator(p2_inv.end())
            );
        }
        return res;
    }
};

template <typename P1Fwd, typename P2Fwd>
and_t(P1Fwd, P2Fwd) -> and_t<P1Fwd, P2Fwd>;

template <typename P1, typename P2>
class prog1_t : public combinator<prog1_t<P1, P2>> {
private:
    template <typename Input>
    using value_t = parser_value_t<P1, Input>;

    P1 m_First;
    P2 m_Second;

public:
    template <typename P1Fwd, typename P2Fwd>
    constexpr prog1_t(P1Fwd&& p1, P2Fwd&& p2)
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

        results<value_t<Input>, Input> res;
        auto p1_inv = m_First.apply(in);
        for (auto const& p1_res : p1_inv) {
            auto p2_inv = m_Second.apply(p1_res.remaining());
            for (auto& p2_res : p2_inv) {
                res.emplace_back(
                    p1_res.value(), std::move(p2_res).remaining()
                );
            }
        }
        return res;
    }
};

template <typename P1Fwd, typename P2Fwd>
prog1_t(P1Fwd, P2Fwd) -> prog1_t<P1Fwd, P2Fwd>;

template <typename P1, typename... Ps,
    moncmb_requires_t(detail::all_combinators_cvref_v<P1, Ps...>)>
[[nodiscard]] constexpr auto and_p(P1&& p1, Ps&&... ps) {
    if constexpr (sizeof...(Ps) == 0) {
        return detail::remove_cvref_t<P1>(moncmb_fwd(p1));
    }
    else {
        return and_t(moncmb_fwd(p1), and_p(moncmb_fwd(ps)...));
    }
}

template <typename P1, typename... Ps,
    moncmb_requires_t(detail::all_combinators_cvref_v<P1, Ps...>)>
[[nodiscard]] constexpr auto prog1(P1&& p1, Ps&&... ps) {
    if constexpr (sizeof...(Ps) == 0) {
        return detail::remove_cvref_t<P1>(moncmb_fwd(p1));
    }
    else {
        // The rest only has to match, its value is dropped anyway
        return prog1_t(moncmb_fwd(p1), and_p(moncmb_fwd(ps)...));
    }
}

/**
 * Operator for sequencing, keeps the right value.
 */
template <typename P1, typename P2,
    moncmb_requires_t(detail::all_combinators_cvref_v<P1, P2>)>
[[nodiscard]] constexpr auto operator&(P1&& p1, P2&& p2)
    moncmb_return(and_t(moncmb_fwd(p1), moncmb_fwd(p2)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_AND_HPP */
