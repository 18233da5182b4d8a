/**
 * conditional.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Conditional forms, built purely from and_p, not_p and plus:
 *  - if_p(test, then, else): then after test, or else where test fails
 *  - when_p(test, p): p after test
 *  - unless_p(test, p): p where test fails, test consumes nothing then
 */

#ifndef MONCMB_PARSERS_CONDITIONAL_HPP
#define MONCMB_PARSERS_CONDITIONAL_HPP

#include "and.hpp"
#include "combinator.hpp"
#include "not.hpp"
#include "plus.hpp"

namespace moncmb {

template <typename Test, typename P,
    moncmb_requires_t(detail::all_combinators_cvref_v<Test, P>)>
[[nodiscard]] constexpr auto when_p(Test&& test, P&& p)
    moncmb_return(and_p(moncmb_fwd(test), moncmb_fwd(p)))

template <typename Test, typename P,
    moncmb_requires_t(detail::all_combinators_cvref_v<Test, P>)>
[[nodiscard]] constexpr auto unless_p(Test&& test, P&& p)
    moncmb_return(and_p(not_p(moncmb_fwd(test)), moncmb_fwd(p)))

template <typename Test, typename Then, typename Else,
    moncmb_requires_t(detail::all_combinators_cvref_v<Test, Then, Else>)>
[[nodiscard]] constexpr auto if_p(Test const& test, Then&& then, Else&& els) {
    // The branches exclude each other, so plus yields one of them
    return plus(
        when_p(test, moncmb_fwd(then)),
        unless_p(test, moncmb_fwd(els))
    );
}

/**
 * Without an else branch the failing test leaves nothing to try.
 */
template <typename Test, typename Then,
    moncmb_requires_t(detail::all_combinators_cvref_v<Test, Then>)>
[[nodiscard]] constexpr auto if_p(Test&& test, Then&& then)
    moncmb_return(when_p(moncmb_fwd(test), moncmb_fwd(then)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_CONDITIONAL_HPP */
