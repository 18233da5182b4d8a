/**
 * many.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Repetition. zero_or_more(p) is
 *
 *  alt(bind(p, x -> bind(zero_or_more(p), xs -> result(cons(x, xs)))),
 *      result([]))
 *
 * so it always succeeds, and when p is ambiguous every interpretation of p is
 * continued greedily. one_or_more(p) is the same, but needs p to succeed at
 * least once.
 *
 * Every match is one level of recursion, the stack depth is bounded by the
 * number of matched elements. A parser that can succeed without consuming
 * anything makes zero_or_more recurse forever, it's up to the caller to never
 * repeat such a parser.
 */

#ifndef MONCMB_PARSERS_MANY_HPP
#define MONCMB_PARSERS_MANY_HPP

#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>
#include "combinator.hpp"

namespace moncmb {

namespace detail {

/**
 * Continues the collected prefix with every maximal chain of matches from the
 * given input, appending the finished chains to res.
 */
template <typename P, typename Input, typename Coll, typename Res>
void collect_many(P const& p, Input const& in, Coll prefix, Res& res) {
    auto p_inv = p.apply(in);
    if (p_inv.empty()) {
        // No more matches, this chain is done
        res.emplace_back(std::move(prefix), in);
        return;
    }
    for (std::size_t i = 0; i < p_inv.size(); ++i) {
        auto& p_res = p_inv[i];
        Coll next;
        if (i + 1 == p_inv.size()) {
            next = std::move(prefix);
        }
        else {
            next = prefix;
        }
        next.push_back(std::move(p_res).value());
        collect_many(p, p_res.remaining(), std::move(next), res);
    }
}

} /* namespace detail */

template <typename P>
class many_t : public combinator<many_t<P>> {
private:
    moncmb_self_check(many_t);

    template <typename Input>
    using value_t = std::vector<parser_value_t<P, Input>>;

    P m_Parser;

public:
    template <typename PFwd, moncmb_requires_t(!is_self_v<PFwd>)>
    constexpr explicit many_t(PFwd&& p)
        noexcept(std::is_nothrow_constructible_v<P, PFwd&&>)
        : m_Parser(moncmb_fwd(p)) {
    }

    moncmb_getter(underlying, m_Parser)

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> results<value_t<Input>, Input> {
        moncmb_assert_parser(P, Input);

        results<value_t<Input>, Input> res;
        detail::collect_many(m_Parser, in, value_t<Input>(), res);
        return res;
    }
};

template <typename PFwd>
many_t(PFwd) -> many_t<PFwd>;

template <typename P>
class many1_t : public combinator<many1_t<P>> {
private:
    moncmb_self_check(many1_t);

    template <typename Input>
    using value_t = std::vector<parser_value_t<P, Input>>;

    P m_Parser;

public:
    template <typename PFwd, moncmb_requires_t(!is_self_v<PFwd>)>
    constexpr explicit many1_t(PFwd&& p)
        noexcept(std::is_nothrow_constructible_v<P, PFwd&&>)
        : m_Parser(moncmb_fwd(p)) {
    }

    moncmb_getter(underlying, m_Parser)

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> results<value_t<Input>, Input> {
        moncmb_assert_parser(P, Input);

        results<value_t<Input>, Input> res;
        // The first match is mandatory, the rest is zero_or_more
        auto p_inv = m_Parser.apply(in);
        for (auto& p_res : p_inv) {
            auto first = value_t<Input>();
            first.push_back(std::move(p_res).value());
            detail::collect_many(
                m_Parser, p_res.remaining(), std::move(first), res
            );
        }
        return res;
    }
};

template <typename PFwd>
many1_t(PFwd) -> many1_t<PFwd>;

template <typename P, moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto zero_or_more(P&& p)
    moncmb_return(many_t<detail::remove_cvref_t<P>>(moncmb_fwd(p)))

template <typename P, moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto one_or_more(P&& p)
    moncmb_return(many1_t<detail::remove_cvref_t<P>>(moncmb_fwd(p)))

/**
 * Operator for making zero_or_more parser.
 */
template <typename P, moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto operator*(P&& p)
    moncmb_return(many_t<detail::remove_cvref_t<P>>(moncmb_fwd(p)))

/**
 * Operator for making one_or_more parser.
 */
template <typename P, moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto operator+(P&& p)
    moncmb_return(many1_t<detail::remove_cvref_t<P>>(moncmb_fwd(p)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_MANY_HPP */
