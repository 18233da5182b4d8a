/**
 * not.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Negative lookahead. Succeeds with true exactly when the underlying parser
 * fails. Never consumes anything.
 */

#ifndef MONCMB_PARSERS_NOT_HPP
#define MONCMB_PARSERS_NOT_HPP

#include <type_traits>
#include "combinator.hpp"

namespace moncmb {

template <typename P>
class not_t : public combinator<not_t<P>> {
private:
    moncmb_self_check(not_t);

    P m_Parser;

public:
    template <typename PFwd, moncmb_requires_t(!is_self_v<PFwd>)>
    constexpr explicit not_t(PFwd&& p)
        noexcept(std::is_nothrow_constructible_v<P, PFwd&&>)
        : m_Parser(moncmb_fwd(p)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const -> results<bool, Input> {
        moncmb_assert_parser(P, Input);

        results<bool, Input> res;
        if (m_Parser.apply(in).empty()) {
            res.emplace_back(true, in);
        }
        return res;
    }
};

template <typename PFwd>
not_t(PFwd) -> not_t<PFwd>;

template <typename P, moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto not_p(P&& p)
    moncmb_return(not_t<detail::remove_cvref_t<P>>(moncmb_fwd(p)))

/**
 * Operator for negating a parser.
 */
template <typename P, moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto operator!(P&& p)
    moncmb_return(not_t<detail::remove_cvref_t<P>>(moncmb_fwd(p)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_NOT_HPP */
