/**
 * first.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Keeps only the first interpretation of an ambiguous parser, committing to
 * it.
 */

#ifndef MONCMB_PARSERS_FIRST_HPP
#define MONCMB_PARSERS_FIRST_HPP

#include <type_traits>
#include "combinator.hpp"

namespace moncmb {

template <typename P>
class first_t : public combinator<first_t<P>> {
private:
    moncmb_self_check(first_t);

    P m_Parser;

public:
    template <typename PFwd, moncmb_requires_t(!is_self_v<PFwd>)>
    constexpr explicit first_t(PFwd&& p)
        noexcept(std::is_nothrow_constructible_v<P, PFwd&&>)
        : m_Parser(moncmb_fwd(p)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> parser_results_t<P, Input> {
        moncmb_assert_parser(P, Input);

        auto res = m_Parser.apply(in);
        while (res.size() > 1) {
            res.pop_back();
        }
        return res;
    }
};

template <typename PFwd>
first_t(PFwd) -> first_t<PFwd>;

template <typename P, moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto first(P&& p)
    moncmb_return(first_t<detail::remove_cvref_t<P>>(moncmb_fwd(p)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_FIRST_HPP */
