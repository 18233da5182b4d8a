/**
 * maybe.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * alt(p, result(nothing)). Wraps the values of the underlying parser into an
 * std::optional. Always succeeds, but only consumes if the underlying parser
 * succeeds.
 */

#ifndef MONCMB_PARSERS_MAYBE_HPP
#define MONCMB_PARSERS_MAYBE_HPP

#include <optional>
#include <type_traits>
#include "combinator.hpp"

namespace moncmb {

template <typename P>
class maybe_t : public combinator<maybe_t<P>> {
private:
    moncmb_self_check(maybe_t);

    template <typename Input>
    using value_t = std::optional<parser_value_t<P, Input>>;

    P m_Parser;

public:
    template <typename PFwd, moncmb_requires_t(!is_self_v<PFwd>)>
    constexpr explicit maybe_t(PFwd&& p)
        noexcept(std::is_nothrow_constructible_v<P, PFwd&&>)
        : m_Parser(moncmb_fwd(p)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> results<value_t<Input>, Input> {
        moncmb_assert_parser(P, Input);

        results<value_t<Input>, Input> res;
        auto p_inv = m_Parser.apply(in);
        if (p_inv.empty()) {
            res.emplace_back(std::nullopt, in);
            return res;
        }
        res.reserve(p_inv.size());
        for (auto& p_res : p_inv) {
            res.emplace_back(
                value_t<Input>(std::move(p_res).value()),
                std::move(p_res).remaining()
            );
        }
        return res;
    }
};

template <typename PFwd>
maybe_t(PFwd) -> maybe_t<PFwd>;

template <typename P, moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto maybe(P&& p)
    moncmb_return(maybe_t<detail::remove_cvref_t<P>>(moncmb_fwd(p)))

/**
 * Operator for making optional parser.
 */
template <typename P, moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto operator-(P&& p)
    moncmb_return(maybe_t<detail::remove_cvref_t<P>>(moncmb_fwd(p)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_MAYBE_HPP */
