/**
 * alt.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Deterministic choice. Tries the first alternative, and only if it produced
 * nothing, tries the second. The second one is never invoked when the first
 * one succeeds.
 */

#ifndef MONCMB_PARSERS_ALT_HPP
#define MONCMB_PARSERS_ALT_HPP

#include <type_traits>
#include "combinator.hpp"

namespace moncmb {

/**
 * A tag-type for a more uniform alternative syntax.
 * This can be put as the first element of an alternative chain so every new
 * line can start with the alternative operator. It's completely ignored.
 * Example:
 * auto parser = pass
 *             | first
 *             | second
 *             ;
 */
struct pass_t {};

inline constexpr auto pass = pass_t();

template <typename P1, typename P2>
class alt_t : public combinator<alt_t<P1, P2>> {
private:
    template <typename Input>
    using value_t = parser_value_t<P1, Input>;

    P1 m_First;
    P2 m_Second;

public:
    template <typename P1Fwd, typename P2Fwd>
    constexpr alt_t(P1Fwd&& p1, P2Fwd&& p2)
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
            "The alternatives of alt must produce the same value type!"
        );

        // Try to apply the first alternative
        auto p1_inv = m_First.apply(in);
        if (!p1_inv.empty()) {
            return p1_inv;
        }
        // Only now try the second one
        return m_Second.apply(in);
    }
};

template <typename P1Fwd, typename P2Fwd>
alt_t(P1Fwd, P2Fwd) -> alt_t<P1Fwd, P2Fwd>;

template <typename P1, typename... Ps,
    moncmb_requires_t(detail::all_combinators_cvref_v<P1, Ps...>)>
[[nodiscard]] constexpr auto alt(P1&& p1, Ps&&... ps) {
    if constexpr (sizeof...(Ps) == 0) {
        return detail::remove_cvref_t<P1>(moncmb_fwd(p1));
    }
    else {
        return alt_t(moncmb_fwd(p1), alt(moncmb_fwd(ps)...));
    }
}

/**
 * Operator for making alternatives.
 */
template <typename P1, typename P2,
    moncmb_requires_t(detail::all_combinators_cvref_v<P1, P2>)>
[[nodiscard]] constexpr auto operator|(P1&& p1, P2&& p2)
    moncmb_return(alt_t(moncmb_fwd(p1), moncmb_fwd(p2)))

/**
 * Ignore pass.
 */
template <typename P2,
    moncmb_requires_t(detail::is_combinator_cvref_v<P2>)>
[[nodiscard]] constexpr auto operator|(pass_t, P2&& p2)
    moncmb_return(detail::remove_cvref_t<P2>(moncmb_fwd(p2)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_ALT_HPP */
