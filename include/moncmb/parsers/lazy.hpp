/**
 * lazy.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Defers building a parser until it's applied. This is what makes recursive
 * grammars possible: a rule can refer to itself through a function returning
 * a parser<T, Input>.
 */

#ifndef MONCMB_PARSERS_LAZY_HPP
#define MONCMB_PARSERS_LAZY_HPP

#include <functional>
#include <type_traits>
#include "combinator.hpp"

namespace moncmb {

template <typename Fn>
class lazy_t : public combinator<lazy_t<Fn>> {
private:
    moncmb_self_check(lazy_t);

    using parser_type = detail::remove_cvref_t<std::invoke_result_t<Fn const&>>;

    Fn m_Fn;

public:
    template <typename FnFwd, moncmb_requires_t(!is_self_v<FnFwd>)>
    constexpr explicit lazy_t(FnFwd&& fn)
        noexcept(std::is_nothrow_constructible_v<Fn, FnFwd&&>)
        : m_Fn(moncmb_fwd(fn)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> parser_results_t<parser_type, Input> {
        moncmb_assert_parser(parser_type, Input);

        return std::invoke(m_Fn).apply(in);
    }
};

template <typename FnFwd>
lazy_t(FnFwd) -> lazy_t<FnFwd>;

template <typename Fn>
[[nodiscard]] constexpr auto lazy(Fn&& fn)
    moncmb_return(lazy_t<std::decay_t<Fn>>(moncmb_fwd(fn)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_LAZY_HPP */
