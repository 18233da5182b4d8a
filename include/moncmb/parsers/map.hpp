/**
 * map.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The action/transformation combinator that transforms the value of every
 * result with a user-provided function. Same as bind(p, x -> result(fn(x))).
 */

#ifndef MONCMB_PARSERS_MAP_HPP
#define MONCMB_PARSERS_MAP_HPP

#include <functional>
#include <type_traits>
#include <utility>
#include "combinator.hpp"

namespace moncmb {

template <typename P, typename Fn>
class map_t : public combinator<map_t<P, Fn>> {
private:
    template <typename Input>
    using value_t = detail::remove_cvref_t<
        std::invoke_result_t<Fn const&, parser_value_t<P, Input>&&>
    >;

    P  m_Parser;
    Fn m_Fn;

public:
    template <typename PFwd, typename FnFwd>
    constexpr map_t(PFwd&& p, FnFwd&& fn)
        noexcept(
            std::is_nothrow_constructible_v<P, PFwd&&>
         && std::is_nothrow_constructible_v<Fn, FnFwd&&>
        )
        : m_Parser(moncmb_fwd(p)), m_Fn(moncmb_fwd(fn)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> results<value_t<Input>, Input> {
        moncmb_assert_parser(P, Input);
        static_assert(
            std::is_invocable_v<Fn const&, parser_value_t<P, Input>&&>,
            "The given function must be invocable with the parser's value "
            "type! (note: the function's invocation must be const-qualified!)"
        );

        results<value_t<Input>, Input> res;
        auto p_inv = m_Parser.apply(in);
        res.reserve(p_inv.size());
        for (auto& p_res : p_inv) {
            res.emplace_back(
                std::invoke(m_Fn, std::move(p_res).value()),
                std::move(p_res).remaining()
            );
        }
        return res;
    }
};

template <typename PFwd, typename FnFwd>
map_t(PFwd, FnFwd) -> map_t<PFwd, FnFwd>;

template <typename P, typename Fn,
    moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto map(P&& p, Fn&& fn)
    moncmb_return(map_t(moncmb_fwd(p), moncmb_fwd(fn)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_MAP_HPP */
