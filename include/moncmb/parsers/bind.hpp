/**
 * bind.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Monadic sequencing. Runs the parser, feeds every value it produced to the
 * continuation, and runs the returned parser on the corresponding remaining
 * input. The results are flattened depth-first, left-to-right:
 *
 *  bind(result(x), f)       == f(x)
 *  bind(p, result)          == p
 *  bind(bind(p, f), g)      == bind(p, x -> bind(f(x), g))
 */

#ifndef MONCMB_PARSERS_BIND_HPP
#define MONCMB_PARSERS_BIND_HPP

#include <functional>
#include <iterator>
#include <type_traits>
#include "combinator.hpp"

namespace moncmb {

template <typename P, typename Fn>
class bind_t : public combinator<bind_t<P, Fn>> {
private:
    // The parser the continuation returns for a value
    template <typename Input>
    using next_t = detail::remove_cvref_t<
        std::invoke_result_t<Fn const&, parser_value_t<P, Input>&&>
    >;

    template <typename Input>
    using value_t = parser_value_t<next_t<Input>, Input>;

    P  m_Parser;
    Fn m_Fn;

public:
    template <typename PFwd, typename FnFwd>
    constexpr bind_t(PFwd&& p, FnFwd&& fn)
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
            is_combinator_v<next_t<Input>>,
            "The continuation of bind must return a parser!"
        );

        results<value_t<Input>, Input> res;

        auto p_inv = m_Parser.apply(in);
        for (auto& p_res : p_inv) {
            auto next = std::invoke(m_Fn, std::move(p_res).value());
            auto next_inv = next.apply(p_res.remaining());
            res.insert(
                res.end(),
                std::make_move_iterator(next_inv.begin()),
                std::make_move_iterator(next_inv.end())
            );
        }
        return res;
    }
};

template <typename PFwd, typename FnFwd>
bind_t(PFwd, FnFwd) -> bind_t<PFwd, FnFwd>;

template <typename P, typename Fn,
    moncmb_requires_t(detail::is_combinator_cvref_v<P>)>
[[nodiscard]] constexpr auto bind(P&& p, Fn&& fn)
    moncmb_return(bind_t(moncmb_fwd(p), moncmb_fwd(fn)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_BIND_HPP */
