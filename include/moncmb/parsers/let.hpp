/**
 * let.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Sequencing sugar. let(b1, ..., bn, body) runs the bindings one after the
 * other and names their values, without writing nested bind calls:
 *
 * auto pair = let(
 *     item,
 *     [](char a) { return element(a); },
 *     [](char a, char b) { return result(std::pair(a, b)); }
 * );
 *
 * A binding is either a parser, or a function that receives the values bound
 * so far and returns a parser. The body receives every bound value and
 * returns the parser that produces the final results. A value nobody needs
 * can be left as an unnamed parameter. Without bindings, let(body) is just
 * body().
 */

#ifndef MONCMB_PARSERS_LET_HPP
#define MONCMB_PARSERS_LET_HPP

#include <tuple>
#include <type_traits>
#include <utility>
#include "bind.hpp"
#include "combinator.hpp"

namespace moncmb {

namespace detail {

template <typename Binding, typename... Vs>
[[nodiscard]] constexpr decltype(auto) let_binding_parser(
    Binding const& b, std::tuple<Vs...> const& env) {

    if constexpr (is_combinator_v<Binding>) {
        return (b);
    }
    else {
        static_assert(
            std::is_invocable_v<Binding const&, Vs const&...>,
            "A let binding must be a parser or a function of the values "
            "bound before it!"
        );
        return std::apply(b, env);
    }
}

template <typename... Vs, typename Body>
[[nodiscard]] constexpr auto let_impl(std::tuple<Vs...> const& env,
    Body const& body) {

    static_assert(
        std::is_invocable_v<Body const&, Vs const&...>,
        "The body of let must be invocable with every bound value!"
    );
    static_assert(
        is_combinator_cvref_v<std::invoke_result_t<Body const&, Vs const&...>>,
        "The body of let must return a parser!"
    );
    return std::apply(body, env);
}

template <typename... Vs, typename Binding, typename Next, typename... Rest>
[[nodiscard]] constexpr auto let_impl(std::tuple<Vs...> const& env,
    Binding const& b, Next const& next, Rest const&... rest) {

    return ::moncmb::bind(
        let_binding_parser(b, env),
        [env, next, rest...](auto value) {
            return let_impl(
                std::tuple_cat(env, std::make_tuple(std::move(value))),
                next, rest...
            );
        }
    );
}

} /* namespace detail */

template <typename... Bindings>
[[nodiscard]] constexpr auto let(Bindings const&... bindings) {
    static_assert(
        sizeof...(Bindings) > 0,
        "let needs at least a body!"
    );
    return detail::let_impl(std::tuple<>(), bindings...);
}

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_LET_HPP */
