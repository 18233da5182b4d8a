/**
 * run.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Entry points for running a parser on a source. Ambiguity is the caller's to
 * resolve: run() returns every interpretation, parse() takes the first one,
 * parse_all() keeps the ones that consumed the whole input.
 */

#ifndef MONCMB_RUN_HPP
#define MONCMB_RUN_HPP

#include <optional>
#include <utility>
#include <vector>
#include "detail.hpp"
#include "inputs/make_input.hpp"
#include "parsers/combinator.hpp"

namespace moncmb {

/**
 * Every result of the parser on the source.
 */
template <typename P, typename Src>
[[nodiscard]] auto run(P const& p, Src&& src) {
    auto in = make_input(moncmb_fwd(src));
    moncmb_assert_parser(P, decltype(in));

    return p.apply(in);
}

/**
 * The value of the first result, if there is any.
 */
template <typename P, typename Src>
[[nodiscard]] auto parse(P const& p, Src&& src) {
    auto res = run(p, moncmb_fwd(src));
    using value_type = typename decltype(res)::value_type::value_type;

    if (res.empty()) {
        return std::optional<value_type>();
    }
    return std::optional<value_type>(std::move(res.front()).value());
}

/**
 * The values of the results that consumed the whole input, in order.
 */
template <typename P, typename Src>
[[nodiscard]] auto parse_all(P const& p, Src&& src) {
    auto res = run(p, moncmb_fwd(src));
    using value_type = typename decltype(res)::value_type::value_type;

    std::vector<value_type> values;
    for (auto& r : res) {
        if (r.remaining().is_empty()) {
            values.push_back(std::move(r).value());
        }
    }
    return values;
}

} /* namespace moncmb */

#endif /* MONCMB_RUN_HPP */
