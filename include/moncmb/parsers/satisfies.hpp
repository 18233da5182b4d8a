/**
 * satisfies.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Consumes a single element, if it satisfies a predicate. Also the usual
 * shorthands for matching elements by value.
 */

#ifndef MONCMB_PARSERS_SATISFIES_HPP
#define MONCMB_PARSERS_SATISFIES_HPP

#include <functional>
#include <type_traits>
#include <utility>
#include "combinator.hpp"

namespace moncmb {

template <typename Pred>
class satisfies_t : public combinator<satisfies_t<Pred>> {
private:
    moncmb_self_check(satisfies_t);

    Pred m_Pred;

public:
    template <typename PredFwd, moncmb_requires_t(!is_self_v<PredFwd>)>
    constexpr explicit satisfies_t(PredFwd&& pred)
        noexcept(std::is_nothrow_constructible_v<Pred, PredFwd&&>)
        : m_Pred(moncmb_fwd(pred)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> results<element_t<Input>, Input> {
        moncmb_assert_input(Input);
        static_assert(
            std::is_invocable_r_v<bool, Pred const&, element_t<Input> const&>,
            "The predicate must be invocable with the element type and return "
            "something convertible to bool!"
        );

        results<element_t<Input>, Input> res;
        if (in.is_empty()) {
            return res;
        }
        decltype(auto) elem = in.first();
        if (std::invoke(m_Pred, elem)) {
            res.emplace_back(elem, in.rest());
        }
        return res;
    }
};

template <typename PredFwd>
satisfies_t(PredFwd) -> satisfies_t<PredFwd>;

template <typename Pred>
[[nodiscard]] constexpr auto satisfies(Pred&& pred)
    moncmb_return(satisfies_t<std::decay_t<Pred>>(moncmb_fwd(pred)))

/**
 * Matches an element equal to the given one.
 */
template <typename T>
[[nodiscard]] constexpr auto element(T elem) {
    return satisfies([elem = std::move(elem)](auto const& x) {
        return x == elem;
    });
}

/**
 * Matches an element equal to any of the given ones.
 */
template <typename... Ts>
[[nodiscard]] constexpr auto one_of(Ts... elems) {
    return satisfies([=](auto const& x) {
        return (... || (x == elems));
    });
}

/**
 * Matches an element that differs from all of the given ones.
 */
template <typename... Ts>
[[nodiscard]] constexpr auto none_of(Ts... elems) {
    return satisfies([=](auto const& x) {
        return (... && !(x == elems));
    });
}

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_SATISFIES_HPP */
