/**
 * combinator.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A base-type for all combinators. Makes them callable like functions and
 * injects the subscript operator to map over the produced values.
 */

#ifndef MONCMB_PARSERS_COMBINATOR_HPP
#define MONCMB_PARSERS_COMBINATOR_HPP

#include <type_traits>
#include <utility>
#include "../detail.hpp"
#include "../input.hpp"
#include "../result_pair.hpp"

namespace moncmb {

namespace detail {

/**
 * A tag-type for every combinator, so it's easier to check inheritance.
 */
class combinator_base {};

} /* namespace detail */

/**
 * Check if a type correctly derives from the combinator base.
 * The user actually has to derive from combinator<Self>, but that already
 * derives from combinator base, so this check is sufficient.
 */
template <typename T>
using is_combinator = std::is_base_of<detail::combinator_base, T>;

template <typename T>
inline constexpr bool is_combinator_v = is_combinator<T>::value;

namespace detail {

template <typename T>
inline constexpr bool is_combinator_cvref_v =
    is_combinator_v<remove_cvref_t<T>>;

template <typename... Ts>
inline constexpr bool all_combinators_cvref_v =
    (... && is_combinator_cvref_v<Ts>);

} /* namespace detail */

// Forward-declare the map combinator, the base combinator has to see it
template <typename P, typename Fn>
class map_t;

/**
 * The actual type that all other combinators have to derive from.
 */
template <typename Self>
class combinator : public detail::crtp<Self>,
                   private detail::combinator_base {
public:
    /**
     * A parser is a function from an input to its results.
     */
    template <typename Input>
    [[nodiscard]] auto operator()(Input const& in) const {
        return this->self().apply(in);
    }

    template <typename Fn>
    [[nodiscard]] constexpr auto operator[](Fn&& fn) const& {
        return map_t<Self, std::decay_t<Fn>>(this->self(), moncmb_fwd(fn));
    }

    template <typename Fn>
    [[nodiscard]] constexpr auto operator[](Fn&& fn) && {
        return map_t<Self, std::decay_t<Fn>>(
            std::move(*this).self(), moncmb_fwd(fn)
        );
    }
};

namespace detail {

/**
 * Concept check for parser interface.
 */
template <typename P, typename Input>
using apply_t = decltype(
    std::declval<P const&>().apply(std::declval<Input const&>())
);

template <typename P, typename Input>
inline constexpr bool has_parser_interface_v =
       is_detected_v<apply_t, P, Input>
    && is_combinator_v<P>;

} /* namespace detail */

/**
 * Every parser can use this at the beginning of the apply function to check
 * sub-parsers.
 */
#define moncmb_assert_parser(p, i)                       \
static_assert(                                           \
    ::moncmb::detail::has_parser_interface_v<p, i>,      \
    "A parser must be derived from combinator<Self> "    \
    " and have a member function apply(Input)!"          \
    " (note: apply has to be const-qualified!)"          \
)

/**
 * Helper to get the full output of a parser.
 */
template <typename P, typename Input>
using parser_results_t = detail::remove_cvref_t<detail::apply_t<P, Input>>;

/**
 * Helper to get the value type of a parser's result pairs.
 */
template <typename P, typename Input>
using parser_value_t =
    typename parser_results_t<P, Input>::value_type::value_type;

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_COMBINATOR_HPP */
