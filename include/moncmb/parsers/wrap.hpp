/**
 * wrap.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Lifts a plain function into a combinator. Anything callable with an input
 * that returns the results for that input can be used as a parser this way.
 */

#ifndef MONCMB_PARSERS_WRAP_HPP
#define MONCMB_PARSERS_WRAP_HPP

#include <functional>
#include <type_traits>
#include <vector>
#include "combinator.hpp"

namespace moncmb {

namespace detail {

template <typename T, typename Input>
struct is_results_of : std::false_type {};

template <typename T, typename Input>
struct is_results_of<std::vector<result_pair<T, Input>>, Input>
    : std::true_type {};

} /* namespace detail */

template <typename Fn>
class wrap_t : public combinator<wrap_t<Fn>> {
private:
    moncmb_self_check(wrap_t);

    Fn m_Fn;

public:
    template <typename FnFwd, moncmb_requires_t(!is_self_v<FnFwd>)>
    constexpr explicit wrap_t(FnFwd&& fn)
        noexcept(std::is_nothrow_constructible_v<Fn, FnFwd&&>)
        : m_Fn(moncmb_fwd(fn)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> detail::remove_cvref_t<std::invoke_result_t<Fn const&, Input const&>> {
        moncmb_assert_input(Input);
        static_assert(
            detail::is_results_of<
                detail::remove_cvref_t<
                    std::invoke_result_t<Fn const&, Input const&>
                >,
                Input
            >::value,
            "A wrapped function must return results<T, Input> for its input!"
        );

        return std::invoke(m_Fn, in);
    }
};

template <typename FnFwd>
wrap_t(FnFwd) -> wrap_t<FnFwd>;

template <typename Fn>
[[nodiscard]] constexpr auto wrap(Fn&& fn)
    moncmb_return(wrap_t<std::decay_t<Fn>>(moncmb_fwd(fn)))

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_WRAP_HPP */
