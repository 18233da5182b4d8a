/**
 * result.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The monadic unit. Always succeeds exactly once with the given value and
 * doesn't consume anything.
 */

#ifndef MONCMB_PARSERS_RESULT_HPP
#define MONCMB_PARSERS_RESULT_HPP

#include <type_traits>
#include "combinator.hpp"

namespace moncmb {

template <typename T>
class result_t : public combinator<result_t<T>> {
private:
    moncmb_self_check(result_t);

    T m_Value;

public:
    template <typename TFwd, moncmb_requires_t(!is_self_v<TFwd>)>
    constexpr explicit result_t(TFwd&& val)
        noexcept(std::is_nothrow_constructible_v<T, TFwd&&>)
        : m_Value(moncmb_fwd(val)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const -> results<T, Input> {
        moncmb_assert_input(Input);

        results<T, Input> res;
        res.emplace_back(m_Value, in);
        return res;
    }
};

template <typename TFwd>
result_t(TFwd) -> result_t<TFwd>;

template <typename TFwd>
[[nodiscard]] constexpr auto result(TFwd&& val) {
    return result_t<std::decay_t<TFwd>>(moncmb_fwd(val));
}

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_RESULT_HPP */
