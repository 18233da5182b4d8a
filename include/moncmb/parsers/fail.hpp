/**
 * fail.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The monadic zero. Never succeeds. It still needs a value type, so it can be
 * combined with parsers that produce T.
 */

#ifndef MONCMB_PARSERS_FAIL_HPP
#define MONCMB_PARSERS_FAIL_HPP

#include "combinator.hpp"

namespace moncmb {

template <typename T>
class fail_t : public combinator<fail_t<T>> {
public:
    template <typename Input>
    [[nodiscard]] auto apply(Input const& /* in */) const -> results<T, Input> {
        moncmb_assert_input(Input);
        return {};
    }
};

// Value for 'fail' parser
template <typename T>
inline constexpr auto fail = fail_t<T>();

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_FAIL_HPP */
