/**
 * item.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Consumes a single element from the input, if there is one.
 */

#ifndef MONCMB_PARSERS_ITEM_HPP
#define MONCMB_PARSERS_ITEM_HPP

#include "combinator.hpp"

namespace moncmb {

class item_t : public combinator<item_t> {
public:
    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const
        -> results<element_t<Input>, Input> {
        moncmb_assert_input(Input);

        results<element_t<Input>, Input> res;
        if (!in.is_empty()) {
            res.emplace_back(in.first(), in.rest());
        }
        return res;
    }
};

// Value for 'item' parser
inline constexpr item_t item = item_t();

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_ITEM_HPP */
