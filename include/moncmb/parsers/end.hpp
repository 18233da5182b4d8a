/**
 * end.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Matches the end of the input: there is no item left to take.
 */

#ifndef MONCMB_PARSERS_END_HPP
#define MONCMB_PARSERS_END_HPP

#include "item.hpp"
#include "not.hpp"

namespace moncmb {

using end_t = not_t<item_t>;

// Value for 'end' parser
inline constexpr end_t end = end_t(item);

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_END_HPP */
