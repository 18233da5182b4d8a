/**
 * remove_cvref.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * C++17 stand-in for std::remove_cvref.
 */

#ifndef MONCMB_DETAIL_REMOVE_CVREF_HPP
#define MONCMB_DETAIL_REMOVE_CVREF_HPP

#include <type_traits>

namespace moncmb {
namespace detail {

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

} /* namespace detail */
} /* namespace moncmb */

#endif /* MONCMB_DETAIL_REMOVE_CVREF_HPP */
