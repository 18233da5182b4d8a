/**
 * detail.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Inclusion of all detail headers.
 */

#ifndef MONCMB_DETAIL_HPP
#define MONCMB_DETAIL_HPP

#include "detail/crtp.hpp"
#include "detail/is_detected.hpp"
#include "detail/macros.hpp"
#include "detail/remove_cvref.hpp"

#endif /* MONCMB_DETAIL_HPP */
