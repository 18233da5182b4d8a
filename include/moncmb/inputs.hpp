/**
 * inputs.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Inclusion of all input headers.
 */

#ifndef MONCMB_INPUTS_HPP
#define MONCMB_INPUTS_HPP

#include "input.hpp"
#include "inputs/list_input.hpp"
#include "inputs/make_input.hpp"
#include "inputs/sequence_input.hpp"
#include "inputs/stream_input.hpp"
#include "inputs/string_input.hpp"

#endif /* MONCMB_INPUTS_HPP */
