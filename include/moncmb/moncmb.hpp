/**
 * moncmb.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Top-level header that includes all (other top-level) source files.
 */

#ifndef MONCMB_MONCMB_HPP
#define MONCMB_MONCMB_HPP

#include "detail.hpp"
#include "error.hpp"
#include "input.hpp"
#include "inputs.hpp"
#include "parser.hpp"
#include "parsers.hpp"
#include "result_pair.hpp"
#include "run.hpp"

#endif /* MONCMB_MONCMB_HPP */
