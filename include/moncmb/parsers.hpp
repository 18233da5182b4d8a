/**
 * parsers.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Inclusion of all parser headers.
 */

#ifndef MONCMB_PARSERS_HPP
#define MONCMB_PARSERS_HPP

#include "parsers/alt.hpp"
#include "parsers/and.hpp"
#include "parsers/bind.hpp"
#include "parsers/combinator.hpp"
#include "parsers/conditional.hpp"
#include "parsers/end.hpp"
#include "parsers/fail.hpp"
#include "parsers/first.hpp"
#include "parsers/item.hpp"
#include "parsers/lazy.hpp"
#include "parsers/let.hpp"
#include "parsers/literal.hpp"
#include "parsers/many.hpp"
#include "parsers/map.hpp"
#include "parsers/maybe.hpp"
#include "parsers/not.hpp"
#include "parsers/plus.hpp"
#include "parsers/result.hpp"
#include "parsers/satisfies.hpp"
#include "parsers/wrap.hpp"

#endif /* MONCMB_PARSERS_HPP */
