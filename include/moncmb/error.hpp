/**
 * error.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Exceptions of the library. Parse failures are never exceptions, these only
 * signal a broken contract on the caller's side.
 */

#ifndef MONCMB_ERROR_HPP
#define MONCMB_ERROR_HPP

#include <stdexcept>
#include <string>

namespace moncmb {

/**
 * Thrown by first() and rest() of an input that has no more elements.
 * Callers must check is_empty() first.
 */
class empty_input_error : public std::out_of_range {
public:
    explicit empty_input_error(std::string const& operation)
        : std::out_of_range(operation + "() called on an empty input!") {
    }
};

} /* namespace moncmb */

#endif /* MONCMB_ERROR_HPP */
