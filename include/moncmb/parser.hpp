/**
 * parser.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A type-erased parser for a fixed value and input type. Every combinator has
 * its own type, which makes it impossible to name a grammar rule that refers
 * to itself. This wrapper gives rules a nameable type, and it's cheap to copy:
 * all the copies share the same immutable combinator.
 */

#ifndef MONCMB_PARSER_HPP
#define MONCMB_PARSER_HPP

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include "detail.hpp"
#include "parsers/combinator.hpp"

namespace moncmb {

template <typename T, typename Input>
class parser : public combinator<parser<T, Input>> {
public:
    using value_type = T;
    using input_type = Input;

private:
    moncmb_self_check(parser);

    using function_type = std::function<results<T, Input>(Input const&)>;

    std::shared_ptr<function_type const> m_Fn;

public:
    template <typename PFwd,
        moncmb_requires_t(!is_self_v<PFwd> && detail::is_combinator_cvref_v<PFwd>)>
    parser(PFwd&& p)
        : m_Fn(std::make_shared<function_type const>(
            [cmb = detail::remove_cvref_t<PFwd>(moncmb_fwd(p))](Input const& in) {
                return cmb.apply(in);
            })) {
        using p_type = detail::remove_cvref_t<PFwd>;
        moncmb_assert_parser(p_type, Input);
        static_assert(
            std::is_same_v<parser_value_t<p_type, Input>, T>,
            "The wrapped parser must produce exactly the value type of the "
            "type-erased parser!"
        );
    }

    [[nodiscard]] results<T, Input> apply(Input const& in) const {
        moncmb_assert(
            "A moved-from parser can't be applied!",
            m_Fn != nullptr
        );
        return (*m_Fn)(in);
    }
};

} /* namespace moncmb */

#endif /* MONCMB_PARSER_HPP */
