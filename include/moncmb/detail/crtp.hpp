/**
 * crtp.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Downcast helper for the combinator base.
 * See: https://www.fluentcpp.com/2017/05/19/crtp-helper/
 */

#ifndef MONCMB_DETAIL_CRTP_HPP
#define MONCMB_DETAIL_CRTP_HPP

namespace moncmb {
namespace detail {

template <typename Self>
class crtp {
public:
    using self_type = Self;

    [[nodiscard]]
    constexpr self_type& self() & noexcept {
        return static_cast<self_type&>(*this);
    }

    [[nodiscard]]
    constexpr self_type const& self() const& noexcept {
        return static_cast<self_type const&>(*this);
    }

    [[nodiscard]]
    constexpr self_type&& self() && noexcept {
        return static_cast<self_type&&>(*this);
    }
};

} /* namespace detail */
} /* namespace moncmb */

#endif /* MONCMB_DETAIL_CRTP_HPP */
