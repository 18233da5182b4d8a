/**
 * literal.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Matches a fixed sequence of elements, like a keyword. Succeeds with the
 * sequence itself.
 */

#ifndef MONCMB_PARSERS_LITERAL_HPP
#define MONCMB_PARSERS_LITERAL_HPP

#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include "combinator.hpp"

namespace moncmb {

template <typename Seq>
class literal_t : public combinator<literal_t<Seq>> {
private:
    moncmb_self_check(literal_t);

    Seq m_Sequence;

public:
    template <typename SeqFwd, moncmb_requires_t(!is_self_v<SeqFwd>)>
    constexpr explicit literal_t(SeqFwd&& seq)
        noexcept(std::is_nothrow_constructible_v<Seq, SeqFwd&&>)
        : m_Sequence(moncmb_fwd(seq)) {
    }

    template <typename Input>
    [[nodiscard]] auto apply(Input const& in) const -> results<Seq, Input> {
        moncmb_assert_input(Input);

        results<Seq, Input> res;
        auto rest = in;
        for (auto const& elem : m_Sequence) {
            if (rest.is_empty() || !(rest.first() == elem)) {
                return res;
            }
            rest = rest.rest();
        }
        res.emplace_back(m_Sequence, std::move(rest));
        return res;
    }
};

template <typename SeqFwd>
literal_t(SeqFwd) -> literal_t<SeqFwd>;

template <typename CharT>
[[nodiscard]] auto literal(CharT const* str) {
    return literal_t<std::basic_string<CharT>>(std::basic_string<CharT>(str));
}

template <typename CharT, typename Traits>
[[nodiscard]] auto literal(std::basic_string_view<CharT, Traits> str) {
    return literal_t<std::basic_string<CharT, Traits>>(
        std::basic_string<CharT, Traits>(str)
    );
}

/**
 * Any other iterable sequence is copied as is.
 */
template <typename Seq,
    typename = decltype(std::begin(std::declval<Seq&>())),
    moncmb_requires_t(!std::is_array_v<std::remove_reference_t<Seq>>)>
[[nodiscard]] auto literal(Seq&& seq) {
    return literal_t<std::decay_t<Seq>>(moncmb_fwd(seq));
}

template <typename T>
[[nodiscard]] auto literal(std::initializer_list<T> seq) {
    return literal_t<std::vector<T>>(std::vector<T>(seq));
}

} /* namespace moncmb */

#endif /* MONCMB_PARSERS_LITERAL_HPP */
