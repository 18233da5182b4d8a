/**
 * stream_input.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * An input that reads a character stream lazily. The stream can only be read
 * once, so every character read is kept in a buffer shared by all the inputs
 * that were derived from the same stream. This keeps rest() referentially
 * stable: any position can be looked at again when a parser backtracks.
 * The buffer is guarded by a lock, so inputs over the same stream can be
 * parsed from multiple threads.
 */

#ifndef MONCMB_INPUTS_STREAM_INPUT_HPP
#define MONCMB_INPUTS_STREAM_INPUT_HPP

#include <cstddef>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include "../error.hpp"

namespace moncmb {

template <typename CharT, typename Traits = std::char_traits<CharT>>
class basic_stream_input {
public:
    using stream_type = std::basic_istream<CharT, Traits>;

private:
    struct shared_state {
        explicit shared_state(stream_type& is) noexcept
            : stream(&is) {
        }

        stream_type*                     stream;
        std::basic_string<CharT, Traits> buffer;
        bool                             exhausted = false;
        std::mutex                       mutex;
    };

    std::shared_ptr<shared_state> m_State;
    std::size_t                   m_Cursor;

    basic_stream_input(std::shared_ptr<shared_state> st, std::size_t idx) noexcept
        : m_State(std::move(st)), m_Cursor(idx) {
    }

    // Reads until the cursor is buffered or the stream runs out
    // The caller must hold the lock of the shared state
    bool fill() const {
        auto& st = *m_State;
        while (st.buffer.size() <= m_Cursor && !st.exhausted) {
            auto c = st.stream->get();
            if (Traits::eq_int_type(c, Traits::eof())) {
                st.exhausted = true;
            }
            else {
                st.buffer.push_back(Traits::to_char_type(c));
            }
        }
        return m_Cursor < st.buffer.size();
    }

public:
    /**
     * The stream must outlive every input and result read from it.
     */
    explicit basic_stream_input(stream_type& is)
        : basic_stream_input(
            std::make_shared<shared_state>(is), 0U) {
    }

    [[nodiscard]] bool is_empty() const {
        std::lock_guard<std::mutex> lock(m_State->mutex);
        return !fill();
    }

    [[nodiscard]] CharT first() const {
        std::lock_guard<std::mutex> lock(m_State->mutex);
        if (!fill()) {
            throw empty_input_error("first");
        }
        return m_State->buffer[m_Cursor];
    }

    [[nodiscard]] basic_stream_input rest() const {
        std::lock_guard<std::mutex> lock(m_State->mutex);
        if (!fill()) {
            throw empty_input_error("rest");
        }
        return basic_stream_input(m_State, m_Cursor + 1);
    }

    [[nodiscard]] std::size_t cursor() const noexcept {
        return m_Cursor;
    }

    template <typename C, typename T>
    friend bool operator==(
        basic_stream_input<C, T> const& l, basic_stream_input<C, T> const& r);
};

template <typename CharT, typename Traits>
bool operator==(
    basic_stream_input<CharT, Traits> const& l,
    basic_stream_input<CharT, Traits> const& r) {

    return l.m_State == r.m_State && l.m_Cursor == r.m_Cursor;
}

template <typename CharT, typename Traits>
[[nodiscard]] bool operator!=(
    basic_stream_input<CharT, Traits> const& l,
    basic_stream_input<CharT, Traits> const& r) {

    return !(l == r);
}

using stream_input = basic_stream_input<char>;
using wstream_input = basic_stream_input<wchar_t>;

} /* namespace moncmb */

#endif /* MONCMB_INPUTS_STREAM_INPUT_HPP */
