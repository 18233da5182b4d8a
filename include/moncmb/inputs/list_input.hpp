/**
 * list_input.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A persistent singly-linked list as an input. Tails are shared, so rest() is
 * a pointer copy and consing onto an existing list never copies it.
 */

#ifndef MONCMB_INPUTS_LIST_INPUT_HPP
#define MONCMB_INPUTS_LIST_INPUT_HPP

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>
#include "../error.hpp"

namespace moncmb {

template <typename T>
class list_input {
public:
    using value_type = T;

private:
    struct node {
        T                     value;
        std::shared_ptr<node> next;
    };

    std::shared_ptr<node> m_Head;

    explicit list_input(std::shared_ptr<node> head) noexcept
        : m_Head(std::move(head)) {
    }

    // Unlinks the nodes only this head owns one by one, the recursive
    // destruction of a long list would overflow the stack
    static void release(std::shared_ptr<node> head) noexcept {
        while (head && head.use_count() == 1) {
            head = std::move(head->next);
        }
    }

public:
    list_input() noexcept = default;

    list_input(std::initializer_list<T> elems)
        : list_input(elems.begin(), elems.end()) {
    }

    template <typename It>
    list_input(It first, It last) {
        // Build from the back, every node needs its tail first
        std::vector<T> elems(first, last);
        for (auto it = elems.rbegin(); it != elems.rend(); ++it) {
            m_Head = std::make_shared<node>(node{std::move(*it), m_Head});
        }
    }

    list_input(list_input const&) = default;
    list_input(list_input&&) noexcept = default;

    list_input& operator=(list_input const& other) noexcept {
        release(std::exchange(m_Head, other.m_Head));
        return *this;
    }

    list_input& operator=(list_input&& other) noexcept {
        if (this != &other) {
            release(std::exchange(m_Head, std::move(other.m_Head)));
        }
        return *this;
    }

    ~list_input() {
        release(std::move(m_Head));
    }

    /**
     * A new list with the given element in front of this one.
     */
    [[nodiscard]] list_input cons(T value) const {
        return list_input(std::make_shared<node>(node{std::move(value), m_Head}));
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return m_Head == nullptr;
    }

    [[nodiscard]] T const& first() const {
        if (is_empty()) {
            throw empty_input_error("first");
        }
        return m_Head->value;
    }

    [[nodiscard]] list_input rest() const {
        if (is_empty()) {
            throw empty_input_error("rest");
        }
        return list_input(m_Head->next);
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::size_t n = 0U;
        for (auto* n_ptr = m_Head.get(); n_ptr != nullptr; n_ptr = n_ptr->next.get()) {
            ++n;
        }
        return n;
    }

    template <typename U>
    friend bool operator==(list_input<U> const& l, list_input<U> const& r);
};

template <typename It>
list_input(It, It) -> list_input<typename std::iterator_traits<It>::value_type>;

/**
 * Element-wise comparison. Stops early when the two lists share a tail.
 */
template <typename T>
bool operator==(list_input<T> const& l, list_input<T> const& r) {
    auto const* a = l.m_Head.get();
    auto const* b = r.m_Head.get();
    while (a != b) {
        if (a == nullptr || b == nullptr || !(a->value == b->value)) {
            return false;
        }
        a = a->next.get();
        b = b->next.get();
    }
    return true;
}

template <typename T>
[[nodiscard]] bool operator!=(list_input<T> const& l, list_input<T> const& r) {
    return !(l == r);
}

} /* namespace moncmb */

#endif /* MONCMB_INPUTS_LIST_INPUT_HPP */
