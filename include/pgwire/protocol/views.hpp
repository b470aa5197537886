//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_VIEWS_HPP
#define PGWIRE_PROTOCOL_VIEWS_HPP

#include <cstddef>
#include <iterator>
#include <span>

namespace pgwire {
namespace protocol {

namespace detail {

template <class T>
struct forward_traits;

template <class T>
struct random_access_traits;

}  // namespace detail

// A collection of variable-size items, pointing into a message that parse() already validated.
// Items are deserialized on iteration
template <class T>
class forward_parsing_view
{
    std::size_t size_{};                    // number of items
    std::span<const unsigned char> data_;  // serialized items

public:
    class iterator
    {
        const unsigned char* data_{};  // pointer into the serialized collection

        T dereference() const { return detail::forward_traits<T>::dereference(data_); }
        void advance() { data_ = detail::forward_traits<T>::advance(data_); }

    public:
        using value_type = T;
        using reference = T;
        using pointer = T;
        using difference_type = std::ptrdiff_t;
        using iterator_category = std::forward_iterator_tag;

        iterator() = default;
        explicit iterator(const unsigned char* data) noexcept : data_(data) {}

        iterator& operator++() noexcept
        {
            advance();
            return *this;
        }
        iterator operator++(int) noexcept
        {
            auto res = *this;
            advance();
            return res;
        }
        reference operator*() const noexcept { return dereference(); }
        bool operator==(iterator rhs) const noexcept { return data_ == rhs.data_; }
        bool operator!=(iterator rhs) const noexcept { return !(*this == rhs); }
    };

    using const_iterator = iterator;
    using value_type = T;
    using reference = value_type;
    using const_reference = value_type;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;

    forward_parsing_view() = default;

    // data must point to the serialized items, and must be valid. parse() performs this validation.
    forward_parsing_view(std::size_t size, std::span<const unsigned char> data) noexcept
        : size_(size), data_(data)
    {
    }

    // The number of items
    std::size_t size() const { return size_; }

    // Is the range empty?
    bool empty() const { return size_ == 0u; }

    // Range functions
    iterator begin() const { return iterator(data_.data()); }
    iterator end() const { return iterator(data_.data() + data_.size()); }
};

// A collection of fixed-size items (e.g. Int32 OIDs), pointing into a validated message
template <class T>
class random_access_parsing_view
{
    const unsigned char* data_{};
    std::size_t size_{};

    static constexpr std::size_t item_size = sizeof(T);

public:
    random_access_parsing_view() = default;

    random_access_parsing_view(const unsigned char* data, std::size_t size) noexcept : data_(data), size_(size)
    {
    }

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0u; }

    T operator[](std::size_t i) const { return detail::random_access_traits<T>::dereference(data_ + i * item_size); }
};

}  // namespace protocol
}  // namespace pgwire

#endif
