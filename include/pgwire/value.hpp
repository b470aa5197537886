//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_VALUE_HPP
#define PGWIRE_VALUE_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/variant2/variant.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pgwire {

// SQL NULL
struct null_t
{
    friend bool operator==(null_t, null_t) noexcept { return true; }
};
inline constexpr null_t null{};

// bytea
using bytes = std::vector<unsigned char>;

// bit and varbit. bits[0] is the leftmost bit
struct bit_string
{
    std::vector<bool> bits;

    friend bool operator==(const bit_string&, const bit_string&) = default;
};

struct point
{
    double x{};
    double y{};

    friend bool operator==(const point&, const point&) = default;
};

using uuid = std::array<unsigned char, 16>;

// numeric. Exact, including fractional values
using numeric = boost::multiprecision::cpp_rational;

using date = std::chrono::sys_days;
using time_of_day = std::chrono::microseconds;
using timestamp = std::chrono::local_time<std::chrono::microseconds>;
using timestamptz = std::chrono::sys_time<std::chrono::microseconds>;

// The three components are kept separate, as PostgreSQL does:
// a month doesn't have a fixed number of days, and a day may not have 24 hours
struct interval
{
    std::chrono::microseconds time{};
    std::int32_t days{};
    std::int32_t months{};

    friend bool operator==(const interval&, const interval&) = default;
};

class value;

// An array of any dimension. Multi-dimensional arrays nest array_values
struct array_value
{
    std::vector<value> elements;

    friend bool operator==(const array_value&, const array_value&);
};

// A composite value (record or row type)
struct row_value
{
    std::vector<value> fields;

    friend bool operator==(const row_value&, const row_value&);
};

// A decoded field or a statement parameter.
class value
{
public:
    using variant_type = boost::variant2::variant<
        null_t,
        bool,
        std::int16_t,
        std::int32_t,
        std::int64_t,
        std::uint32_t,
        float,
        double,
        numeric,
        std::string,
        bytes,
        bit_string,
        point,
        uuid,
        date,
        time_of_day,
        timestamp,
        timestamptz,
        interval,
        array_value,
        row_value>;

    value() = default;
    value(null_t) noexcept {}
    value(bool v) noexcept : impl_(boost::variant2::in_place_type<bool>, v) {}
    value(std::int16_t v) noexcept : impl_(boost::variant2::in_place_type<std::int16_t>, v) {}
    value(std::int32_t v) noexcept : impl_(boost::variant2::in_place_type<std::int32_t>, v) {}
    value(std::int64_t v) noexcept : impl_(boost::variant2::in_place_type<std::int64_t>, v) {}
    value(std::uint32_t v) noexcept : impl_(boost::variant2::in_place_type<std::uint32_t>, v) {}
    value(float v) noexcept : impl_(boost::variant2::in_place_type<float>, v) {}
    value(double v) noexcept : impl_(boost::variant2::in_place_type<double>, v) {}
    value(numeric v) : impl_(boost::variant2::in_place_type<numeric>, std::move(v)) {}
    value(std::string v) : impl_(boost::variant2::in_place_type<std::string>, std::move(v)) {}
    value(std::string_view v) : impl_(boost::variant2::in_place_type<std::string>, v) {}
    value(const char* v) : impl_(boost::variant2::in_place_type<std::string>, v) {}
    value(bytes v) : impl_(boost::variant2::in_place_type<bytes>, std::move(v)) {}
    value(bit_string v) : impl_(boost::variant2::in_place_type<bit_string>, std::move(v)) {}
    value(point v) noexcept : impl_(boost::variant2::in_place_type<point>, v) {}
    value(const uuid& v) noexcept : impl_(boost::variant2::in_place_type<uuid>, v) {}
    value(date v) noexcept : impl_(boost::variant2::in_place_type<date>, v) {}
    value(time_of_day v) noexcept : impl_(boost::variant2::in_place_type<time_of_day>, v) {}
    value(timestamp v) noexcept : impl_(boost::variant2::in_place_type<timestamp>, v) {}
    value(timestamptz v) noexcept : impl_(boost::variant2::in_place_type<timestamptz>, v) {}
    value(interval v) noexcept : impl_(boost::variant2::in_place_type<interval>, v) {}
    value(array_value v) : impl_(boost::variant2::in_place_type<array_value>, std::move(v)) {}
    value(row_value v) : impl_(boost::variant2::in_place_type<row_value>, std::move(v)) {}

    bool is_null() const noexcept { return impl_.index() == 0u; }

    template <class T>
    bool is() const noexcept
    {
        return boost::variant2::holds_alternative<T>(impl_);
    }

    // Throws boost::variant2::bad_variant_access if the value doesn't hold a T
    template <class T>
    const T& as() const
    {
        return boost::variant2::get<T>(impl_);
    }

    template <class T>
    T& as()
    {
        return boost::variant2::get<T>(impl_);
    }

    template <class T>
    const T* get_if() const noexcept
    {
        return boost::variant2::get_if<T>(&impl_);
    }

    const variant_type& variant() const noexcept { return impl_; }
    variant_type& variant() noexcept { return impl_; }

    friend bool operator==(const value& lhs, const value& rhs) { return lhs.impl_ == rhs.impl_; }

private:
    variant_type impl_;
};

inline bool operator==(const array_value& lhs, const array_value& rhs) { return lhs.elements == rhs.elements; }
inline bool operator==(const row_value& lhs, const row_value& rhs) { return lhs.fields == rhs.fields; }

// Builds an array_value from a list of elements
inline array_value make_array(std::vector<value> elements) { return array_value{std::move(elements)}; }

// Builds a row_value from a list of fields
inline row_value make_row(std::vector<value> fields) { return row_value{std::move(fields)}; }

// The name of the alternative held by the value ("int4", "text", "array"...). Used in messages
std::string_view kind_name(const value& v) noexcept;

// Prints the value as an SQL literal
std::ostream& operator<<(std::ostream& os, const value& v);

}  // namespace pgwire

#endif
