//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/endian/conversion.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <bit>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "codecs.hpp"
#include "parse_context.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/types/oid.hpp"
#include "pgwire/value.hpp"
#include "serialization_context.hpp"

using namespace pgwire;
using boost::system::error_code;
using protocol::detail::append_integral;
using protocol::detail::parse_context;
using types::pg_oid_type;

namespace {

// Arrays with more dimensions are rejected by the server, too
constexpr std::int32_t max_array_dimensions = 6;

// numeric sign field
constexpr std::uint16_t numeric_pos = 0x0000;
constexpr std::uint16_t numeric_neg = 0x4000;
constexpr std::uint16_t numeric_nan = 0xC000;
constexpr std::uint16_t numeric_pinf = 0xD000;
constexpr std::uint16_t numeric_ninf = 0xF000;

template <class T>
error_code load_fixed(std::span<const unsigned char> data, T& to)
{
    if (data.size() != sizeof(T))
        return client_errc::invalid_field_value;
    to = boost::endian::endian_load<T, sizeof(T), boost::endian::order::big>(data.data());
    return {};
}

//
// Decoders
//
error_code decode_bool(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    if (data.size() != 1u || data[0] > 1u)
        return client_errc::invalid_field_value;
    to = data[0] == 1u;
    return {};
}

template <class T>
error_code decode_integer(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    T res{};
    if (auto ec = load_fixed(data, res))
        return ec;
    to = res;
    return {};
}

error_code decode_float4(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    std::uint32_t res{};
    if (auto ec = load_fixed(data, res))
        return ec;
    to = std::bit_cast<float>(res);
    return {};
}

error_code decode_float8(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    std::uint64_t res{};
    if (auto ec = load_fixed(data, res))
        return ec;
    to = std::bit_cast<double>(res);
    return {};
}

error_code decode_string(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    auto s = detail::to_string_view(data);
    if (!detail::is_valid_utf8(s))
        return client_errc::invalid_utf8;
    to = std::string(s);
    return {};
}

// "char" is a single byte, in any encoding
error_code decode_char(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    to = std::string(detail::to_string_view(data));
    return {};
}

error_code decode_jsonb(std::span<const unsigned char> data, std::int32_t oid, const read_table& table, value& to)
{
    if (data.empty() || data[0] != 1u)
        return client_errc::invalid_field_value;
    return decode_string(data.subspan(1), oid, table, to);
}

error_code decode_bytea(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    to = bytes(data.begin(), data.end());
    return {};
}

error_code decode_uuid(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    if (data.size() != 16u)
        return client_errc::invalid_field_value;
    uuid res{};
    std::copy(data.begin(), data.end(), res.begin());
    to = res;
    return {};
}

error_code decode_point(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    if (data.size() != 16u)
        return client_errc::invalid_field_value;
    point res{
        std::bit_cast<double>(boost::endian::load_big_u64(data.data())),
        std::bit_cast<double>(boost::endian::load_big_u64(data.data() + 8)),
    };
    to = res;
    return {};
}

error_code decode_bit_string(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    parse_context ctx(data);
    auto num_bits = ctx.get_integral<std::int32_t>();
    auto packed = ctx.get_remaining();
    if (ctx.error() || num_bits < 0)
        return client_errc::invalid_field_value;
    if (packed.size() != (static_cast<std::size_t>(num_bits) + 7u) / 8u)
        return client_errc::invalid_field_value;

    // Bits are packed MSB first. Padding bits in the last byte are dropped
    bit_string res;
    res.bits.reserve(static_cast<std::size_t>(num_bits));
    for (std::int32_t i = 0; i < num_bits; ++i)
        res.bits.push_back((packed[i / 8] >> (7 - i % 8)) & 1u);
    to = std::move(res);
    return {};
}

error_code decode_numeric(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    using boost::multiprecision::cpp_int;

    parse_context ctx(data);
    auto ndigits = ctx.get_integral<std::int16_t>();
    auto weight = ctx.get_integral<std::int16_t>();
    auto sign = ctx.get_integral<std::uint16_t>();
    auto dscale = ctx.get_integral<std::int16_t>();
    if (ctx.error() || ndigits < 0 || dscale < 0)
        return client_errc::invalid_field_value;

    switch (sign)
    {
    case numeric_nan: to = std::numeric_limits<double>::quiet_NaN(); return {};
    case numeric_pinf: to = std::numeric_limits<double>::infinity(); return {};
    case numeric_ninf: to = -std::numeric_limits<double>::infinity(); return {};
    case numeric_pos:
    case numeric_neg: break;
    default: return client_errc::invalid_field_value;
    }

    // Base 10000 digits, most significant first. The first one has the given weight
    cpp_int n = 0;
    for (std::int16_t i = 0; i < ndigits; ++i)
    {
        auto digit = ctx.get_integral<std::int16_t>();
        if (digit < 0 || digit > 9999)
            return client_errc::invalid_field_value;
        n = n * 10000 + digit;
    }
    if (ctx.check())
        return client_errc::invalid_field_value;

    int exponent = weight - (ndigits - 1);
    cpp_int scale = boost::multiprecision::pow(cpp_int(10000), static_cast<unsigned>(std::abs(exponent)));
    numeric res;
    if (exponent >= 0)
        res = numeric(cpp_int(n * scale));
    else
        res = numeric(n, scale);
    if (sign == numeric_neg)
        res = -res;
    to = std::move(res);
    return {};
}

error_code decode_date(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    std::int32_t days{};
    if (auto ec = load_fixed(data, days))
        return ec;
    if (days == (std::numeric_limits<std::int32_t>::max)())
        to = (date::max)();
    else if (days == (std::numeric_limits<std::int32_t>::min)())
        to = (date::min)();
    else
        to = detail::pg_epoch_date + std::chrono::days(days);
    return {};
}

error_code decode_time(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    std::int64_t us{};
    if (auto ec = load_fixed(data, us))
        return ec;
    to = time_of_day(us);
    return {};
}

template <class TimePoint>
error_code decode_time_point(std::span<const unsigned char> data, TimePoint epoch, value& to)
{
    std::int64_t us{};
    if (auto ec = load_fixed(data, us))
        return ec;
    if (us == (std::numeric_limits<std::int64_t>::max)())
        to = (TimePoint::max)();
    else if (us == (std::numeric_limits<std::int64_t>::min)())
        to = (TimePoint::min)();
    else
        to = epoch + std::chrono::microseconds(us);
    return {};
}

error_code decode_timestamp(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    return decode_time_point(data, detail::pg_epoch_timestamp(), to);
}

error_code decode_timestamptz(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    return decode_time_point(data, detail::pg_epoch_timestamptz(), to);
}

error_code decode_interval(std::span<const unsigned char> data, std::int32_t, const read_table&, value& to)
{
    if (data.size() != 16u)
        return client_errc::invalid_field_value;
    parse_context ctx(data);
    interval res;
    res.time = std::chrono::microseconds(ctx.get_integral<std::int64_t>());
    res.days = ctx.get_integral<std::int32_t>();
    res.months = ctx.get_integral<std::int32_t>();
    to = res;
    return {};
}

// Fields carry their own type OIDs, and are decoded through the active table
error_code decode_record(std::span<const unsigned char> data, std::int32_t, const read_table& table, value& to)
{
    parse_context ctx(data);
    auto num_fields = ctx.get_integral<std::int32_t>();
    if (ctx.error() || num_fields < 0)
        return client_errc::invalid_field_value;

    row_value res;
    res.fields.reserve((std::min)(static_cast<std::size_t>(num_fields), ctx.size() / 8u));
    for (std::int32_t i = 0; i < num_fields; ++i)
    {
        auto field_oid = ctx.get_integral<std::int32_t>();
        auto field = ctx.get_nullable_bytes();
        if (ctx.error())
            return client_errc::invalid_field_value;
        value field_value;
        if (auto ec = table.decode_binary(field_oid, field, field_value))
            return ec;
        res.fields.push_back(std::move(field_value));
    }
    if (ctx.check())
        return client_errc::invalid_field_value;
    to = std::move(res);
    return {};
}

// Rebuilds the dimensions of a flat list of elements
array_value nest_elements(std::span<const std::int32_t> dims, std::vector<value>::iterator& it)
{
    array_value res;
    res.elements.reserve(static_cast<std::size_t>(dims[0]));
    for (std::int32_t i = 0; i < dims[0]; ++i)
    {
        if (dims.size() == 1u)
            res.elements.push_back(std::move(*it++));
        else
            res.elements.push_back(nest_elements(dims.subspan(1), it));
    }
    return res;
}

error_code decode_array(std::span<const unsigned char> data, std::int32_t, const read_table& table, value& to)
{
    parse_context ctx(data);
    auto ndims = ctx.get_integral<std::int32_t>();
    auto flags = ctx.get_integral<std::int32_t>();
    auto element_oid = ctx.get_integral<std::int32_t>();
    if (ctx.error() || ndims < 0 || ndims > max_array_dimensions || (flags != 0 && flags != 1))
        return client_errc::invalid_field_value;

    std::vector<std::int32_t> dims;
    std::uint64_t total = ndims == 0 ? 0u : 1u;
    for (std::int32_t i = 0; i < ndims; ++i)
    {
        auto size = ctx.get_integral<std::int32_t>();
        ctx.get_integral<std::int32_t>();  // lower bound
        if (ctx.error() || size < 0)
            return client_errc::invalid_field_value;
        dims.push_back(size);
        total *= static_cast<std::uint64_t>(size);

        // Each element takes at least its length prefix
        if (total > ctx.size() / 4u)
            return client_errc::invalid_field_value;
    }

    std::vector<value> flat;
    flat.reserve(static_cast<std::size_t>(total));
    for (std::uint64_t i = 0; i < total; ++i)
    {
        auto element = ctx.get_nullable_bytes();
        if (ctx.error())
            return client_errc::invalid_field_value;
        value element_value;
        if (auto ec = table.decode_binary(element_oid, element, element_value))
            return ec;
        flat.push_back(std::move(element_value));
    }
    if (ctx.check())
        return client_errc::invalid_field_value;

    if (total == 0u)
    {
        to = array_value{};
        return {};
    }
    auto it = flat.begin();
    to = nest_elements(dims, it);
    return {};
}

//
// Encoders
//
error_code encode_bool(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    const auto* b = from.get_if<bool>();
    if (!b)
        return client_errc::incompatible_parameter_type;
    to.push_back(*b ? 1u : 0u);
    return {};
}

template <class T>
error_code encode_integer(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    T res{};
    if (auto ec = detail::value_to_integer(from, res))
        return ec;
    append_integral(to, res);
    return {};
}

// Floating point columns accept any numeric alternative, possibly losing precision
std::optional<double> to_double(const value& from)
{
    return boost::variant2::visit(
        [](const auto& alt) -> std::optional<double> {
            using T = std::decay_t<decltype(alt)>;
            if constexpr ((std::is_arithmetic_v<T> && !std::is_same_v<T, bool>))
                return static_cast<double>(alt);
            else if constexpr (std::is_same_v<T, numeric>)
                return alt.template convert_to<double>();
            else
                return std::nullopt;
        },
        from.variant()
    );
}

error_code encode_float4(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    auto d = to_double(from);
    if (!d)
        return client_errc::incompatible_parameter_type;
    append_integral(to, std::bit_cast<std::uint32_t>(static_cast<float>(*d)));
    return {};
}

error_code encode_float8(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    auto d = to_double(from);
    if (!d)
        return client_errc::incompatible_parameter_type;
    append_integral(to, std::bit_cast<std::uint64_t>(*d));
    return {};
}

void append_string(std::string_view s, std::vector<unsigned char>& to)
{
    to.insert(to.end(), s.begin(), s.end());
}

error_code encode_string(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    const auto* s = from.get_if<std::string>();
    if (!s)
        return client_errc::incompatible_parameter_type;
    if (!detail::is_valid_utf8(*s))
        return client_errc::invalid_utf8;
    append_string(*s, to);
    return {};
}

error_code encode_char(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    const auto* s = from.get_if<std::string>();
    if (!s || s->size() > 1u)
        return client_errc::incompatible_parameter_type;
    append_string(*s, to);
    return {};
}

error_code encode_jsonb(const value& from, std::int32_t oid, const read_table& table, std::vector<unsigned char>& to)
{
    to.push_back(1u);  // version
    return encode_string(from, oid, table, to);
}

error_code encode_bytea(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    if (const auto* b = from.get_if<bytes>())
        to.insert(to.end(), b->begin(), b->end());
    else if (const auto* s = from.get_if<std::string>())
        append_string(*s, to);
    else
        return client_errc::incompatible_parameter_type;
    return {};
}

error_code encode_uuid(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    uuid res{};
    if (const auto* u = from.get_if<uuid>())
        res = *u;
    else if (const auto* s = from.get_if<std::string>())
    {
        if (detail::parse_uuid(*s, res))
            return client_errc::incompatible_parameter_type;
    }
    else
        return client_errc::incompatible_parameter_type;
    to.insert(to.end(), res.begin(), res.end());
    return {};
}

error_code encode_point(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    const auto* p = from.get_if<point>();
    if (!p)
        return client_errc::incompatible_parameter_type;
    append_integral(to, std::bit_cast<std::uint64_t>(p->x));
    append_integral(to, std::bit_cast<std::uint64_t>(p->y));
    return {};
}

error_code encode_bit_string(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    const auto* b = from.get_if<bit_string>();
    if (!b)
        return client_errc::incompatible_parameter_type;
    if (b->bits.size() > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)()))
        return client_errc::value_too_big;
    append_integral(to, static_cast<std::int32_t>(b->bits.size()));
    auto offset = to.size();
    to.resize(offset + (b->bits.size() + 7u) / 8u, 0u);
    for (std::size_t i = 0; i < b->bits.size(); ++i)
    {
        if (b->bits[i])
            to[offset + i / 8u] |= static_cast<unsigned char>(0x80u >> (i % 8u));
    }
    return {};
}

// Writes a decimal string ("-123.4500") as base 10000 digits
void append_numeric_digits(std::string_view decimal, std::vector<unsigned char>& to)
{
    bool negative = !decimal.empty() && decimal.front() == '-';
    if (negative)
        decimal.remove_prefix(1);
    auto point_pos = decimal.find('.');
    std::string_view int_part = decimal.substr(0, point_pos);
    std::string_view frac_part = point_pos == std::string_view::npos ? std::string_view()
                                                                     : decimal.substr(point_pos + 1);

    // Pad both parts to a multiple of 4 digits, aligned on the decimal point
    std::string digits((4u - int_part.size() % 4u) % 4u, '0');
    digits.append(int_part);
    std::size_t int_groups = digits.size() / 4u;
    digits.append(frac_part);
    digits.append((4u - frac_part.size() % 4u) % 4u, '0');

    std::vector<std::int16_t> groups;
    for (std::size_t i = 0; i < digits.size(); i += 4u)
    {
        groups.push_back(static_cast<std::int16_t>(
            (digits[i] - '0') * 1000 + (digits[i + 1] - '0') * 100 + (digits[i + 2] - '0') * 10 +
            (digits[i + 3] - '0')
        ));
    }

    // Strip zero groups at both ends. Leading ones lower the weight
    int weight = static_cast<int>(int_groups) - 1;
    std::size_t first = 0u;
    while (first < groups.size() && groups[first] == 0)
    {
        ++first;
        --weight;
    }
    std::size_t last = groups.size();
    while (last > first && groups[last - 1] == 0)
        --last;
    if (first == last)
        weight = 0;

    append_integral(to, static_cast<std::int16_t>(last - first));
    append_integral(to, static_cast<std::int16_t>(weight));
    append_integral(to, (negative && first != last) ? numeric_neg : numeric_pos);
    append_integral(to, static_cast<std::int16_t>(frac_part.size()));
    for (std::size_t i = first; i < last; ++i)
        append_integral(to, groups[i]);
}

void append_numeric_special(std::uint16_t sign, std::vector<unsigned char>& to)
{
    append_integral(to, std::int16_t(0));
    append_integral(to, std::int16_t(0));
    append_integral(to, sign);
    append_integral(to, std::int16_t(0));
}

error_code encode_numeric(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    numeric exact;
    if (const auto* n = from.get_if<numeric>())
    {
        exact = *n;
    }
    else if (from.is<float>() || from.is<double>())
    {
        double d = from.is<float>() ? from.as<float>() : from.as<double>();
        if (std::isnan(d))
        {
            append_numeric_special(numeric_nan, to);
            return {};
        }
        if (std::isinf(d))
        {
            append_numeric_special(d > 0 ? numeric_pinf : numeric_ninf, to);
            return {};
        }

        // The shortest representation that round-trips, as the server does
        char buff[64];
        auto res = std::to_chars(buff, buff + sizeof(buff), d);
        if (res.ec != std::errc() || detail::parse_decimal(std::string_view(buff, res.ptr), exact))
            return client_errc::incompatible_parameter_type;
    }
    else
    {
        std::int64_t i{};
        if (detail::value_to_integer(from, i))
            return client_errc::incompatible_parameter_type;
        exact = i;
    }

    std::string decimal;
    if (!detail::to_decimal_string(exact, decimal))
        return client_errc::incompatible_parameter_type;
    append_numeric_digits(decimal, to);
    return {};
}

error_code encode_date(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    const auto* d = from.get_if<date>();
    if (!d)
        return client_errc::incompatible_parameter_type;
    std::int32_t days{};
    if (*d == (date::max)())
        days = (std::numeric_limits<std::int32_t>::max)();
    else if (*d == (date::min)())
        days = (std::numeric_limits<std::int32_t>::min)();
    else
    {
        auto count = (*d - detail::pg_epoch_date).count();
        if (!std::in_range<std::int32_t>(count))
            return client_errc::incompatible_parameter_type;
        days = static_cast<std::int32_t>(count);
    }
    append_integral(to, days);
    return {};
}

error_code encode_time(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    const auto* t = from.get_if<time_of_day>();
    if (!t || *t < time_of_day::zero() || *t > std::chrono::hours(24))
        return client_errc::incompatible_parameter_type;
    append_integral(to, static_cast<std::int64_t>(t->count()));
    return {};
}

template <class TimePoint>
error_code encode_time_point(const value& from, TimePoint epoch, std::vector<unsigned char>& to)
{
    const auto* tp = from.get_if<TimePoint>();
    if (!tp)
        return client_errc::incompatible_parameter_type;
    std::int64_t us{};
    if (*tp == (TimePoint::max)())
        us = (std::numeric_limits<std::int64_t>::max)();
    else if (*tp == (TimePoint::min)())
        us = (std::numeric_limits<std::int64_t>::min)();
    else
        us = (*tp - epoch).count();
    append_integral(to, us);
    return {};
}

error_code encode_timestamp(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    return encode_time_point(from, detail::pg_epoch_timestamp(), to);
}

error_code encode_timestamptz(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    return encode_time_point(from, detail::pg_epoch_timestamptz(), to);
}

error_code encode_interval(const value& from, std::int32_t, const read_table&, std::vector<unsigned char>& to)
{
    const auto* i = from.get_if<interval>();
    if (!i)
        return client_errc::incompatible_parameter_type;
    append_integral(to, static_cast<std::int64_t>(i->time.count()));
    append_integral(to, i->days);
    append_integral(to, i->months);
    return {};
}

// Checks that a nested array is rectangular, with the dimensions of its first elements,
// and collects its leaf elements in row-major order
error_code flatten_array(
    const array_value& arr,
    std::size_t level,
    std::span<const std::int32_t> dims,
    std::vector<const value*>& leaves
)
{
    if (static_cast<std::int32_t>(arr.elements.size()) != dims[level])
        return client_errc::incompatible_parameter_type;
    bool has_children = level + 1u < dims.size();
    for (const auto& elm : arr.elements)
    {
        const auto* child = elm.get_if<array_value>();
        if (has_children != (child != nullptr))
            return client_errc::incompatible_parameter_type;
        if (child)
        {
            if (auto ec = flatten_array(*child, level + 1u, dims, leaves))
                return ec;
        }
        else
        {
            leaves.push_back(&elm);
        }
    }
    return {};
}

error_code encode_array(const value& from, std::int32_t oid, const read_table& table, std::vector<unsigned char>& to)
{
    const auto* arr = from.get_if<array_value>();
    if (!arr)
        return client_errc::incompatible_parameter_type;
    auto element_oid = table.element_type(oid);
    if (!element_oid)
        return client_errc::unknown_type_oid;

    // Dimensions are given by the first element at each level
    std::vector<std::int32_t> dims;
    for (const array_value* level = arr; level;)
    {
        if (level->elements.size() > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)()))
            return client_errc::value_too_big;
        if (dims.size() == static_cast<std::size_t>(max_array_dimensions))
            return client_errc::incompatible_parameter_type;
        dims.push_back(static_cast<std::int32_t>(level->elements.size()));
        level = level->elements.empty() ? nullptr : level->elements.front().get_if<array_value>();
    }

    std::vector<const value*> leaves;
    if (auto ec = flatten_array(*arr, 0u, dims, leaves))
        return ec;

    // Empty arrays have no dimensions
    if (leaves.empty())
        dims.clear();
    bool has_nulls = std::any_of(leaves.begin(), leaves.end(), [](const value* v) { return v->is_null(); });

    append_integral(to, static_cast<std::int32_t>(dims.size()));
    append_integral(to, static_cast<std::int32_t>(has_nulls ? 1 : 0));
    append_integral(to, *element_oid);
    for (auto dim : dims)
    {
        append_integral(to, dim);
        append_integral(to, std::int32_t(1));  // lower bound
    }
    for (const value* elm : leaves)
    {
        if (elm->is_null())
        {
            append_integral(to, std::int32_t(-1));
            continue;
        }
        auto offset = to.size();
        to.resize(offset + 4u);
        if (auto ec = table.encode_binary(*element_oid, *elm, to))
            return ec;
        auto length = to.size() - offset - 4u;
        if (length > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)()))
            return client_errc::value_too_big;
        boost::endian::store_big_s32(to.data() + offset, static_cast<std::int32_t>(length));
    }
    return {};
}

void set(read_table& table, pg_oid_type oid, binary_decoder dec, binary_encoder enc)
{
    table.set_codec(types::to_oid(oid), type_codec{std::move(dec), std::move(enc), {}});
}

}  // namespace

void pgwire::detail::register_binary_codecs(read_table& table)
{
    set(table, pg_oid_type::bool_, decode_bool, encode_bool);
    set(table, pg_oid_type::int2, decode_integer<std::int16_t>, encode_integer<std::int16_t>);
    set(table, pg_oid_type::int4, decode_integer<std::int32_t>, encode_integer<std::int32_t>);
    set(table, pg_oid_type::int8, decode_integer<std::int64_t>, encode_integer<std::int64_t>);
    set(table, pg_oid_type::money, decode_integer<std::int64_t>, encode_integer<std::int64_t>);
    for (auto oid : {pg_oid_type::oid, pg_oid_type::xid, pg_oid_type::cid, pg_oid_type::regproc})
        set(table, oid, decode_integer<std::uint32_t>, encode_integer<std::uint32_t>);
    set(table, pg_oid_type::float4, decode_float4, encode_float4);
    set(table, pg_oid_type::float8, decode_float8, encode_float8);
    set(table, pg_oid_type::numeric, decode_numeric, encode_numeric);

    for (auto oid :
         {pg_oid_type::text,
          pg_oid_type::varchar,
          pg_oid_type::bpchar,
          pg_oid_type::name,
          pg_oid_type::json,
          pg_oid_type::xml,
          pg_oid_type::unknown})
        set(table, oid, decode_string, encode_string);
    set(table, pg_oid_type::char_, decode_char, encode_char);
    set(table, pg_oid_type::jsonb, decode_jsonb, encode_jsonb);

    set(table, pg_oid_type::bytea, decode_bytea, encode_bytea);
    set(table, pg_oid_type::uuid, decode_uuid, encode_uuid);
    set(table, pg_oid_type::point, decode_point, encode_point);
    set(table, pg_oid_type::bit, decode_bit_string, encode_bit_string);
    set(table, pg_oid_type::varbit, decode_bit_string, encode_bit_string);

    set(table, pg_oid_type::date, decode_date, encode_date);
    set(table, pg_oid_type::time, decode_time, encode_time);
    set(table, pg_oid_type::timestamp, decode_timestamp, encode_timestamp);
    set(table, pg_oid_type::timestamptz, decode_timestamptz, encode_timestamptz);
    set(table, pg_oid_type::interval, decode_interval, encode_interval);

    set(table, pg_oid_type::record, decode_record, {});

    // Arrays share a decoder, since elements carry their OID.
    // The encoder gets the element OID from the table
    const std::pair<pg_oid_type, pg_oid_type> arrays[] = {
        {pg_oid_type::bool_array,        pg_oid_type::bool_      },
        {pg_oid_type::bytea_array,       pg_oid_type::bytea      },
        {pg_oid_type::char_array,        pg_oid_type::char_      },
        {pg_oid_type::name_array,        pg_oid_type::name       },
        {pg_oid_type::int2_array,        pg_oid_type::int2       },
        {pg_oid_type::int4_array,        pg_oid_type::int4       },
        {pg_oid_type::regproc_array,     pg_oid_type::regproc    },
        {pg_oid_type::text_array,        pg_oid_type::text       },
        {pg_oid_type::xid_array,         pg_oid_type::xid        },
        {pg_oid_type::cid_array,         pg_oid_type::cid        },
        {pg_oid_type::bpchar_array,      pg_oid_type::bpchar     },
        {pg_oid_type::varchar_array,     pg_oid_type::varchar    },
        {pg_oid_type::int8_array,        pg_oid_type::int8       },
        {pg_oid_type::point_array,       pg_oid_type::point      },
        {pg_oid_type::float4_array,      pg_oid_type::float4     },
        {pg_oid_type::float8_array,      pg_oid_type::float8     },
        {pg_oid_type::oid_array,         pg_oid_type::oid        },
        {pg_oid_type::money_array,       pg_oid_type::money      },
        {pg_oid_type::xml_array,         pg_oid_type::xml        },
        {pg_oid_type::json_array,        pg_oid_type::json       },
        {pg_oid_type::date_array,        pg_oid_type::date       },
        {pg_oid_type::time_array,        pg_oid_type::time       },
        {pg_oid_type::timestamp_array,   pg_oid_type::timestamp  },
        {pg_oid_type::timestamptz_array, pg_oid_type::timestamptz},
        {pg_oid_type::interval_array,    pg_oid_type::interval   },
        {pg_oid_type::bit_array,         pg_oid_type::bit        },
        {pg_oid_type::varbit_array,      pg_oid_type::varbit     },
        {pg_oid_type::numeric_array,     pg_oid_type::numeric    },
        {pg_oid_type::record_array,      pg_oid_type::record     },
        {pg_oid_type::uuid_array,        pg_oid_type::uuid       },
        {pg_oid_type::jsonb_array,       pg_oid_type::jsonb      },
    };
    for (const auto& [array_oid, element_oid] : arrays)
    {
        set(table, array_oid, decode_array, encode_array);
        table.set_array_type(types::to_oid(array_oid), types::to_oid(element_oid));
    }
}
