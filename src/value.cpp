//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/system/error_code.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>

#include "codecs.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/sql_literal.hpp"
#include "pgwire/value.hpp"

using namespace pgwire;
using boost::multiprecision::cpp_int;
using boost::system::error_code;

std::string_view pgwire::kind_name(const value& v) noexcept
{
    constexpr std::string_view names[] = {
        "null",
        "bool",
        "int2",
        "int4",
        "int8",
        "oid",
        "float4",
        "float8",
        "numeric",
        "text",
        "bytea",
        "bit",
        "point",
        "uuid",
        "date",
        "time",
        "timestamp",
        "timestamptz",
        "interval",
        "array",
        "record",
    };
    static_assert(std::size(names) == boost::variant2::variant_size_v<value::variant_type>);
    return names[v.variant().index()];
}

std::ostream& pgwire::operator<<(std::ostream& os, const value& v) { return os << to_sql_string(v).text; }

bool pgwire::detail::is_valid_utf8(std::string_view s) noexcept
{
    std::size_t i = 0;
    while (i < s.size())
    {
        auto c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80u)
        {
            ++i;
            continue;
        }
        else if ((c & 0xe0u) == 0xc0u)
        {
            len = 2;
            cp = c & 0x1fu;
        }
        else if ((c & 0xf0u) == 0xe0u)
        {
            len = 3;
            cp = c & 0x0fu;
        }
        else if ((c & 0xf8u) == 0xf0u)
        {
            len = 4;
            cp = c & 0x07u;
        }
        else
        {
            return false;
        }

        if (s.size() - i < len)
            return false;
        for (std::size_t j = 1; j < len; ++j)
        {
            auto cont = static_cast<unsigned char>(s[i + j]);
            if ((cont & 0xc0u) != 0x80u)
                return false;
            cp = (cp << 6) | (cont & 0x3fu);
        }

        // Overlong encodings, surrogates and out of range code points
        constexpr std::uint32_t min_cp[] = {0u, 0u, 0x80u, 0x800u, 0x10000u};
        if (cp < min_cp[len] || cp > 0x10ffffu || (cp >= 0xd800u && cp <= 0xdfffu))
            return false;
        i += len;
    }
    return true;
}

error_code pgwire::detail::parse_decimal(std::string_view s, numeric& to)
{
    bool negative = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+'))
    {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }

    // Mantissa digits, and the number of them after the point
    cpp_int mantissa = 0;
    std::int64_t exponent = 0;
    bool seen_point = false, seen_digit = false;
    std::size_t i = 0;
    for (; i < s.size(); ++i)
    {
        char c = s[i];
        if (c >= '0' && c <= '9')
        {
            mantissa = mantissa * 10 + (c - '0');
            seen_digit = true;
            if (seen_point)
                --exponent;
        }
        else if (c == '.' && !seen_point)
        {
            seen_point = true;
        }
        else
        {
            break;
        }
    }
    if (!seen_digit)
        return client_errc::invalid_field_value;

    if (i < s.size())
    {
        if (s[i] != 'e' && s[i] != 'E')
            return client_errc::invalid_field_value;
        auto exp_str = s.substr(i + 1);
        if (!exp_str.empty() && exp_str.front() == '+')
            exp_str.remove_prefix(1);
        int exp_value{};
        auto res = std::from_chars(exp_str.data(), exp_str.data() + exp_str.size(), exp_value);
        if (exp_str.empty() || res.ec != std::errc() || res.ptr != exp_str.data() + exp_str.size())
            return client_errc::invalid_field_value;

        // The server limits numeric to about 16k digits after the point
        if (exp_value > 1000000 || exp_value < -1000000)
            return client_errc::invalid_field_value;
        exponent += exp_value;
    }

    cpp_int scale = boost::multiprecision::pow(cpp_int(10), static_cast<unsigned>(exponent < 0 ? -exponent : exponent));
    numeric res = exponent >= 0 ? numeric(cpp_int(mantissa * scale)) : numeric(mantissa, scale);
    to = negative ? numeric(-res) : res;
    return {};
}

bool pgwire::detail::to_decimal_string(const numeric& v, std::string& to)
{
    cpp_int num = numerator(v);
    cpp_int den = denominator(v);

    // A fraction has a finite decimal expansion if its denominator has no prime factors but 2 and 5
    unsigned twos = 0u, fives = 0u;
    while (den % 2 == 0)
    {
        den /= 2;
        ++twos;
    }
    while (den % 5 == 0)
    {
        den /= 5;
        ++fives;
    }
    if (den != 1)
        return false;

    unsigned scale = twos > fives ? twos : fives;
    bool negative = num < 0;
    if (negative)
        num = -num;
    cpp_int scaled = num * boost::multiprecision::pow(cpp_int(10), scale) / denominator(v);

    std::string digits = scaled.str();
    if (digits.size() <= scale)
        digits.insert(0, scale + 1u - digits.size(), '0');

    to.clear();
    if (negative)
        to.push_back('-');
    to.append(digits, 0, digits.size() - scale);
    if (scale > 0u)
    {
        to.push_back('.');
        to.append(digits, digits.size() - scale, std::string::npos);
    }
    return true;
}

error_code pgwire::detail::parse_uuid(std::string_view s, uuid& to)
{
    if (s.size() >= 2u && s.front() == '{' && s.back() == '}')
        s = s.substr(1, s.size() - 2u);

    auto hex_value = [](char c) {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    std::size_t out = 0u;
    for (std::size_t i = 0; i < s.size();)
    {
        if (s[i] == '-')
        {
            ++i;
            continue;
        }
        if (out == to.size() || i + 1u >= s.size())
            return client_errc::invalid_field_value;
        int hi = hex_value(s[i]), lo = hex_value(s[i + 1]);
        if (hi < 0 || lo < 0)
            return client_errc::invalid_field_value;
        to[out++] = static_cast<unsigned char>(hi * 16 + lo);
        i += 2u;
    }
    return out == to.size() ? error_code() : error_code(client_errc::invalid_field_value);
}
