//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/variant2/variant.hpp>

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <type_traits>

#include "codecs.hpp"
#include "pgwire/sql_literal.hpp"
#include "pgwire/value.hpp"

using namespace pgwire;

namespace {

template <class T>
void append_number(std::string& to, T v)
{
    char buff[64];
    auto res = std::to_chars(buff, buff + sizeof(buff), v);
    to.append(buff, res.ptr);
}

// Appends a zero-padded integer
void append_padded(std::string& to, long long v, int width)
{
    char buff[32];
    int n = std::snprintf(buff, sizeof(buff), "%0*lld", width, v);
    to.append(buff, n);
}

// YYYY-MM-DD, without the BC suffix
bool append_date(std::string& to, date d)
{
    std::chrono::year_month_day ymd{d};
    int year = static_cast<int>(ymd.year());
    bool bc = year <= 0;
    append_padded(to, bc ? 1 - year : year, 4);
    to.push_back('-');
    append_padded(to, static_cast<unsigned>(ymd.month()), 2);
    to.push_back('-');
    append_padded(to, static_cast<unsigned>(ymd.day()), 2);
    return bc;
}

// HH:MM:SS[.ffffff]. Hours may exceed 24
void append_time(std::string& to, std::chrono::microseconds t)
{
    if (t < std::chrono::microseconds::zero())
    {
        to.push_back('-');
        t = -t;
    }
    auto h = std::chrono::duration_cast<std::chrono::hours>(t);
    auto m = std::chrono::duration_cast<std::chrono::minutes>(t - h);
    auto s = std::chrono::duration_cast<std::chrono::seconds>(t - h - m);
    auto us = t - h - m - s;
    append_padded(to, h.count(), 2);
    to.push_back(':');
    append_padded(to, m.count(), 2);
    to.push_back(':');
    append_padded(to, s.count(), 2);
    if (us.count() != 0)
    {
        to.push_back('.');
        append_padded(to, us.count(), 6);
        while (to.back() == '0')
            to.pop_back();
    }
}

// days since the unix epoch, and the time within the day
void append_timestamp(std::string& to, std::chrono::microseconds since_epoch, bool utc)
{
    auto days = std::chrono::floor<std::chrono::days>(since_epoch);
    bool bc = append_date(to, date(days));
    to.push_back(' ');
    append_time(to, since_epoch - days);
    if (utc)
        to.append("+00");
    if (bc)
        to.append(" BC");
}

// Array elements and record fields are quoted if they contain special characters
void append_element(std::string& to, const sql_string& elm, bool is_null, std::string_view specials)
{
    if (is_null)
    {
        to.append("NULL");
        return;
    }
    bool quote = elm.text.empty() || elm.text.find_first_of(specials) != std::string::npos ||
                 (elm.needs_quoting && elm.text == "NULL");
    if (!quote)
    {
        to.append(elm.text);
        return;
    }
    to.push_back('"');
    for (char c : elm.text)
    {
        if (c == '"' || c == '\\')
            to.push_back('\\');
        to.push_back(c);
    }
    to.push_back('"');
}

struct formatter
{
    sql_string operator()(null_t) const { return {"NULL", false}; }
    sql_string operator()(bool v) const { return {v ? "true" : "false", false}; }

    template <class T>
        requires std::is_integral_v<T>
    sql_string operator()(T v) const
    {
        sql_string res;
        append_number(res.text, v);
        return res;
    }

    template <class T>
        requires std::is_floating_point_v<T>
    sql_string operator()(T v) const
    {
        if (std::isnan(v))
            return {"NaN", true};
        if (std::isinf(v))
            return {v > 0 ? "Infinity" : "-Infinity", true};
        sql_string res;
        append_number(res.text, v);
        return res;
    }

    sql_string operator()(const numeric& v) const
    {
        sql_string res;
        if (!detail::to_decimal_string(v, res.text))
        {
            res.text = "(" + numerator(v).str() + "::numeric / " + denominator(v).str() + ")";
        }
        return res;
    }

    sql_string operator()(const std::string& v) const { return {v, true}; }

    sql_string operator()(const bytes& v) const
    {
        constexpr char hex_digits[] = "0123456789abcdef";
        sql_string res{"\\x", true};
        for (unsigned char c : v)
        {
            res.text.push_back(hex_digits[c >> 4]);
            res.text.push_back(hex_digits[c & 0x0f]);
        }
        return res;
    }

    sql_string operator()(const bit_string& v) const
    {
        sql_string res{{}, true};
        for (bool b : v.bits)
            res.text.push_back(b ? '1' : '0');
        return res;
    }

    sql_string operator()(const point& v) const
    {
        sql_string res{"(", true};
        append_number(res.text, v.x);
        res.text.push_back(',');
        append_number(res.text, v.y);
        res.text.push_back(')');
        return res;
    }

    sql_string operator()(const uuid& v) const
    {
        constexpr char hex_digits[] = "0123456789abcdef";
        sql_string res{{}, true};
        for (std::size_t i = 0; i < v.size(); ++i)
        {
            if (i == 4u || i == 6u || i == 8u || i == 10u)
                res.text.push_back('-');
            res.text.push_back(hex_digits[v[i] >> 4]);
            res.text.push_back(hex_digits[v[i] & 0x0f]);
        }
        return res;
    }

    sql_string operator()(date v) const
    {
        if (v == (date::max)())
            return {"infinity", true};
        if (v == (date::min)())
            return {"-infinity", true};
        sql_string res{{}, true};
        if (append_date(res.text, v))
            res.text.append(" BC");
        return res;
    }

    sql_string operator()(time_of_day v) const
    {
        sql_string res{{}, true};
        append_time(res.text, v);
        return res;
    }

    sql_string operator()(timestamp v) const
    {
        if (v == (timestamp::max)())
            return {"infinity", true};
        if (v == (timestamp::min)())
            return {"-infinity", true};
        sql_string res{{}, true};
        append_timestamp(res.text, v.time_since_epoch(), false);
        return res;
    }

    sql_string operator()(timestamptz v) const
    {
        if (v == (timestamptz::max)())
            return {"infinity", true};
        if (v == (timestamptz::min)())
            return {"-infinity", true};
        sql_string res{{}, true};
        append_timestamp(res.text, v.time_since_epoch(), true);
        return res;
    }

    sql_string operator()(const interval& v) const
    {
        sql_string res{{}, true};
        append_number(res.text, v.months);
        res.text.append(" mons ");
        append_number(res.text, v.days);
        res.text.append(" days ");
        append_time(res.text, v.time);
        return res;
    }

    sql_string operator()(const array_value& v) const
    {
        sql_string res{"{", true};
        bool first = true;
        for (const auto& elm : v.elements)
        {
            if (!first)
                res.text.push_back(',');
            first = false;
            if (const auto* child = elm.get_if<array_value>())
                res.text.append((*this)(*child).text);
            else
                append_element(res.text, to_sql_string(elm), elm.is_null(), "{},\"\\ \t\n\r");
        }
        res.text.push_back('}');
        return res;
    }

    sql_string operator()(const row_value& v) const
    {
        sql_string res{"(", true};
        bool first = true;
        for (const auto& elm : v.fields)
        {
            if (!first)
                res.text.push_back(',');
            first = false;
            // NULL fields are empty
            if (!elm.is_null())
                append_element(res.text, to_sql_string(elm), false, "(),\"\\ \t\n\r");
        }
        res.text.push_back(')');
        return res;
    }
};

}  // namespace

sql_string pgwire::to_sql_string(const value& v) { return boost::variant2::visit(formatter{}, v.variant()); }

std::string pgwire::quote_literal(std::string_view s)
{
    bool has_backslash = s.find('\\') != std::string_view::npos;
    std::string res;
    res.reserve(s.size() + 3u);
    if (has_backslash)
        res.push_back('E');
    res.push_back('\'');
    for (char c : s)
    {
        if (c == '\'' || c == '\\')
            res.push_back(c);
        res.push_back(c);
    }
    res.push_back('\'');
    return res;
}

std::string pgwire::quote_identifier(std::string_view s)
{
    std::string res;
    res.reserve(s.size() + 2u);
    res.push_back('"');
    for (char c : s)
    {
        if (c == '"')
            res.push_back(c);
        res.push_back(c);
    }
    res.push_back('"');
    return res;
}

std::string pgwire::to_sql_literal(const value& v)
{
    auto res = to_sql_string(v);
    return res.needs_quoting ? quote_literal(res.text) : std::move(res.text);
}
