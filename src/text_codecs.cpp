//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "codecs.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/types/oid.hpp"
#include "pgwire/value.hpp"

using namespace pgwire;
using boost::system::error_code;
using types::pg_oid_type;

// Text decoders assume the default server settings for output formats:
// DateStyle ISO, IntervalStyle postgres, bytea_output hex (escape is accepted, too)

namespace {

bool iequals(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        char l = lhs[i] >= 'A' && lhs[i] <= 'Z' ? static_cast<char>(lhs[i] - 'A' + 'a') : lhs[i];
        char r = rhs[i] >= 'A' && rhs[i] <= 'Z' ? static_cast<char>(rhs[i] - 'A' + 'a') : rhs[i];
        if (l != r)
            return false;
    }
    return true;
}

// Parses the entire string as a number
template <class T>
bool parse_number(std::string_view s, T& to)
{
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    auto res = std::from_chars(s.data(), s.data() + s.size(), to);
    return res.ec == std::errc() && res.ptr == s.data() + s.size() && !s.empty();
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

//
// Scalars
//
error_code decode_bool(std::string_view s, std::int32_t, const read_table&, value& to)
{
    if (s == "t" || s == "true")
        to = true;
    else if (s == "f" || s == "false")
        to = false;
    else
        return client_errc::invalid_field_value;
    return {};
}

template <class T>
error_code decode_number(std::string_view s, std::int32_t, const read_table&, value& to)
{
    T res{};
    if (!parse_number(s, res))
        return client_errc::invalid_field_value;
    to = res;
    return {};
}

error_code decode_numeric(std::string_view s, std::int32_t, const read_table&, value& to)
{
    if (s == "NaN")
        to = std::numeric_limits<double>::quiet_NaN();
    else if (s == "Infinity")
        to = std::numeric_limits<double>::infinity();
    else if (s == "-Infinity")
        to = -std::numeric_limits<double>::infinity();
    else
    {
        numeric res;
        if (detail::parse_decimal(s, res))
            return client_errc::invalid_field_value;
        to = std::move(res);
    }
    return {};
}

error_code decode_string(std::string_view s, std::int32_t, const read_table&, value& to)
{
    if (!detail::is_valid_utf8(s))
        return client_errc::invalid_utf8;
    to = std::string(s);
    return {};
}

error_code decode_char(std::string_view s, std::int32_t, const read_table&, value& to)
{
    to = std::string(s);
    return {};
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

error_code decode_bytea(std::string_view s, std::int32_t, const read_table&, value& to)
{
    bytes res;
    if (s.starts_with("\\x"))
    {
        // Hex format
        s.remove_prefix(2);
        if (s.size() % 2u != 0u)
            return client_errc::invalid_field_value;
        res.reserve(s.size() / 2u);
        for (std::size_t i = 0; i < s.size(); i += 2u)
        {
            int hi = hex_value(s[i]), lo = hex_value(s[i + 1]);
            if (hi < 0 || lo < 0)
                return client_errc::invalid_field_value;
            res.push_back(static_cast<unsigned char>(hi * 16 + lo));
        }
    }
    else
    {
        // Escape format: \\ and \ooo octal escapes
        for (std::size_t i = 0; i < s.size();)
        {
            if (s[i] != '\\')
            {
                res.push_back(static_cast<unsigned char>(s[i++]));
            }
            else if (i + 1u < s.size() && s[i + 1] == '\\')
            {
                res.push_back('\\');
                i += 2u;
            }
            else if (
                i + 3u < s.size() && s[i + 1] >= '0' && s[i + 1] <= '3' && s[i + 2] >= '0' &&
                s[i + 2] <= '7' && s[i + 3] >= '0' && s[i + 3] <= '7'
            )
            {
                res.push_back(static_cast<unsigned char>((s[i + 1] - '0') * 64 + (s[i + 2] - '0') * 8 + (s[i + 3] - '0')));
                i += 4u;
            }
            else
            {
                return client_errc::invalid_field_value;
            }
        }
    }
    to = std::move(res);
    return {};
}

error_code decode_uuid(std::string_view s, std::int32_t, const read_table&, value& to)
{
    uuid res{};
    if (detail::parse_uuid(s, res))
        return client_errc::invalid_field_value;
    to = res;
    return {};
}

error_code decode_point(std::string_view s, std::int32_t, const read_table&, value& to)
{
    if (s.size() < 2u || s.front() != '(' || s.back() != ')')
        return client_errc::invalid_field_value;
    s = s.substr(1, s.size() - 2u);
    auto comma = s.find(',');
    point res;
    if (comma == std::string_view::npos || !parse_number(s.substr(0, comma), res.x) ||
        !parse_number(s.substr(comma + 1), res.y))
        return client_errc::invalid_field_value;
    to = res;
    return {};
}

error_code decode_bit_string(std::string_view s, std::int32_t, const read_table&, value& to)
{
    bit_string res;
    res.bits.reserve(s.size());
    for (char c : s)
    {
        if (c != '0' && c != '1')
            return client_errc::invalid_field_value;
        res.bits.push_back(c == '1');
    }
    to = std::move(res);
    return {};
}

//
// Date and time
//

// Removes the " BC" suffix of dates before year 1
bool remove_bc_suffix(std::string_view& s)
{
    if (s.ends_with(" BC"))
    {
        s.remove_suffix(3);
        return true;
    }
    return false;
}

// YYYY-MM-DD. The year may have more than 4 digits
bool parse_date(std::string_view s, bool bc, date& to)
{
    auto first_dash = s.find('-');
    if (first_dash == std::string_view::npos || s.size() != first_dash + 6u || s[first_dash + 3] != '-')
        return false;
    int year{};
    unsigned month{}, day{};
    if (!parse_number(s.substr(0, first_dash), year) || !parse_number(s.substr(first_dash + 1, 2), month) ||
        !parse_number(s.substr(first_dash + 4, 2), day))
        return false;

    // There is no year 0: 1 BC is year 0 in the proleptic Gregorian calendar
    if (bc)
        year = 1 - year;
    std::chrono::year_month_day ymd{std::chrono::year(year), std::chrono::month(month), std::chrono::day(day)};
    if (!ymd.ok())
        return false;
    to = date(ymd);
    return true;
}

// HH:MM:SS[.ffffff]
bool parse_time(std::string_view s, std::chrono::microseconds& to)
{
    if (s.size() < 8u || s[2] != ':' || s[5] != ':')
        return false;
    int hours{}, minutes{}, seconds{};
    if (!parse_number(s.substr(0, 2), hours) || !parse_number(s.substr(3, 2), minutes) ||
        !parse_number(s.substr(6, 2), seconds))
        return false;
    if (hours > 24 || minutes > 59 || seconds > 60)
        return false;

    std::int64_t micros = 0;
    if (s.size() > 8u)
    {
        auto frac = s.substr(8);
        if (frac.front() != '.' || frac.size() < 2u || frac.size() > 7u)
            return false;
        frac.remove_prefix(1);
        for (char c : frac)
        {
            if (!is_digit(c))
                return false;
        }
        if (!parse_number(frac, micros))
            return false;
        for (std::size_t i = frac.size(); i < 6u; ++i)
            micros *= 10;
    }
    to = std::chrono::hours(hours) + std::chrono::minutes(minutes) + std::chrono::seconds(seconds) +
         std::chrono::microseconds(micros);
    return true;
}

// +HH[:MM[:SS]] or -HH[:MM[:SS]]
bool parse_utc_offset(std::string_view s, std::chrono::seconds& to)
{
    if (s.size() < 3u || (s[0] != '+' && s[0] != '-'))
        return false;
    bool negative = s[0] == '-';
    s.remove_prefix(1);
    int parts[3]{};
    for (std::size_t i = 0; i < 3u && !s.empty(); ++i)
    {
        if (i > 0u)
        {
            if (s[0] != ':')
                return false;
            s.remove_prefix(1);
        }
        if (s.size() < 2u || !parse_number(s.substr(0, 2), parts[i]))
            return false;
        s.remove_prefix(2);
    }
    if (!s.empty())
        return false;
    std::chrono::seconds res = std::chrono::hours(parts[0]) + std::chrono::minutes(parts[1]) +
                               std::chrono::seconds(parts[2]);
    to = negative ? -res : res;
    return true;
}

error_code decode_date(std::string_view s, std::int32_t, const read_table&, value& to)
{
    if (s == "infinity")
        to = (date::max)();
    else if (s == "-infinity")
        to = (date::min)();
    else
    {
        bool bc = remove_bc_suffix(s);
        date res;
        if (!parse_date(s, bc, res))
            return client_errc::invalid_field_value;
        to = res;
    }
    return {};
}

error_code decode_time(std::string_view s, std::int32_t, const read_table&, value& to)
{
    std::chrono::microseconds res{};
    if (!parse_time(s, res))
        return client_errc::invalid_field_value;
    to = time_of_day(res);
    return {};
}

// Splits "YYYY-MM-DD HH:MM:SS[.f][+TZ][ BC]", returning the time since the unix epoch
// in local time, and the UTC offset, if present
bool parse_timestamp(std::string_view s, bool with_offset, std::chrono::microseconds& since_epoch)
{
    bool bc = remove_bc_suffix(s);
    auto space = s.find(' ');
    if (space == std::string_view::npos)
        return false;
    auto time_part = s.substr(space + 1);

    std::chrono::seconds offset{};
    if (with_offset)
    {
        auto sign_pos = time_part.find_first_of("+-");
        if (sign_pos == std::string_view::npos || !parse_utc_offset(time_part.substr(sign_pos), offset))
            return false;
        time_part = time_part.substr(0, sign_pos);
    }

    date d;
    std::chrono::microseconds t{};
    if (!parse_date(s.substr(0, space), bc, d) || !parse_time(time_part, t))
        return false;
    since_epoch = d.time_since_epoch() + t - offset;
    return true;
}

template <class TimePoint>
error_code decode_time_point(std::string_view s, bool with_offset, value& to)
{
    if (s == "infinity")
        to = (TimePoint::max)();
    else if (s == "-infinity")
        to = (TimePoint::min)();
    else
    {
        std::chrono::microseconds since_epoch{};
        if (!parse_timestamp(s, with_offset, since_epoch))
            return client_errc::invalid_field_value;
        to = TimePoint(since_epoch);
    }
    return {};
}

error_code decode_timestamp(std::string_view s, std::int32_t, const read_table&, value& to)
{
    return decode_time_point<timestamp>(s, false, to);
}

error_code decode_timestamptz(std::string_view s, std::int32_t, const read_table&, value& to)
{
    return decode_time_point<timestamptz>(s, true, to);
}

// IntervalStyle postgres: "1 year 2 mons -3 days +04:05:06.5"
error_code decode_interval(std::string_view s, std::int32_t, const read_table&, value& to)
{
    interval res;
    while (!s.empty())
    {
        auto end = s.find(' ');
        auto token = s.substr(0, end);
        s = end == std::string_view::npos ? std::string_view() : s.substr(end + 1);

        if (token.find(':') != std::string_view::npos)
        {
            bool negative = token.front() == '-';
            if (token.front() == '-' || token.front() == '+')
                token.remove_prefix(1);

            // The hours field may exceed 24 and have more than 2 digits
            auto colon = token.find(':');
            std::int64_t hours{};
            std::chrono::microseconds rest{};
            if (colon == std::string_view::npos || !parse_number(token.substr(0, colon), hours) ||
                !parse_time("00" + std::string(token.substr(colon)), rest))
                return client_errc::invalid_field_value;
            auto total = std::chrono::hours(hours) + rest;
            res.time += negative ? -total : total;
            continue;
        }

        // A quantity followed by its unit
        std::int32_t quantity{};
        if (!parse_number(token, quantity) || s.empty())
            return client_errc::invalid_field_value;
        end = s.find(' ');
        auto unit = s.substr(0, end);
        s = end == std::string_view::npos ? std::string_view() : s.substr(end + 1);

        if (unit == "year" || unit == "years")
            res.months += quantity * 12;
        else if (unit == "mon" || unit == "mons")
            res.months += quantity;
        else if (unit == "day" || unit == "days")
            res.days += quantity;
        else
            return client_errc::invalid_field_value;
    }
    to = res;
    return {};
}

//
// Arrays and records
//
class array_parser
{
    std::string_view input_;
    std::size_t pos_{};
    std::int32_t element_oid_;
    const read_table& table_;

    bool at_end() const { return pos_ >= input_.size(); }
    char peek() const { return input_[pos_]; }

    void skip_spaces()
    {
        while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r'))
            ++pos_;
    }

    // A double-quoted element, with backslash escapes
    bool parse_quoted(std::string& to)
    {
        ++pos_;  // opening quote
        while (!at_end())
        {
            char c = input_[pos_++];
            if (c == '"')
                return true;
            if (c == '\\')
            {
                if (at_end())
                    return false;
                c = input_[pos_++];
            }
            to.push_back(c);
        }
        return false;
    }

    // An unquoted element, up to the next delimiter. Surrounding whitespace is not part of it
    bool parse_unquoted(std::string& to, bool& has_escapes)
    {
        std::size_t last_significant = 0u;
        while (!at_end() && peek() != ',' && peek() != '}')
        {
            char c = input_[pos_++];
            if (c == '"' || c == '{')
                return false;
            if (c == '\\')
            {
                if (at_end())
                    return false;
                to.push_back(input_[pos_++]);
                has_escapes = true;
                last_significant = to.size();
                continue;
            }
            to.push_back(c);
            if (c != ' ' && c != '\t')
                last_significant = to.size();
        }
        to.resize(last_significant);
        return !to.empty();
    }

    error_code decode_element(std::string_view text, value& to)
    {
        auto data = std::span<const unsigned char>(reinterpret_cast<const unsigned char*>(text.data()), text.size());
        return table_.decode_text(element_oid_, data, to);
    }

public:
    array_parser(std::string_view input, std::int32_t element_oid, const read_table& table) noexcept
        : input_(input), element_oid_(element_oid), table_(table)
    {
    }

    // Parses a {...} level, recursively
    error_code parse_level(array_value& to)
    {
        skip_spaces();
        if (at_end() || peek() != '{')
            return client_errc::invalid_field_value;
        ++pos_;
        skip_spaces();
        if (!at_end() && peek() == '}')
        {
            ++pos_;
            return {};
        }

        while (true)
        {
            skip_spaces();
            if (at_end())
                return client_errc::invalid_field_value;

            if (peek() == '{')
            {
                array_value child;
                if (auto ec = parse_level(child))
                    return ec;
                to.elements.emplace_back(std::move(child));
            }
            else
            {
                std::string text;
                value elm;
                if (peek() == '"')
                {
                    if (!parse_quoted(text))
                        return client_errc::invalid_field_value;
                    if (auto ec = decode_element(text, elm))
                        return ec;
                }
                else
                {
                    bool has_escapes = false;
                    if (!parse_unquoted(text, has_escapes))
                        return client_errc::invalid_field_value;
                    if (has_escapes || !iequals(text, "NULL"))
                    {
                        if (auto ec = decode_element(text, elm))
                            return ec;
                    }
                }
                to.elements.push_back(std::move(elm));
            }

            skip_spaces();
            if (at_end())
                return client_errc::invalid_field_value;
            char delim = input_[pos_++];
            if (delim == '}')
                return {};
            if (delim != ',')
                return client_errc::invalid_field_value;
        }
    }

    error_code parse(array_value& to)
    {
        // Arrays with non-default lower bounds carry a dimension decoration: [0:2]={1,2,3}
        if (!input_.empty() && input_.front() == '[')
        {
            auto eq = input_.find('=');
            if (eq == std::string_view::npos)
                return client_errc::invalid_field_value;
            pos_ = eq + 1u;
        }
        if (auto ec = parse_level(to))
            return ec;
        skip_spaces();
        return at_end() ? error_code() : error_code(client_errc::invalid_field_value);
    }
};

error_code decode_array(std::string_view s, std::int32_t oid, const read_table& table, value& to)
{
    // Elements of unknown type decode to their text
    array_value res;
    array_parser parser(s, table.element_type(oid).value_or(0), table);
    if (auto ec = parser.parse(res))
        return ec;
    to = std::move(res);
    return {};
}

// The text format of records doesn't carry field types, so fields decode to strings.
// Empty unquoted fields are NULL. Quotes are escaped by doubling them or with a backslash
error_code decode_record(std::string_view s, std::int32_t, const read_table&, value& to)
{
    if (s.size() < 2u || s.front() != '(' || s.back() != ')')
        return client_errc::invalid_field_value;
    s = s.substr(1, s.size() - 2u);

    row_value res;
    std::size_t i = 0u;
    while (true)
    {
        std::string field;
        bool is_null = true;
        while (i < s.size() && s[i] != ',')
        {
            is_null = false;
            if (s[i] == '"')
            {
                ++i;
                while (true)
                {
                    if (i >= s.size())
                        return client_errc::invalid_field_value;
                    if (s[i] == '"')
                    {
                        if (i + 1u < s.size() && s[i + 1] == '"')
                        {
                            field.push_back('"');
                            i += 2u;
                            continue;
                        }
                        ++i;
                        break;
                    }
                    if (s[i] == '\\' && i + 1u < s.size())
                        ++i;
                    field.push_back(s[i++]);
                }
            }
            else
            {
                if (s[i] == '\\' && i + 1u < s.size())
                    ++i;
                field.push_back(s[i++]);
            }
        }

        if (is_null)
            res.fields.emplace_back();
        else if (!detail::is_valid_utf8(field))
            return client_errc::invalid_utf8;
        else
            res.fields.emplace_back(std::move(field));

        if (i >= s.size())
            break;
        ++i;  // comma
    }
    to = std::move(res);
    return {};
}

void set_text(read_table& table, pg_oid_type oid, text_decoder dec)
{
    table.set_decoder(types::to_oid(oid), {}, std::move(dec));
}

}  // namespace

void pgwire::detail::register_text_codecs(read_table& table)
{
    set_text(table, pg_oid_type::bool_, decode_bool);
    set_text(table, pg_oid_type::int2, decode_number<std::int16_t>);
    set_text(table, pg_oid_type::int4, decode_number<std::int32_t>);
    set_text(table, pg_oid_type::int8, decode_number<std::int64_t>);
    for (auto oid : {pg_oid_type::oid, pg_oid_type::xid, pg_oid_type::cid})
        set_text(table, oid, decode_number<std::uint32_t>);
    set_text(table, pg_oid_type::float4, decode_number<float>);
    set_text(table, pg_oid_type::float8, decode_number<double>);
    set_text(table, pg_oid_type::numeric, decode_numeric);

    // regproc prints as a function name, and money depends on lc_monetary.
    // Both are returned as text
    for (auto oid :
         {pg_oid_type::text,
          pg_oid_type::varchar,
          pg_oid_type::bpchar,
          pg_oid_type::name,
          pg_oid_type::json,
          pg_oid_type::jsonb,
          pg_oid_type::xml,
          pg_oid_type::unknown,
          pg_oid_type::regproc,
          pg_oid_type::money})
        set_text(table, oid, decode_string);
    set_text(table, pg_oid_type::char_, decode_char);

    set_text(table, pg_oid_type::bytea, decode_bytea);
    set_text(table, pg_oid_type::uuid, decode_uuid);
    set_text(table, pg_oid_type::point, decode_point);
    set_text(table, pg_oid_type::bit, decode_bit_string);
    set_text(table, pg_oid_type::varbit, decode_bit_string);

    set_text(table, pg_oid_type::date, decode_date);
    set_text(table, pg_oid_type::time, decode_time);
    set_text(table, pg_oid_type::timestamp, decode_timestamp);
    set_text(table, pg_oid_type::timestamptz, decode_timestamptz);
    set_text(table, pg_oid_type::interval, decode_interval);

    set_text(table, pg_oid_type::record, decode_record);
    for (auto oid :
         {pg_oid_type::bool_array,      pg_oid_type::bytea_array,       pg_oid_type::char_array,
          pg_oid_type::name_array,      pg_oid_type::int2_array,        pg_oid_type::int4_array,
          pg_oid_type::regproc_array,   pg_oid_type::text_array,        pg_oid_type::xid_array,
          pg_oid_type::cid_array,       pg_oid_type::bpchar_array,      pg_oid_type::varchar_array,
          pg_oid_type::int8_array,      pg_oid_type::point_array,       pg_oid_type::float4_array,
          pg_oid_type::float8_array,    pg_oid_type::oid_array,         pg_oid_type::money_array,
          pg_oid_type::xml_array,       pg_oid_type::json_array,        pg_oid_type::date_array,
          pg_oid_type::time_array,      pg_oid_type::timestamp_array,   pg_oid_type::timestamptz_array,
          pg_oid_type::interval_array,  pg_oid_type::bit_array,         pg_oid_type::varbit_array,
          pg_oid_type::numeric_array,   pg_oid_type::record_array,      pg_oid_type::uuid_array,
          pg_oid_type::jsonb_array})
        set_text(table, oid, decode_array);
}
