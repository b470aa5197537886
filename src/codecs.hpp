//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SRC_CODECS_HPP
#define PGWIRE_SRC_CODECS_HPP

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "pgwire/client_errc.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/value.hpp"

namespace pgwire {
namespace detail {

// PostgreSQL counts days and microseconds from 2000-01-01
inline constexpr std::chrono::year_month_day pg_epoch_ymd{
    std::chrono::year(2000),
    std::chrono::January,
    std::chrono::day(1)
};
inline constexpr date pg_epoch_date{pg_epoch_ymd};

inline timestamp pg_epoch_timestamp() { return timestamp(std::chrono::local_days(pg_epoch_ymd)); }
inline timestamptz pg_epoch_timestamptz() { return timestamptz(pg_epoch_date); }

inline std::string_view to_string_view(std::span<const unsigned char> data)
{
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

bool is_valid_utf8(std::string_view s) noexcept;

// Parses an optionally signed decimal number, with optional fractional part and exponent
// ("-12.50", "1e+20"). Infinities and NaN are not accepted
boost::system::error_code parse_decimal(std::string_view s, numeric& to);

// Writes the exact decimal representation of v ("-12.5"), without exponent.
// Returns false if v has no finite decimal representation (e.g. 1/3)
bool to_decimal_string(const numeric& v, std::string& to);

// Parses "a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11", with or without dashes and braces
boost::system::error_code parse_uuid(std::string_view s, uuid& to);

// Extracts an integer from any integral alternative, checking that it fits
template <class Int>
boost::system::error_code value_to_integer(const value& v, Int& to)
{
    return boost::variant2::visit(
        [&to](const auto& alt) -> boost::system::error_code {
            using T = std::decay_t<decltype(alt)>;
            if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>)
            {
                if (!std::in_range<Int>(alt))
                    return client_errc::incompatible_parameter_type;
                to = static_cast<Int>(alt);
                return {};
            }
            else if constexpr (std::is_same_v<T, numeric>)
            {
                if (denominator(alt) != 1)
                    return client_errc::incompatible_parameter_type;
                const auto& num = numerator(alt);
                if (num < (std::numeric_limits<Int>::min)() || num > (std::numeric_limits<Int>::max)())
                    return client_errc::incompatible_parameter_type;
                to = num.template convert_to<Int>();
                return {};
            }
            else
            {
                return client_errc::incompatible_parameter_type;
            }
        },
        v.variant()
    );
}

// Populate a table with the built-in codecs
void register_binary_codecs(read_table& table);
void register_text_codecs(read_table& table);

}  // namespace detail
}  // namespace pgwire

#endif
