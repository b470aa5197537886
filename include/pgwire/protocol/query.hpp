//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_QUERY_HPP
#define PGWIRE_PROTOCOL_QUERY_HPP

#include <boost/system/error_code.hpp>

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "pgwire/protocol/common.hpp"
#include "pgwire/protocol/views.hpp"

namespace pgwire {
namespace protocol {

namespace detail {

template <>
struct forward_traits<std::optional<std::span<const unsigned char>>>
{
    static std::optional<std::span<const unsigned char>> dereference(const unsigned char* data);
    static const unsigned char* advance(const unsigned char* data);
};

}  // namespace detail

struct query
{
    // The query string itself. May contain several statements separated by semicolons
    std::string_view query;
};
boost::system::error_code serialize(query msg, std::vector<unsigned char>& to);

struct command_complete
{
    // The command tag. This is usually a single word that identifies which SQL command was completed.
    std::string_view tag;
};
boost::system::error_code parse(std::span<const unsigned char> data, command_complete& to);

struct data_row
{
    // The actual values. Contains a an optional<span<const unsigned char>> per column,
    // containing the serialized value, or an empty optional, if the field is NULL
    forward_parsing_view<std::optional<std::span<const unsigned char>>> columns;
};
boost::system::error_code parse(std::span<const unsigned char> data, data_row& to);

struct empty_query_response
{
};
inline boost::system::error_code parse(std::span<const unsigned char> data, empty_query_response&)
{
    return detail::check_empty(data);
}

enum class transaction_status : unsigned char
{
    // not in a transaction block
    idle = 'I',

    // in a transaction block
    in_transaction = 'T',

    // in a failed transaction block (queries will be rejected until block is ended)
    failed = 'E',
};

struct ready_for_query
{
    // Current backend transaction status indicator
    transaction_status status;
};
boost::system::error_code parse(std::span<const unsigned char> data, ready_for_query& to);

}  // namespace protocol
}  // namespace pgwire

#endif
