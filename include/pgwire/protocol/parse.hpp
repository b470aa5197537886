//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_PARSE_HPP
#define PGWIRE_PROTOCOL_PARSE_HPP

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "pgwire/protocol/common.hpp"

namespace pgwire {
namespace protocol {

// The Parse message. Named parse_t to avoid clashing with the parse() functions
struct parse_t
{
    // The name of the destination prepared statement (an empty string selects the unnamed prepared
    // statement).
    std::string_view statement_name;

    // The query string to be parsed.
    std::string_view query;

    // Type OIDs for the parameters. A zero leaves the type unspecified. The server may infer
    // more parameters than the ones specified here.
    std::span<const std::int32_t> parameter_type_oids;
};
boost::system::error_code serialize(const parse_t& msg, std::vector<unsigned char>& to);

struct parse_complete
{
};
inline boost::system::error_code parse(std::span<const unsigned char> data, parse_complete&)
{
    return detail::check_empty(data);
}

}  // namespace protocol
}  // namespace pgwire

#endif
