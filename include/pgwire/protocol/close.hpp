//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_CLOSE_HPP
#define PGWIRE_PROTOCOL_CLOSE_HPP

#include <boost/system/error_code.hpp>

#include <span>
#include <string_view>
#include <vector>

#include "pgwire/protocol/common.hpp"

namespace pgwire {
namespace protocol {

struct close
{
    // Whether to close a prepared statement or a portal
    portal_or_statement type;

    // The name of the prepared statement or portal to close (an empty string selects the unnamed prepared
    // statement or portal).
    std::string_view name;
};
boost::system::error_code serialize(const close& msg, std::vector<unsigned char>& to);

struct close_complete
{
};
inline boost::system::error_code parse(std::span<const unsigned char> data, close_complete&)
{
    return detail::check_empty(data);
}

}  // namespace protocol
}  // namespace pgwire

#endif
