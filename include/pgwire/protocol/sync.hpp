//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_SYNC_HPP
#define PGWIRE_PROTOCOL_SYNC_HPP

#include <boost/system/error_code.hpp>

#include <vector>

namespace pgwire {
namespace protocol {

// Header-only frontend messages

struct sync
{
};
boost::system::error_code serialize(sync, std::vector<unsigned char>& to);

struct flush
{
};
boost::system::error_code serialize(flush, std::vector<unsigned char>& to);

struct terminate
{
};
boost::system::error_code serialize(terminate, std::vector<unsigned char>& to);

}  // namespace protocol
}  // namespace pgwire

#endif
