//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SRC_BASE64_HPP
#define PGWIRE_SRC_BASE64_HPP

#include <boost/system/error_code.hpp>

#include <span>
#include <string>
#include <vector>

namespace pgwire {
namespace protocol {
namespace detail {

void base64_encode(std::span<const unsigned char> input, std::vector<unsigned char>& to);
std::string base64_encode(std::span<const unsigned char> input);

[[nodiscard]] boost::system::error_code base64_decode(
    std::span<const unsigned char> input,
    std::vector<unsigned char>& output
);

}  // namespace detail
}  // namespace protocol
}  // namespace pgwire

#endif
