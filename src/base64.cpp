//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/beast/core/detail/base64.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "base64.hpp"
#include "pgwire/client_errc.hpp"

using namespace pgwire;
namespace base64 = boost::beast::detail::base64;

void pgwire::protocol::detail::base64_encode(
    std::span<const unsigned char> input,
    std::vector<unsigned char>& to
)
{
    std::size_t size_before = to.size();
    to.resize(size_before + base64::encoded_size(input.size()));
    base64::encode(to.data() + size_before, input.data(), input.size());
}

std::string pgwire::protocol::detail::base64_encode(std::span<const unsigned char> input)
{
    std::string res(base64::encoded_size(input.size()), '\0');
    base64::encode(res.data(), input.data(), input.size());
    return res;
}

boost::system::error_code pgwire::protocol::detail::base64_decode(
    std::span<const unsigned char> input,
    std::vector<unsigned char>& output
)
{
    // Beast's decoder stops silently at the first padding or invalid character.
    // Only padded input made of whole groups is accepted
    if (input.size() % 4u != 0u)
        return client_errc::invalid_base64;
    std::size_t padding = 0u;
    while (padding < input.size() && input[input.size() - 1u - padding] == '=')
        ++padding;
    if (padding > 2u)
        return client_errc::invalid_base64;

    std::size_t size_before = output.size();
    output.resize(size_before + base64::decoded_size(input.size()));
    auto [written, read] = base64::decode(
        output.data() + size_before,
        reinterpret_cast<const char*>(input.data()),
        input.size()
    );

    // Every character before the padding must have been consumed
    if (read != input.size() - padding)
    {
        output.resize(size_before);
        return client_errc::invalid_base64;
    }
    output.resize(size_before + written);
    return {};
}
