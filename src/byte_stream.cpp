//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "pgwire/byte_stream.hpp"

using namespace pgwire;
using boost::system::error_code;
namespace asio = boost::asio;

void tcp_stream::connect(std::string_view hostname, unsigned short port, error_code& ec)
{
    asio::ip::tcp::resolver resolv(ctx_);
    auto endpoints = resolv.resolve(hostname, std::to_string(port), ec);
    if (ec)
        return;
    asio::connect(sock_, endpoints, ec);
    if (ec)
        return;

    // Messages are small and latency-bound
    sock_.set_option(asio::ip::tcp::no_delay(true), ec);
}

std::size_t tcp_stream::read_some(std::span<unsigned char> buff, error_code& ec)
{
    return sock_.read_some(asio::buffer(buff.data(), buff.size()), ec);
}

void tcp_stream::write(std::span<const unsigned char> data, error_code& ec)
{
    asio::write(sock_, asio::buffer(data.data(), data.size()), ec);
}

void tcp_stream::close(error_code& ec)
{
    if (!sock_.is_open())
        return;
    sock_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);

    // The peer may have closed already. That's not an error
    if (ec == asio::error::not_connected)
        ec.clear();
    error_code close_ec;
    sock_.close(close_ec);
    if (!ec)
        ec = close_ec;
}
