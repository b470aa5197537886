//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_BYTE_STREAM_HPP
#define PGWIRE_BYTE_STREAM_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <span>
#include <string_view>

namespace pgwire {

// A synchronous, duplex byte stream. Connections run the protocol over one of these.
// Implement it to run the protocol over other transports (e.g. TLS)
class byte_stream
{
public:
    virtual ~byte_stream() = default;

    // Reads at least one byte, unless an error occurs. The end of the stream is reported
    // as boost::asio::error::eof
    virtual std::size_t read_some(std::span<unsigned char> buff, boost::system::error_code& ec) = 0;

    // Writes the entire buffer
    virtual void write(std::span<const unsigned char> data, boost::system::error_code& ec) = 0;

    virtual void close(boost::system::error_code& ec) = 0;
};

// A plain TCP stream
class tcp_stream final : public byte_stream
{
    boost::asio::io_context ctx_;
    boost::asio::ip::tcp::socket sock_;

public:
    tcp_stream() : sock_(ctx_) {}

    // Resolves hostname and connects to the first endpoint that accepts the connection
    void connect(std::string_view hostname, unsigned short port, boost::system::error_code& ec);

    std::size_t read_some(std::span<unsigned char> buff, boost::system::error_code& ec) override;
    void write(std::span<const unsigned char> data, boost::system::error_code& ec) override;
    void close(boost::system::error_code& ec) override;

    boost::asio::ip::tcp::socket& socket() noexcept { return sock_; }
};

}  // namespace pgwire

#endif
