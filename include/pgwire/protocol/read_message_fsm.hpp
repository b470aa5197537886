//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_READ_MESSAGE_FSM_HPP
#define PGWIRE_PROTOCOL_READ_MESSAGE_FSM_HPP

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

#include "pgwire/protocol/messages.hpp"

namespace pgwire::protocol {

struct connection_state;

// A finite-state machine type to read messages from the server.
// resume() returns a variant-like type specifying what to do next.
// Flow should be:
//   - Create a new FSM per message (they're lightweight)
//   - Call resume() passing all the bytes available in your read buffer
//   - If resume returns an error, a serious protocol violation happened. Not recoverable.
//   - If resume returns needs_more, we need to read more data from the server.
//     At least result::hint() bytes should be read. Read and resume again with your entire buffer.
//   - If resume() returns a message, a message is available. Use the message and then call consume
//     with result::bytes_consumed(). Remember that messages point into the network buffer, so
//     don't call consume before using the message.
class read_message_fsm
{
    std::uint8_t msg_type_{};
    std::int64_t msg_size_{-1};

public:
    enum class result_type
    {
        needs_more,
        error,
        message,
    };

    class result
    {
    public:
        result(boost::system::error_code ec) noexcept : type_(result_type::error), ec_(ec) {}
        result(std::size_t hint) noexcept : type_(result_type::needs_more), hint_(hint) {}
        result(const any_backend_message& msg, std::size_t bytes_consumed) noexcept
            : type_(result_type::message), msg_(msg), bytes_consumed_(bytes_consumed)
        {
        }

        result_type type() const { return type_; }

        boost::system::error_code error() const
        {
            BOOST_ASSERT(type_ == result_type::error);
            return ec_;
        }

        std::size_t hint() const
        {
            BOOST_ASSERT(type_ == result_type::needs_more);
            return hint_;
        }

        const any_backend_message& message() const
        {
            BOOST_ASSERT(type_ == result_type::message);
            return msg_;
        }

        std::size_t bytes_consumed() const
        {
            BOOST_ASSERT(type_ == result_type::message);
            return bytes_consumed_;
        }

    private:
        result_type type_;
        boost::system::error_code ec_;
        std::size_t hint_{};
        any_backend_message msg_;
        std::size_t bytes_consumed_{};
    };

    read_message_fsm() = default;

    result resume(std::span<const unsigned char> data);
};

// This is like read_message_fsm, but has knowledge of connection_state buffers
// and remembers the bytes consumed from message to message.
// A message yielded by this FSM is valid until the next call to resume()
class read_message_stream_fsm
{
public:
    enum class result_type
    {
        read,
        error,
        message,
    };

    class result
    {
    public:
        result(boost::system::error_code ec) noexcept : type_(result_type::error), ec_(ec) {}
        result(std::span<unsigned char> read_buff) noexcept : type_(result_type::read), read_buff_(read_buff)
        {
        }
        result(const any_backend_message& msg) noexcept : type_(result_type::message), msg_{msg} {}

        result_type type() const { return type_; }

        boost::system::error_code error() const
        {
            BOOST_ASSERT(type_ == result_type::error);
            return ec_;
        }

        std::span<unsigned char> read_buffer() const
        {
            BOOST_ASSERT(type_ == result_type::read);
            return read_buff_;
        }

        const any_backend_message& message() const
        {
            BOOST_ASSERT(type_ == result_type::message);
            return msg_;
        }

    private:
        result_type type_;
        boost::system::error_code ec_;
        std::span<unsigned char> read_buff_;
        any_backend_message msg_;
    };

    read_message_stream_fsm() = default;

    result resume(connection_state& st, boost::system::error_code io_ec, std::size_t bytes_read);

private:
    int resume_point_{0};
    std::size_t bytes_to_consume_{};
    read_message_fsm fsm_;
};

}  // namespace pgwire::protocol

#endif
