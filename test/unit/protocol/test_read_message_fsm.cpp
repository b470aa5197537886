//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/error.hpp>
#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <span>

#include "pgwire/client_errc.hpp"
#include "pgwire/protocol/connection_state.hpp"
#include "pgwire/protocol/query.hpp"
#include "pgwire/protocol/read_message_fsm.hpp"

using namespace pgwire;
using boost::system::error_code;
using boost::variant2::get;
using protocol::read_message_fsm;
using protocol::read_message_stream_fsm;

// Operators
static const char* to_string(read_message_fsm::result_type t)
{
    switch (t)
    {
    case read_message_fsm::result_type::needs_more: return "needs_more";
    case read_message_fsm::result_type::error: return "error";
    case read_message_fsm::result_type::message: return "message";
    default: return "<unknown read_message_fsm::result_type>";
    }
}

static const char* to_string(read_message_stream_fsm::result_type t)
{
    switch (t)
    {
    case read_message_stream_fsm::result_type::read: return "read";
    case read_message_stream_fsm::result_type::error: return "error";
    case read_message_stream_fsm::result_type::message: return "message";
    default: return "<unknown read_message_stream_fsm::result_type>";
    }
}

namespace pgwire::protocol {

std::ostream& operator<<(std::ostream& os, read_message_fsm::result_type t) { return os << ::to_string(t); }
std::ostream& operator<<(std::ostream& os, read_message_stream_fsm::result_type t) { return os << ::to_string(t); }

}  // namespace pgwire::protocol

namespace {

// A command completion message
constexpr unsigned char select1_msg[] =
    {0x43, 0x00, 0x00, 0x00, 0x0d, 0x53, 0x45, 0x4c, 0x45, 0x43, 0x54, 0x20, 0x31, 0x00};

// A message is already available
void test_success()
{
    read_message_fsm fsm;

    auto act = fsm.resume(select1_msg);

    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::message);
    BOOST_TEST_EQ(get<protocol::command_complete>(act.message()).tag, "SELECT 1");
    BOOST_TEST_EQ(act.bytes_consumed(), sizeof(select1_msg));
}

// Short reads are correctly handled
void test_short_reads()
{
    std::span<const unsigned char> msg(select1_msg);
    read_message_fsm fsm;

    // Empty reads don't cause harm
    auto act = fsm.resume({});
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::needs_more);
    BOOST_TEST_EQ(act.hint(), 5u);

    // Message type
    act = fsm.resume(msg.subspan(0, 1u));
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::needs_more);
    BOOST_TEST_EQ(act.hint(), 4u);

    // Full header
    act = fsm.resume(msg.subspan(0, 5u));
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::needs_more);
    BOOST_TEST_EQ(act.hint(), 9u);

    // All the body except the last byte
    act = fsm.resume(msg.subspan(0, 13u));
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::needs_more);
    BOOST_TEST_EQ(act.hint(), 1u);

    // Last byte
    act = fsm.resume(msg);
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::message);
    BOOST_TEST_EQ(get<protocol::command_complete>(act.message()).tag, "SELECT 1");
}

// Extra bytes after the message belong to the next one
void test_several_messages()
{
    const unsigned char data[] = {
        0x43, 0x00, 0x00, 0x00, 0x0d, 0x53, 0x45, 0x4c, 0x45, 0x43, 0x54, 0x20, 0x31, 0x00,  // SELECT 1
        0x5a, 0x00, 0x00, 0x00, 0x05, 0x49,                                                  // ReadyForQuery
    };
    read_message_fsm fsm;

    auto act = fsm.resume(data);
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::message);
    BOOST_TEST_EQ(act.bytes_consumed(), 14u);
}

// Errors
void test_error_unknown_message_type()
{
    const unsigned char data[] = {0xff, 0x00, 0x00, 0x00, 0x05, 0x00};

    read_message_fsm fsm;
    auto act = fsm.resume(data);
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::error);
    BOOST_TEST_EQ(act.error(), error_code(client_errc::unexpected_message));
}

void test_error_length_negative()
{
    const unsigned char data[] = {0x43, 0xff, 0xff, 0xff, 0xff};

    read_message_fsm fsm;
    auto act = fsm.resume(data);
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::error);
    BOOST_TEST_EQ(act.error(), error_code(client_errc::invalid_message_length));
}

void test_error_length_below_4()
{
    const unsigned char data[] = {0x5a, 0x00, 0x00, 0x00, 0x03};

    read_message_fsm fsm;
    auto act = fsm.resume(data);
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::error);
    BOOST_TEST_EQ(act.error(), error_code(client_errc::invalid_message_length));
    BOOST_TEST(act.error() == client_condition::protocol_framing);
}

void test_error_length_above_limit()
{
    // 1GB of payload plus the length itself, plus one extra byte
    const unsigned char data[] = {0x64, 0x40, 0x00, 0x00, 0x05};

    read_message_fsm fsm;
    auto act = fsm.resume(data);
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::error);
    BOOST_TEST_EQ(act.error(), error_code(client_errc::invalid_message_length));
}

void test_error_length_at_limit()
{
    // Exactly 1GB of payload is accepted
    const unsigned char data[] = {0x64, 0x40, 0x00, 0x00, 0x04};

    read_message_fsm fsm;
    auto act = fsm.resume(data);
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::needs_more);
}

void test_error_deserialization()
{
    // ReadyForQuery with an invalid status
    const unsigned char data[] = {0x5a, 0x00, 0x00, 0x00, 0x05, 0x58};

    read_message_fsm fsm;
    auto act = fsm.resume(data);
    BOOST_TEST_EQ(act.type(), read_message_fsm::result_type::error);
    BOOST_TEST_EQ(act.error(), error_code(client_errc::protocol_value_error));
}

//
// Stream version
//

// Copies bytes into the buffer requested by the FSM
std::size_t fill(std::span<unsigned char> buff, std::span<const unsigned char> data)
{
    std::size_t n = (std::min)(buff.size(), data.size());
    std::copy_n(data.begin(), n, buff.begin());
    return n;
}

void test_stream_partial_reads()
{
    protocol::connection_state st;
    read_message_stream_fsm fsm;
    std::span<const unsigned char> msg(select1_msg);

    // Nothing in the buffer: we need to read
    auto act = fsm.resume(st, {}, 0u);
    BOOST_TEST_EQ(act.type(), read_message_stream_fsm::result_type::read);

    // The server sends the message in two chunks
    auto n = fill(act.read_buffer(), msg.subspan(0, 3u));
    act = fsm.resume(st, {}, n);
    BOOST_TEST_EQ(act.type(), read_message_stream_fsm::result_type::read);
    n = fill(act.read_buffer(), msg.subspan(3u));
    act = fsm.resume(st, {}, n);
    BOOST_TEST_EQ(act.type(), read_message_stream_fsm::result_type::message);
    BOOST_TEST_EQ(get<protocol::command_complete>(act.message()).tag, "SELECT 1");

    // Resuming consumes the message and asks for more
    act = fsm.resume(st, {}, 0u);
    BOOST_TEST_EQ(act.type(), read_message_stream_fsm::result_type::read);
    BOOST_TEST_EQ(st.read_buffer.size(), 0u);
}

void test_stream_eof_mid_message()
{
    protocol::connection_state st;
    read_message_stream_fsm fsm;

    auto act = fsm.resume(st, {}, 0u);
    BOOST_TEST_EQ(act.type(), read_message_stream_fsm::result_type::read);
    auto n = fill(act.read_buffer(), std::span<const unsigned char>(select1_msg).subspan(0, 7u));
    act = fsm.resume(st, {}, n);
    BOOST_TEST_EQ(act.type(), read_message_stream_fsm::result_type::read);

    // The server closes the connection
    act = fsm.resume(st, boost::asio::error::eof, 0u);
    BOOST_TEST_EQ(act.type(), read_message_stream_fsm::result_type::error);
    BOOST_TEST_EQ(act.error(), error_code(client_errc::connection_closed));
}

void test_stream_io_error()
{
    protocol::connection_state st;
    read_message_stream_fsm fsm;

    auto act = fsm.resume(st, {}, 0u);
    BOOST_TEST_EQ(act.type(), read_message_stream_fsm::result_type::read);
    act = fsm.resume(st, boost::asio::error::connection_reset, 0u);
    BOOST_TEST_EQ(act.type(), read_message_stream_fsm::result_type::error);
    BOOST_TEST_EQ(act.error(), error_code(boost::asio::error::connection_reset));
}

}  // namespace

int main()
{
    test_success();
    test_short_reads();
    test_several_messages();

    test_error_unknown_message_type();
    test_error_length_negative();
    test_error_length_below_4();
    test_error_length_above_limit();
    test_error_length_at_limit();
    test_error_deserialization();

    test_stream_partial_reads();
    test_stream_eof_mid_message();
    test_stream_io_error();

    return boost::report_errors();
}
