//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_CONNECTION_STATE_HPP
#define PGWIRE_PROTOCOL_CONNECTION_STATE_HPP

#include <boost/beast/core/flat_buffer.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "pgwire/protocol/notice_error.hpp"
#include "pgwire/protocol/query.hpp"
#include "pgwire/protocol/read_message_fsm.hpp"

namespace pgwire::protocol {

struct connection_state
{
    // Messages to be sent are composed here
    std::vector<unsigned char> write_buffer;

    // Read buffer
    boost::beast::flat_buffer read_buffer;

    // Splits the read buffer into messages
    read_message_stream_fsm read_msg_stream_fsm;

    // The ID of the process that is managing our connection (aka connection ID)
    std::int32_t backend_process_id{};

    // A key that can be used for cancellations
    std::int32_t backend_secret_key{};

    // Minor protocol version. Lowered if the server sends NegotiateProtocolVersion
    std::int32_t protocol_minor_version{};

    // Run-time parameters reported by ParameterStatus. Later values overwrite earlier ones
    std::map<std::string, std::string, std::less<>> parameters;

    // As reported by the last ReadyForQuery
    transaction_status status{transaction_status::idle};

    // Invoked for every NoticeResponse, which may arrive at any time
    std::function<void(const notice_response&)> notice_handler;
};

}  // namespace pgwire::protocol

#endif
