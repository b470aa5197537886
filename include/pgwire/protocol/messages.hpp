//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_MESSAGES_HPP
#define PGWIRE_PROTOCOL_MESSAGES_HPP

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <span>

#include "pgwire/protocol/async.hpp"
#include "pgwire/protocol/bind.hpp"
#include "pgwire/protocol/close.hpp"
#include "pgwire/protocol/copy.hpp"
#include "pgwire/protocol/describe.hpp"
#include "pgwire/protocol/execute.hpp"
#include "pgwire/protocol/notice_error.hpp"
#include "pgwire/protocol/parse.hpp"
#include "pgwire/protocol/query.hpp"
#include "pgwire/protocol/startup.hpp"

namespace pgwire {
namespace protocol {

//
// Messages that we may receive from the backend
//

using any_backend_message = boost::variant2::variant<
    authentication_ok,
    authentication_kerberos_v5,
    authentication_cleartext_password,
    authentication_md5_password,
    authentication_gss,
    authentication_gss_continue,
    authentication_sspi,
    authentication_sasl,
    authentication_sasl_continue,
    authentication_sasl_final,
    backend_key_data,
    bind_complete,
    close_complete,
    command_complete,
    copy_data,
    copy_done,
    copy_in_response,
    copy_out_response,
    copy_both_response,
    data_row,
    empty_query_response,
    error_response,
    negotiate_protocol_version,
    no_data,
    notice_response,
    notification_response,
    parameter_description,
    parameter_status,
    parse_complete,
    portal_suspended,
    ready_for_query,
    row_description>;

// Parses the payload of a message (excluding the header) with the given type byte
boost::system::error_code parse(
    std::uint8_t message_type,
    std::span<const unsigned char> data,
    any_backend_message& to
);

}  // namespace protocol
}  // namespace pgwire

#endif
