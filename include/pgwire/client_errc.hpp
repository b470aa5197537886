//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_CLIENT_ERRC_HPP
#define PGWIRE_CLIENT_ERRC_HPP

#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>

namespace pgwire {

const boost::system::error_category& get_client_category();
const boost::system::error_category& get_client_condition_category();

/// Errors detected by the client. These are never sent by the server.
enum class client_errc : int
{
    /// An incomplete message was received from the server (indicates a deserialization error or
    /// packet mismatch).
    incomplete_message = 1,

    /// An unexpected value was found in a server-received message (indicates a deserialization
    /// error or packet mismatch).
    protocol_value_error,

    /// Unexpected extra bytes at the end of a message were received (indicates a deserialization
    /// error or packet mismatch).
    extra_bytes,

    /// A message header advertised a length below 4 or above the 1GB limit.
    invalid_message_length,

    /// The server closed the stream, possibly in the middle of a message.
    connection_closed,

    // We got a message type that wasn't supposed to appear in the state we are.
    // This is a protocol violation.
    unexpected_message,

    // You passed a collection whose size exceeds a protocol max
    value_too_big,

    // Decoding base64 failed because of malformed input
    invalid_base64,

    // Parsing a SCRAM message failed
    invalid_scram_message,

    // We found a mandatory SCRAM extension ('m'), which requires us to fail
    // authentication in the current version
    mandatory_scram_extension_not_supported,

    // The server nonce didn't start with the nonce we sent
    scram_nonce_mismatch,

    // The server signature in the SCRAM final message doesn't match the one we computed.
    // The server doesn't know our password.
    scram_server_signature_mismatch,

    // Authentication methods we don't implement
    auth_kerberos_v5_unsupported,
    auth_gss_unsupported,
    auth_sspi_unsupported,

    // The server offered SASL, but none of its mechanisms is SCRAM-SHA-256
    auth_sasl_mechanism_unsupported,

    // The server requested a password but none was supplied
    password_required,

    // SCRAM requires SASLprep normalization, which is only implemented for ASCII passwords
    scram_password_not_ascii,

    // A cryptographic primitive (hashing, key derivation or random generation) failed
    crypto_error,

    /// The number of parameters passed to a statement doesn't match the number it declares.
    parameter_count_mismatch,

    /// No prepared statement with the given name exists in this connection.
    unknown_prepared_statement,

    /// No codec is registered for a type OID in the active read table.
    unknown_type_oid,

    /// A value can't be represented in the type it's being encoded as.
    incompatible_parameter_type,

    /// A field's bytes don't conform to its type's wire format.
    invalid_field_value,

    /// A text field contains malformed UTF-8.
    invalid_utf8,

    /// A row has a number of values different to the number of columns.
    column_count_mismatch,

    // The server returned an error without a SQLSTATE
    exec_server_error,

    /// A previous network or protocol error left the connection unusable.
    connection_broken,

    /// The connection is being used by a COPY operation.
    connection_busy,

    /// The server started a COPY FROM STDIN in a context that can't supply data.
    copy_in_not_supported,

    /// The server started a COPY TO STDOUT or a replication stream. Data is discarded.
    copy_out_not_supported,

    /// A connection parameter has an invalid value (e.g. a non-numeric port).
    invalid_connect_params,

    /// The COPY operation was already closed or aborted.
    copy_not_open,
};

/// Families of client errors. Compare an error_code against these to test for a family.
enum class client_condition : int
{
    /// The byte stream was truncated or garbled. The connection can't be used anymore.
    protocol_framing = 1,

    /// The library was used incorrectly (e.g. wrong number of parameters).
    contract_violation,

    /// A value couldn't be decoded or encoded.
    decode_failure,

    /// The client couldn't authenticate.
    authentication,
};

/// Creates an \ref error_code from a \ref client_errc.
inline boost::system::error_code make_error_code(client_errc error)
{
    return boost::system::error_code(static_cast<int>(error), get_client_category());
}

inline boost::system::error_condition make_error_condition(client_condition cond)
{
    return boost::system::error_condition(static_cast<int>(cond), get_client_condition_category());
}

}  // namespace pgwire

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::pgwire::client_errc>
{
    static constexpr bool value = true;
};

template <>
struct is_error_condition_enum<::pgwire::client_condition>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#endif
