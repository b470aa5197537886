//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>
#include <boost/throw_exception.hpp>

#include <optional>
#include <string>
#include <string_view>

#include "pgwire/client_errc.hpp"
#include "pgwire/diagnostics.hpp"
#include "pgwire/protocol/notice_error.hpp"
#include "pgwire/sqlstate.hpp"

using namespace pgwire;

namespace {

const char* error_to_string(client_errc error)
{
    switch (error)
    {
    case client_errc::incomplete_message: return "An incomplete message was received from the server";
    case client_errc::protocol_value_error: return "An unexpected value was found in a server-received message";
    case client_errc::extra_bytes: return "Unexpected extra bytes at the end of a message were received";
    case client_errc::invalid_message_length: return "A message header advertised an invalid length";
    case client_errc::connection_closed: return "The server closed the connection";
    case client_errc::unexpected_message: return "A message that wasn't expected in the current state was received";
    case client_errc::value_too_big: return "A value exceeds the maximum size allowed by the protocol";
    case client_errc::invalid_base64: return "Malformed base64 data";
    case client_errc::invalid_scram_message: return "Malformed SCRAM message";
    case client_errc::mandatory_scram_extension_not_supported:
        return "The server requires a SCRAM extension that is not supported";
    case client_errc::scram_nonce_mismatch: return "The SCRAM server nonce doesn't extend the client nonce";
    case client_errc::scram_server_signature_mismatch:
        return "The SCRAM server signature doesn't match. The server couldn't prove it knows the password";
    case client_errc::auth_kerberos_v5_unsupported: return "Kerberos V5 authentication is not supported";
    case client_errc::auth_gss_unsupported: return "GSSAPI authentication is not supported";
    case client_errc::auth_sspi_unsupported: return "SSPI authentication is not supported";
    case client_errc::auth_sasl_mechanism_unsupported: return "None of the server's SASL mechanisms is supported";
    case client_errc::password_required: return "The server requested a password, but none was supplied";
    case client_errc::scram_password_not_ascii:
        return "SCRAM-SHA-256 authentication only supports passwords made of ASCII characters";
    case client_errc::crypto_error: return "A cryptographic operation failed";
    case client_errc::parameter_count_mismatch:
        return "The number of parameters doesn't match the number the statement declares";
    case client_errc::unknown_prepared_statement: return "No prepared statement with this name exists";
    case client_errc::unknown_type_oid: return "No codec is registered for this type OID";
    case client_errc::incompatible_parameter_type: return "The value can't be represented in the requested type";
    case client_errc::invalid_field_value: return "A field value doesn't conform to its type's wire format";
    case client_errc::invalid_utf8: return "A text value contains malformed UTF-8";
    case client_errc::column_count_mismatch: return "The number of values doesn't match the number of columns";
    case client_errc::exec_server_error: return "The server returned an error without a valid SQLSTATE";
    case client_errc::connection_broken: return "A previous error left the connection unusable";
    case client_errc::connection_busy: return "The connection is being used by a COPY operation";
    case client_errc::copy_in_not_supported: return "COPY FROM STDIN requires a copy_writer";
    case client_errc::copy_out_not_supported: return "COPY TO STDOUT is not supported. Data was discarded";
    case client_errc::invalid_connect_params: return "A connection parameter has an invalid value";
    case client_errc::copy_not_open: return "The COPY operation was already closed or aborted";
    default: return "<unknown pgwire client error>";
    }
}

const char* condition_to_string(client_condition cond)
{
    switch (cond)
    {
    case client_condition::protocol_framing: return "Protocol framing error";
    case client_condition::contract_violation: return "Library contract violation";
    case client_condition::decode_failure: return "Value encoding or decoding failure";
    case client_condition::authentication: return "Authentication failure";
    default: return "<unknown pgwire client condition>";
    }
}

std::optional<client_condition> condition_of(client_errc error)
{
    switch (error)
    {
    case client_errc::incomplete_message:
    case client_errc::protocol_value_error:
    case client_errc::extra_bytes:
    case client_errc::invalid_message_length:
    case client_errc::connection_closed:
    case client_errc::unexpected_message:
    case client_errc::connection_broken: return client_condition::protocol_framing;

    case client_errc::value_too_big:
    case client_errc::parameter_count_mismatch:
    case client_errc::unknown_prepared_statement:
    case client_errc::connection_busy:
    case client_errc::copy_in_not_supported:
    case client_errc::copy_out_not_supported:
    case client_errc::invalid_connect_params:
    case client_errc::copy_not_open: return client_condition::contract_violation;

    case client_errc::invalid_base64:
    case client_errc::unknown_type_oid:
    case client_errc::incompatible_parameter_type:
    case client_errc::invalid_field_value:
    case client_errc::invalid_utf8:
    case client_errc::column_count_mismatch: return client_condition::decode_failure;

    case client_errc::invalid_scram_message:
    case client_errc::mandatory_scram_extension_not_supported:
    case client_errc::scram_nonce_mismatch:
    case client_errc::scram_server_signature_mismatch:
    case client_errc::auth_kerberos_v5_unsupported:
    case client_errc::auth_gss_unsupported:
    case client_errc::auth_sspi_unsupported:
    case client_errc::auth_sasl_mechanism_unsupported:
    case client_errc::password_required:
    case client_errc::scram_password_not_ascii:
    case client_errc::crypto_error: return client_condition::authentication;

    default: return std::nullopt;
    }
}

class client_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "pgwire.client"; }
    std::string message(int ev) const final override { return error_to_string(static_cast<client_errc>(ev)); }

    boost::system::error_condition default_error_condition(int ev) const noexcept final override
    {
        if (auto cond = condition_of(static_cast<client_errc>(ev)))
            return *cond;
        return boost::system::error_condition(ev, *this);
    }
};

class client_condition_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "pgwire.client_condition"; }
    std::string message(int ev) const final override
    {
        return condition_to_string(static_cast<client_condition>(ev));
    }
};

const client_category g_clicat;
const client_condition_category g_clicondcat;

std::optional<std::string> to_owning(std::optional<std::string_view> v)
{
    return v ? std::optional<std::string>(*v) : std::nullopt;
}

}  // namespace

const boost::system::error_category& pgwire::get_client_category() { return g_clicat; }

const boost::system::error_category& pgwire::get_client_condition_category() { return g_clicondcat; }

void diagnostics::assign(const protocol::error_notice_fields& msg)
{
    severity_ = msg.severity.value_or(msg.localized_severity.value_or(std::string_view()));
    sqlstate_ = msg.sqlstate.value_or(std::string_view());
    server_message_ = msg.message.value_or(std::string_view());

    msg_ = severity_.empty() ? std::string("<Server error with unknown severity>") : severity_;
    msg_ += ": ";
    msg_ += sqlstate_.empty() ? std::string_view("<unknown SQLSTATE>") : std::string_view(sqlstate_);
    msg_ += ": ";
    msg_ += msg.message.value_or("<unknown error>");

    detail_ = to_owning(msg.detail);
    hint_ = to_owning(msg.hint);
    position_ = to_owning(msg.position);
    internal_position_ = to_owning(msg.internal_position);
    internal_query_ = to_owning(msg.internal_query);
    where_ = to_owning(msg.where);
    schema_name_ = to_owning(msg.schema_name);
    table_name_ = to_owning(msg.table_name);
    column_name_ = to_owning(msg.column_name);
    data_type_name_ = to_owning(msg.data_type_name);
    constraint_name_ = to_owning(msg.constraint_name);
    file_name_ = to_owning(msg.file_name);
    line_number_ = to_owning(msg.line_number);
    routine_ = to_owning(msg.routine);
}

extended_error pgwire::to_extended_error(const protocol::error_response& err)
{
    return {make_server_error_code(err.sqlstate), diagnostics(err)};
}

void pgwire::throw_error(const extended_error& err)
{
    BOOST_THROW_EXCEPTION(error_with_diagnostics(err.code, err.diag));
}

void pgwire::throw_error(boost::system::error_code ec, std::string_view message)
{
    BOOST_THROW_EXCEPTION(error_with_diagnostics(ec, diagnostics(std::string(message))));
}
