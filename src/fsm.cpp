//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "coroutine.hpp"
#include "password.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/diagnostics.hpp"
#include "pgwire/logger.hpp"
#include "pgwire/protocol/connection_state.hpp"
#include "pgwire/protocol/header.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/protocol/read_message_fsm.hpp"
#include "pgwire/protocol/scram_sha256.hpp"
#include "pgwire/protocol/startup.hpp"
#include "pgwire/protocol/startup_fsm.hpp"

using namespace pgwire::protocol;
using boost::system::error_code;
using detail::startup_fsm_impl;
using pgwire::client_errc;

namespace {

// Reads are at least this size, so small messages don't require a read each
constexpr std::size_t min_read_size = 512u;

std::span<unsigned char> to_span(boost::asio::mutable_buffer buff)
{
    return {static_cast<unsigned char*>(buff.data()), buff.size()};
}

}  // namespace

read_message_fsm::result read_message_fsm::resume(std::span<const unsigned char> data)
{
    if (msg_size_ == -1)
    {
        // Header. Ensure we have enough data
        if (data.size() < 5u)
            return result(static_cast<std::size_t>(5u - data.size()));

        message_header header{};
        if (auto ec = parse_header(std::span<const unsigned char, 5>(data.data(), 5u), header))
            return ec;

        // Record the header fields to signal that we're done with the header
        msg_type_ = header.type;
        msg_size_ = static_cast<std::int64_t>(header.size);
    }

    // Body. Ensure we have enough data. The header is not discarded
    // until the message is fully parsed for simplicity
    BOOST_ASSERT(msg_size_ != -1);
    const auto expected_size = static_cast<std::size_t>(msg_size_) + 5u;
    if (data.size() < expected_size)
        return result(static_cast<std::size_t>(expected_size - data.size()));

    any_backend_message msg;
    if (auto ec = parse(msg_type_, data.subspan(5, expected_size - 5u), msg))
        return ec;
    return result(msg, expected_size);
}

read_message_stream_fsm::result read_message_stream_fsm::resume(
    connection_state& st,
    boost::system::error_code io_ec,
    std::size_t bytes_read
)
{
    read_message_fsm::result res{error_code()};
    switch (resume_point_)
    {
        PGWIRE_CORO_INITIAL

        while (true)
        {
            res = fsm_.resume(to_span(st.read_buffer.data()));

            if (res.type() == read_message_fsm::result_type::error)
            {
                // An error is always fatal
                return res.error();
            }
            else if (res.type() == read_message_fsm::result_type::message)
            {
                // We have a message. Yield it and then consume the used bytes
                bytes_to_consume_ = res.bytes_consumed();
                PGWIRE_YIELD(resume_point_, 1, res.message());
                st.read_buffer.consume(bytes_to_consume_);
                fsm_ = {};
            }
            else
            {
                BOOST_ASSERT(res.type() == read_message_fsm::result_type::needs_more);

                // Prepare the buffer and tell the caller to read
                PGWIRE_YIELD(
                    resume_point_,
                    2,
                    to_span(st.read_buffer.prepare((std::max)(res.hint(), min_read_size)))
                );

                // The server closing the connection is always an error, even between messages
                if (io_ec == boost::asio::error::eof)
                    return error_code(client_errc::connection_closed);
                if (io_ec)
                    return io_ec;

                st.read_buffer.commit(bytes_read);
            }
        }
    }

    BOOST_ASSERT(false);
    return error_code();
}

//
// Startup
//

namespace {

// A server-reported error becomes the error code for its SQLSTATE
error_code on_server_error(const error_response& err, pgwire::diagnostics& diag)
{
    auto ext = pgwire::to_extended_error(err);
    diag = std::move(ext.diag);
    return ext.code;
}

void on_notice(connection_state& st, const notice_response& msg)
{
    if (st.notice_handler)
        st.notice_handler(msg);
}

bool offers_scram_sha256(const authentication_sasl& msg)
{
    return std::find(msg.mechanisms.begin(), msg.mechanisms.end(), scram_sha256_mechanism) !=
           msg.mechanisms.end();
}

std::string_view to_string_view(std::span<const unsigned char> data)
{
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

}  // namespace

error_code startup_fsm_impl::on_auth_request(connection_state& st, const any_backend_message& msg)
{
    if (boost::variant2::holds_alternative<authentication_cleartext_password>(msg))
    {
        PGWIRE_LOG_DEBUG("Authenticating with a cleartext password");
        if (params_->password.empty())
            return client_errc::password_required;
        return serialize(password{params_->password}, st.write_buffer);
    }
    else if (const auto* md5 = boost::variant2::get_if<authentication_md5_password>(&msg))
    {
        PGWIRE_LOG_DEBUG("Authenticating with an md5 password");
        if (params_->password.empty())
            return client_errc::password_required;
        std::string hashed;
        if (auto ec = detail::md5_password(params_->username, params_->password, md5->salt, hashed))
            return ec;
        return serialize(password{hashed}, st.write_buffer);
    }
    else if (const auto* sasl = boost::variant2::get_if<authentication_sasl>(&msg))
    {
        return on_sasl_start(st, *sasl);
    }
    else if (const auto* cont = boost::variant2::get_if<authentication_sasl_continue>(&msg))
    {
        return on_sasl_continue(st, *cont);
    }
    else if (const auto* fin = boost::variant2::get_if<authentication_sasl_final>(&msg))
    {
        return on_sasl_final(*fin);
    }
    else if (boost::variant2::holds_alternative<authentication_kerberos_v5>(msg))
    {
        return client_errc::auth_kerberos_v5_unsupported;
    }
    else if (boost::variant2::holds_alternative<authentication_gss>(msg) ||
             boost::variant2::holds_alternative<authentication_gss_continue>(msg))
    {
        return client_errc::auth_gss_unsupported;
    }
    else if (boost::variant2::holds_alternative<authentication_sspi>(msg))
    {
        return client_errc::auth_sspi_unsupported;
    }
    else
    {
        return client_errc::unexpected_message;
    }
}

error_code startup_fsm_impl::on_sasl_start(connection_state& st, const authentication_sasl& msg)
{
    if (!offers_scram_sha256(msg))
        return client_errc::auth_sasl_mechanism_unsupported;
    PGWIRE_LOG_DEBUG("Authenticating with SCRAM-SHA-256");
    if (params_->password.empty())
        return client_errc::password_required;

    if (client_nonce_.empty())
    {
        if (auto ec = detail::generate_scram_nonce(client_nonce_))
            return ec;
    }

    // client-first-message-bare. The user name is sent in the startup message
    auth_message_ = "n=,r=";
    auth_message_ += client_nonce_;

    scram_step_ = scram_step::client_first_sent;
    return serialize(scram_sha256_client_first_message{scram_sha256_mechanism, client_nonce_}, st.write_buffer);
}

error_code startup_fsm_impl::on_sasl_continue(connection_state& st, const authentication_sasl_continue& msg)
{
    // Only valid after we sent the client-first-message, and only once
    if (scram_step_ != scram_step::client_first_sent)
        return client_errc::unexpected_message;

    scram_sha256_server_first_message server_first{};
    if (auto ec = parse(msg.data, server_first))
        return ec;

    // The server nonce must extend ours
    if (server_first.nonce.size() <= client_nonce_.size() || !server_first.nonce.starts_with(client_nonce_))
        return client_errc::scram_nonce_mismatch;

    if (auto ec = detail::scram_sha256_salted_password(
            params_->password,
            server_first.salt,
            server_first.iteration_count,
            salted_password_
        ))
    {
        return ec;
    }

    // AuthMessage = client-first-message-bare "," server-first-message "," client-final-message-without-proof
    auth_message_ += ',';
    auth_message_ += to_string_view(msg.data);
    auth_message_ += ",c=biws,r=";
    auth_message_ += server_first.nonce;

    detail::sha256_digest proof{};
    if (auto ec = detail::scram_sha256_client_proof(salted_password_, auth_message_, proof))
        return ec;

    scram_step_ = scram_step::client_final_sent;
    return serialize(scram_sha256_client_final_message{server_first.nonce, proof}, st.write_buffer);
}

error_code startup_fsm_impl::on_sasl_final(const authentication_sasl_final& msg)
{
    if (scram_step_ != scram_step::client_final_sent)
        return client_errc::unexpected_message;

    scram_sha256_server_final_message server_final;
    if (auto ec = parse(msg.data, server_final))
        return ec;

    detail::sha256_digest expected{};
    if (auto ec = detail::scram_sha256_server_signature(salted_password_, auth_message_, expected))
        return ec;

    if (!std::equal(
            server_final.server_signature.begin(),
            server_final.server_signature.end(),
            expected.begin(),
            expected.end()
        ))
    {
        return client_errc::scram_server_signature_mismatch;
    }
    scram_step_ = scram_step::verified;
    return {};
}

startup_fsm_impl::result startup_fsm_impl::resume(
    connection_state& st,
    diagnostics& diag,
    const any_backend_message& msg
)
{
    switch (resume_point_)
    {
        PGWIRE_CORO_INITIAL

        // Compose the startup message
        st.write_buffer.clear();
        if (auto ec = serialize(
                startup_message{
                    .user = params_->username,
                    .database = params_->database,
                    .params = params_->params,
                },
                st.write_buffer
            ))
        {
            return ec;
        }

        PGWIRE_YIELD(resume_point_, 1, result_type::write)

        // Authentication exchange. Each request may require a response
        while (true)
        {
            PGWIRE_YIELD(resume_point_, 2, result_type::read)

            if (const auto* err = boost::variant2::get_if<error_response>(&msg))
            {
                return on_server_error(*err, diag);
            }
            else if (const auto* notice = boost::variant2::get_if<notice_response>(&msg))
            {
                on_notice(st, *notice);
                continue;
            }
            else if (const auto* neg = boost::variant2::get_if<negotiate_protocol_version>(&msg))
            {
                PGWIRE_LOG_DEBUG("Server supports protocol minor version {}", neg->minor_version);
                st.protocol_minor_version = neg->minor_version;
                continue;
            }
            else if (boost::variant2::holds_alternative<authentication_ok>(msg))
            {
                // A SCRAM exchange must end with the server proving it knows the password
                if (scram_step_ != scram_step::none && scram_step_ != scram_step::verified)
                    return error_code(client_errc::unexpected_message);
                break;
            }

            st.write_buffer.clear();
            if (auto ec = on_auth_request(st, msg))
                return ec;

            if (!st.write_buffer.empty())
            {
                PGWIRE_YIELD(resume_point_, 3, result_type::write);
            }
        }

        // Backend has approved our login request. Now wait until we receive ReadyForQuery
        while (true)
        {
            PGWIRE_YIELD(resume_point_, 4, result_type::read)

            if (const auto* key = boost::variant2::get_if<backend_key_data>(&msg))
            {
                st.backend_process_id = key->process_id;
                st.backend_secret_key = key->secret_key;
            }
            else if (const auto* param = boost::variant2::get_if<parameter_status>(&msg))
            {
                st.parameters.insert_or_assign(std::string(param->name), std::string(param->value));
            }
            else if (const auto* err = boost::variant2::get_if<error_response>(&msg))
            {
                return on_server_error(*err, diag);
            }
            else if (const auto* notice = boost::variant2::get_if<notice_response>(&msg))
            {
                on_notice(st, *notice);
            }
            else if (const auto* rfq = boost::variant2::get_if<ready_for_query>(&msg))
            {
                st.status = rfq->status;
                return error_code();
            }
            else
            {
                return error_code(client_errc::unexpected_message);
            }
        }
    }

    // We should never reach here
    BOOST_ASSERT(false);
    return error_code();
}

startup_fsm::result startup_fsm::resume(
    connection_state& st,
    diagnostics& diag,
    boost::system::error_code io_error,
    std::size_t bytes_read
)
{
    startup_fsm_impl::result startup_res{error_code()};
    read_message_stream_fsm::result read_msg_res{error_code()};

    switch (resume_point_)
    {
        PGWIRE_CORO_INITIAL

        while (true)
        {
            startup_res = impl_.resume(st, diag, msg_);
            if (startup_res.type == startup_fsm_impl::result_type::done)
            {
                return startup_res.ec;
            }
            else if (startup_res.type == startup_fsm_impl::result_type::write)
            {
                PGWIRE_YIELD(resume_point_, 1, result::write(st.write_buffer))

                if (io_error)
                    return io_error;
            }
            else
            {
                BOOST_ASSERT(startup_res.type == startup_fsm_impl::result_type::read);

                // Read a message
                while (true)
                {
                    read_msg_res = st.read_msg_stream_fsm.resume(st, io_error, bytes_read);
                    if (read_msg_res.type() == read_message_stream_fsm::result_type::read)
                    {
                        PGWIRE_YIELD(resume_point_, 2, result::read(read_msg_res.read_buffer()));
                    }
                    else if (read_msg_res.type() == read_message_stream_fsm::result_type::message)
                    {
                        msg_ = read_msg_res.message();
                        break;
                    }
                    else
                    {
                        BOOST_ASSERT(read_msg_res.type() == read_message_stream_fsm::result_type::error);
                        return read_msg_res.error();
                    }
                }
            }
        }
    }

    BOOST_ASSERT(false);
    return error_code();
}
