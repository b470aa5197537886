//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_STARTUP_FSM_HPP
#define PGWIRE_PROTOCOL_STARTUP_FSM_HPP

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "pgwire/diagnostics.hpp"
#include "pgwire/protocol/connection_state.hpp"
#include "pgwire/protocol/messages.hpp"

namespace pgwire::protocol {

struct startup_params
{
    std::string_view username;
    std::string_view password;
    std::optional<std::string_view> database;

    // Additional run-time parameters sent in the startup message (e.g. application_name)
    std::span<const std::pair<std::string_view, std::string_view>> params;
};

namespace detail {

// Drives the startup sequence, one message at a time:
// StartupMessage -> authentication exchange -> BackendKeyData/ParameterStatus/NoticeResponse
// until ReadyForQuery
class startup_fsm_impl
{
public:
    enum class result_type
    {
        done,
        read,
        write,
    };

    struct result
    {
        result_type type;
        boost::system::error_code ec;

        result(boost::system::error_code ec) noexcept : type(result_type::done), ec(ec) {}
        result(result_type t) noexcept : type(t) {}
    };

    // If client_nonce is not empty, it's used as the SCRAM client nonce instead of a random one
    explicit startup_fsm_impl(const startup_params& params, std::string client_nonce = {}) noexcept
        : params_(&params), client_nonce_(std::move(client_nonce))
    {
    }

    result resume(connection_state& st, diagnostics& diag, const any_backend_message& msg = {});

private:
    int resume_point_{0};
    const startup_params* params_;

    // SCRAM-SHA-256 state
    enum class scram_step
    {
        none,
        client_first_sent,
        client_final_sent,
        verified,
    };
    scram_step scram_step_{scram_step::none};
    std::string client_nonce_;
    std::string auth_message_;
    std::array<unsigned char, 32> salted_password_{};

    // Composes the response to an authentication request into the write buffer, if any is required
    boost::system::error_code on_auth_request(connection_state& st, const any_backend_message& msg);
    boost::system::error_code on_sasl_start(connection_state& st, const authentication_sasl& msg);
    boost::system::error_code on_sasl_continue(connection_state& st, const authentication_sasl_continue& msg);
    boost::system::error_code on_sasl_final(const authentication_sasl_final& msg);
};

}  // namespace detail

// Like startup_fsm_impl, but handles reading messages from the connection_state buffers.
// The caller performs the I/O requested by result
class startup_fsm
{
public:
    enum class result_type
    {
        done,
        read,
        write,
    };

    class result
    {
        result_type type_;
        boost::system::error_code ec_;
        std::span<unsigned char> data_;

        result(result_type t, std::span<unsigned char> data) noexcept : type_(t), data_(data) {}

    public:
        result(boost::system::error_code ec) noexcept : type_(result_type::done), ec_(ec) {}

        static result read(std::span<unsigned char> buff) { return {result_type::read, buff}; }
        static result write(std::span<const unsigned char> buff)
        {
            return {
                result_type::write,
                {const_cast<unsigned char*>(buff.data()), buff.size()}
            };
        }

        result_type type() const { return type_; }

        boost::system::error_code error() const
        {
            BOOST_ASSERT(type_ == result_type::done);
            return ec_;
        }
        std::span<const unsigned char> write_data() const
        {
            BOOST_ASSERT(type_ == result_type::write);
            return data_;
        }
        std::span<unsigned char> read_buffer() const
        {
            BOOST_ASSERT(type_ == result_type::read);
            return data_;
        }
    };

    explicit startup_fsm(const startup_params& params) noexcept : impl_(params) {}

    result resume(
        connection_state& st,
        diagnostics& diag,
        boost::system::error_code io_error,
        std::size_t bytes_read
    );

private:
    int resume_point_{0};
    detail::startup_fsm_impl impl_;
    any_backend_message msg_;
};

}  // namespace pgwire::protocol

#endif
