//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SRC_CONNECTION_IMPL_HPP
#define PGWIRE_SRC_CONNECTION_IMPL_HPP

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pgwire/byte_stream.hpp"
#include "pgwire/connection.hpp"
#include "pgwire/diagnostics.hpp"
#include "pgwire/protocol/bind.hpp"
#include "pgwire/protocol/cancel_request.hpp"
#include "pgwire/protocol/connection_state.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/protocol/sync.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/value.hpp"

namespace pgwire::detail {

// State shared by connection and copy_writer. Stays at the same address when the connection is moved
class connection_impl
{
public:
    connection_impl();

    std::unique_ptr<byte_stream> stream;
    protocol::connection_state st;
    std::map<std::string, prepared_statement, std::less<>> statements;
    std::shared_ptr<const read_table> table;
    std::function<void(const diagnostics&)> notice_handler;
    std::function<void(const notification&)> notification_handler;

    // Set by a network or protocol error, or by an exchange interrupted by an exception
    bool broken{false};

    // Set while a copy_writer is open
    bool busy{false};

    // Resets the session state for a new stream
    void reset(std::unique_ptr<byte_stream> new_stream);

    // Throws unless a new exchange can start
    void check_ready() const;

    // Appends a message to the write buffer
    template <class Message>
    void compose(const Message& msg)
    {
        if (auto ec = protocol::serialize(msg, st.write_buffer))
            throw_error(ec, "Composing a message");
    }

    // Writes the write buffer and clears it
    void send();

    // Reads the next message, handling ParameterStatus, NoticeResponse and NotificationResponse
    // transparently. The returned message is valid until the next call
    protocol::any_backend_message read_message();

    // Reads until ReadyForQuery. The first ErrorResponse found is stored in err, unless it's already set
    void drain(std::optional<extended_error>& err);

    // Marks the connection as broken, releases the stream and throws
    [[noreturn]] void fail(boost::system::error_code ec, std::string_view what);

    // Marks the connection as broken and releases the stream, without throwing
    void break_connection() noexcept;

    // Closes and releases the stream, logging any error
    void close_stream() noexcept;

    // Drops the record for the unnamed statement, if any. Any Parse with an empty
    // name replaces the unnamed statement in the server
    void forget_unnamed_statement() noexcept;

    // Parse + Describe(statement) + Sync on name. If close_first, the statement is closed
    // in the same batch
    prepared_statement describe_statement(
        std::string_view name,
        std::string_view sql,
        std::span<const std::int32_t> type_hints,
        bool close_first
    );

private:
    void on_notice(const protocol::notice_response& msg);
};

// Marks the connection as broken if destroyed before done() is called:
// an exception interrupted an exchange, so the stream position is unknown
class exchange_guard
{
    connection_impl& impl_;
    bool done_{false};

public:
    explicit exchange_guard(connection_impl& impl) noexcept : impl_(impl) {}
    exchange_guard(const exchange_guard&) = delete;
    exchange_guard& operator=(const exchange_guard&) = delete;
    ~exchange_guard()
    {
        if (!done_)
            impl_.break_connection();
    }

    void done() noexcept { done_ = true; }
};

// Serializes values in binary, using the encoders for oids. Null values are sent as NULL.
// Returns the index of the first value that couldn't be encoded, if any
std::optional<std::size_t> encode_values(
    protocol::bind_context& ctx,
    const read_table& table,
    std::span<const std::int32_t> oids,
    std::span<const value> values
);

}  // namespace pgwire::detail

#endif
