//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_CONNECTION_HPP
#define PGWIRE_CONNECTION_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "pgwire/byte_stream.hpp"
#include "pgwire/connect_params.hpp"
#include "pgwire/diagnostics.hpp"
#include "pgwire/protocol/query.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/row_reader.hpp"
#include "pgwire/value.hpp"

namespace pgwire {

namespace detail {
class connection_impl;

// Replaces the active read table. nullptr restores the default one
void set_read_table(connection_impl& impl, std::shared_ptr<const read_table> table) noexcept;
}

class copy_writer;

// Identifies a backend for cancellation. Sent by the server during startup
struct cancel_key
{
    std::int32_t process_id{};
    std::int32_t secret_key{};

    friend bool operator==(const cancel_key&, const cancel_key&) = default;
};

// A statement prepared with connection::prepare
struct prepared_statement
{
    std::string name;
    std::string query;

    // As inferred by the server, one per parameter
    std::vector<std::int32_t> parameter_types;

    // Empty if the statement doesn't return rows
    std::vector<field_descriptor> fields;
};

// An asynchronous notification, caused by NOTIFY
struct notification
{
    std::int32_t process_id{};
    std::string channel;
    std::string payload;
};

// A session with a server. Runs one exchange at a time, blocking the calling thread.
// All functions report errors by throwing error_with_diagnostics.
// After a network or protocol error the connection is broken, and any further operation fails
// with client_errc::connection_broken. Server errors (ErrorResponse) leave the connection usable.
// Not thread-safe
class connection
{
    std::unique_ptr<detail::connection_impl> impl_;

    friend class copy_writer;
    friend class scoped_read_table;

    // Throws client_errc::connection_broken if this object was moved from
    detail::connection_impl& get_impl() const;

    void query_impl(std::string_view sql, row_reader_ref reader);
    void execute_prepared_impl(std::string_view name, std::span<const value> params, row_reader_ref reader);
    void execute_impl(std::string_view sql, std::span<const value> params, row_reader_ref reader);

    template <class Reader>
    using result_type_t = typename std::remove_cvref_t<Reader>::result_type;

public:
    // Creates a connection that isn't connected yet
    connection();
    connection(const connection&) = delete;
    connection(connection&&) noexcept;
    connection& operator=(const connection&) = delete;
    connection& operator=(connection&&) noexcept;

    // Closes the connection, if open
    ~connection();

    // Connects over TCP and runs the startup sequence
    void connect(const connect_params& params);

    // Runs the startup sequence over an already connected stream. The connection takes ownership
    // of the stream, and releases it if startup fails
    void connect(std::unique_ptr<byte_stream> stream, const connect_params& params);

    // Sends Terminate and releases the stream. Errors are logged but not reported. Idempotent
    void close() noexcept;

    // Whether the connection has a stream and is not broken
    bool is_open() const noexcept;

    //
    // Simple query protocol. sql may contain several statements, separated by semicolons.
    // Returns a result per statement. Values are decoded from their text format
    //
    template <class Reader>
        requires row_reader<std::remove_cvref_t<Reader>>
    std::vector<result_type_t<Reader>> query(std::string_view sql, Reader&& reader)
    {
        std::vector<result_type_t<Reader>> res;
        query_impl(sql, row_reader_ref(reader, res));
        return res;
    }

    std::vector<result_set> query(std::string_view sql) { return query(sql, rows_reader()); }

    //
    // Extended query protocol. Parameters are sent and values are received in binary format
    //

    // Prepares a statement and records it under name. If name is already in use,
    // the previous statement is closed first
    const prepared_statement& prepare(
        std::string_view name,
        std::string_view sql,
        std::span<const std::int32_t> type_hints = {}
    );

    // Executes a prepared statement. params must contain one value per statement parameter
    template <class Reader>
        requires row_reader<std::remove_cvref_t<Reader>>
    result_type_t<Reader> execute_prepared(std::string_view name, std::span<const value> params, Reader&& reader)
    {
        std::vector<result_type_t<Reader>> res;
        execute_prepared_impl(name, params, row_reader_ref(reader, res));
        return std::move(res.front());
    }

    result_set execute_prepared(std::string_view name, std::span<const value> params = {})
    {
        return execute_prepared(name, params, rows_reader());
    }

    // Closes a prepared statement. The name can then be reused
    void unprepare(std::string_view name);

    // nullptr if no statement with this name was prepared
    const prepared_statement* find_prepared(std::string_view name) const;

    // Prepares sql as the unnamed statement and executes it with params
    template <class Reader>
        requires row_reader<std::remove_cvref_t<Reader>>
    result_type_t<Reader> execute(std::string_view sql, std::span<const value> params, Reader&& reader)
    {
        std::vector<result_type_t<Reader>> res;
        execute_impl(sql, params, row_reader_ref(reader, res));
        return std::move(res.front());
    }

    result_set execute(std::string_view sql, std::span<const value> params = {})
    {
        return execute(sql, params, rows_reader());
    }

    //
    // Session state
    //

    // The accessors below throw client_errc::connection_broken if the connection was moved from

    // The key required to cancel queries running in this session
    cancel_key backend_key() const;

    // Run-time parameters reported by the server (server_version, TimeZone...)
    const std::map<std::string, std::string, std::less<>>& parameters() const;
    std::optional<std::string_view> parameter(std::string_view name) const;

    // As reported by the last ReadyForQuery
    protocol::transaction_status status() const;

    // Minor protocol version in use. Zero unless the server downgraded us
    std::int32_t protocol_minor_version() const;

    // The table used to decode results and encode parameters.
    // Initially, the process-wide default_read_table()
    void set_read_table(std::shared_ptr<const read_table> table);
    const std::shared_ptr<const read_table>& get_read_table() const;

    // Invoked for every NoticeResponse. By default, notices are logged with level info.
    // An empty function restores the default
    void set_notice_handler(std::function<void(const diagnostics&)> handler);

    // Invoked for every NotificationResponse. By default, notifications are logged with level debug
    void set_notification_handler(std::function<void(const notification&)> handler);
};

// Installs a read table in a connection, restoring the previous one on destruction
// Installs a read table for the lifetime of the object, then restores the previous one.
// Bound to the session rather than to the connection object, so it remains valid
// if the connection is moved. The session must outlive the guard
class scoped_read_table
{
    detail::connection_impl* impl_;
    std::shared_ptr<const read_table> previous_;

public:
    scoped_read_table(connection& conn, std::shared_ptr<const read_table> table)
        : impl_(&conn.get_impl()), previous_(conn.get_read_table())
    {
        detail::set_read_table(*impl_, std::move(table));
    }
    scoped_read_table(const scoped_read_table&) = delete;
    scoped_read_table& operator=(const scoped_read_table&) = delete;
    ~scoped_read_table() { detail::set_read_table(*impl_, std::move(previous_)); }
};

// Asks the server to cancel the query currently running in the session identified by key.
// Opens a separate connection. Cancellation is best-effort: the query may finish anyway
void cancel_request(const connect_params& params, cancel_key key);

// Same, over an already connected stream, which is closed afterwards
void cancel_request(byte_stream& stream, cancel_key key);

}  // namespace pgwire

#endif
