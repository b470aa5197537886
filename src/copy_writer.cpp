//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "connection_impl.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/connection.hpp"
#include "pgwire/copy_writer.hpp"
#include "pgwire/diagnostics.hpp"
#include "pgwire/logger.hpp"
#include "pgwire/protocol/copy.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/row_reader.hpp"

using namespace pgwire;
using boost::variant2::get_if;
using boost::variant2::holds_alternative;
using detail::exchange_guard;

namespace {

// Rows are buffered until they reach this size
constexpr std::size_t flush_threshold = 64u * 1024u;

std::string column_list(const std::vector<std::string>& columns)
{
    std::string res;
    for (const auto& col : columns)
    {
        if (!res.empty())
            res += ", ";
        res += col;
    }
    return res;
}

}  // namespace

copy_writer::copy_writer(connection& conn, std::string_view table, std::vector<std::string> columns)
    : impl_(&conn.get_impl()), columns_(std::move(columns))
{
    impl_->check_ready();

    std::string sql = "SELECT ";
    sql += columns_.empty() ? std::string("*") : column_list(columns_);
    sql += " FROM ";
    sql += table;
    auto stmt = impl_->describe_statement({}, sql, {}, false);
    for (const auto& field : stmt.fields)
        column_types_.push_back(field.type_oid);

    start(table);
}

copy_writer::copy_writer(
    connection& conn,
    std::string_view table,
    std::vector<std::string> columns,
    std::vector<std::int32_t> column_types
)
    : impl_(&conn.get_impl()), columns_(std::move(columns)), column_types_(std::move(column_types))
{
    if (!columns_.empty() && columns_.size() != column_types_.size())
    {
        throw_error(
            client_errc::column_count_mismatch,
            std::to_string(columns_.size()) + " columns were specified, but " +
                std::to_string(column_types_.size()) + " types"
        );
    }
    start(table);
}

copy_writer::~copy_writer()
{
    if (state_ != state_t::open || impl_->broken || !impl_->stream)
        return;
    try
    {
        abort("copy_writer destroyed without calling close()");
    }
    catch (const std::exception& err)
    {
        PGWIRE_LOG_WARN("COPY aborted by copy_writer destructor: {}", err.what());
    }
}

void copy_writer::start(std::string_view table)
{
    impl_->check_ready();

    std::string sql = "COPY ";
    sql += table;
    if (!columns_.empty())
    {
        sql += " (";
        sql += column_list(columns_);
        sql += ')';
    }
    sql += " FROM STDIN (FORMAT BINARY)";

    impl_->forget_unnamed_statement();
    impl_->st.write_buffer.clear();
    impl_->compose(protocol::parse_t{{}, sql, {}});
    impl_->compose(protocol::bind{});
    impl_->compose(protocol::execute{{}, 0});
    impl_->compose(protocol::flush{});

    exchange_guard guard(*impl_);
    impl_->send();

    while (true)
    {
        auto msg = impl_->read_message();
        if (holds_alternative<protocol::copy_in_response>(msg))
        {
            break;
        }
        else if (const auto* e = get_if<protocol::error_response>(&msg))
        {
            // The server discards messages until Sync
            std::optional<extended_error> err = to_extended_error(*e);
            impl_->compose(protocol::sync{});
            impl_->send();
            impl_->drain(err);
            guard.done();
            throw_error(*err);
        }
        else if (!holds_alternative<protocol::parse_complete>(msg) &&
                 !holds_alternative<protocol::bind_complete>(msg))
        {
            impl_->fail(client_errc::unexpected_message, "Starting a COPY operation");
        }
    }
    guard.done();

    // Sent together with the first rows
    impl_->compose(protocol::copy_binary_header{});

    impl_->busy = true;
    state_ = state_t::open;
    PGWIRE_LOG_DEBUG("COPY into {} started", table);
}

void copy_writer::check_open() const
{
    if (state_ != state_t::open)
        throw_error(client_errc::copy_not_open);
    if (!impl_->stream || impl_->broken)
        throw_error(client_errc::connection_broken, "The connection is not open");
}

void copy_writer::flush_rows()
{
    exchange_guard guard(*impl_);
    impl_->send();
    guard.done();
}

void copy_writer::write_row(std::span<const value> values)
{
    check_open();
    if (values.size() != column_types_.size())
    {
        throw_error(
            client_errc::column_count_mismatch,
            "The row has " + std::to_string(values.size()) + " values, but the table has " +
                std::to_string(column_types_.size()) + " columns"
        );
    }

    std::optional<std::size_t> failed;
    auto ec = protocol::serialize(
        protocol::copy_binary_row{[&](protocol::bind_context& ctx) {
            failed = detail::encode_values(ctx, *impl_->table, column_types_, values);
        }},
        impl_->st.write_buffer
    );
    if (ec)
    {
        if (failed)
        {
            throw_error(
                ec,
                "Encoding column " + std::to_string(*failed + 1u) + " as type OID " +
                    std::to_string(column_types_[*failed])
            );
        }
        throw_error(ec, "Composing a COPY row");
    }
    ++rows_written_;

    if (impl_->st.write_buffer.size() >= flush_threshold)
        flush_rows();
}

std::uint64_t copy_writer::close()
{
    check_open();
    impl_->compose(protocol::copy_binary_trailer{});
    impl_->compose(protocol::copy_done{});
    impl_->compose(protocol::sync{});
    state_ = state_t::finished;
    impl_->busy = false;

    exchange_guard guard(*impl_);
    impl_->send();

    std::optional<extended_error> err;
    std::uint64_t count = 0u;
    while (true)
    {
        auto msg = impl_->read_message();
        if (const auto* complete = get_if<protocol::command_complete>(&msg))
        {
            count = affected_rows(complete->tag);
        }
        else if (const auto* e = get_if<protocol::error_response>(&msg))
        {
            if (!err)
                err = to_extended_error(*e);
        }
        else if (const auto* rfq = get_if<protocol::ready_for_query>(&msg))
        {
            impl_->st.status = rfq->status;
            break;
        }
        else
        {
            impl_->fail(client_errc::unexpected_message, "Finishing a COPY operation");
        }
    }
    guard.done();

    if (err)
        throw_error(*err);
    PGWIRE_LOG_DEBUG("COPY finished: {} rows", count);
    return count;
}

void copy_writer::abort(std::string_view reason)
{
    check_open();

    // Rows not sent yet are useless now
    impl_->st.write_buffer.clear();
    impl_->compose(protocol::copy_fail{reason});
    impl_->compose(protocol::sync{});
    state_ = state_t::aborted;
    impl_->busy = false;

    exchange_guard guard(*impl_);
    impl_->send();
    std::optional<extended_error> err;
    impl_->drain(err);
    guard.done();

    PGWIRE_LOG_DEBUG("COPY aborted: {}", reason);
    if (err)
        throw_error(*err);
}
