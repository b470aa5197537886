//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "connection_impl.hpp"
#include "pgwire/byte_stream.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/connect_params.hpp"
#include "pgwire/connection.hpp"
#include "pgwire/diagnostics.hpp"
#include "pgwire/logger.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/protocol/startup_fsm.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/row_reader.hpp"

using namespace pgwire;
using boost::system::error_code;
using boost::variant2::get_if;
using boost::variant2::holds_alternative;
using detail::connection_impl;
using detail::exchange_guard;

//
// connection_impl
//

connection_impl::connection_impl() : table(default_read_table())
{
    st.notice_handler = [this](const protocol::notice_response& msg) { on_notice(msg); };
}

void connection_impl::on_notice(const protocol::notice_response& msg)
{
    diagnostics diag(msg);
    if (notice_handler)
        notice_handler(diag);
    else
        PGWIRE_LOG_INFO("Server notice: {}", diag.message());
}

void connection_impl::reset(std::unique_ptr<byte_stream> new_stream)
{
    stream = std::move(new_stream);
    st = protocol::connection_state{};
    st.notice_handler = [this](const protocol::notice_response& msg) { on_notice(msg); };
    statements.clear();
    broken = false;
    busy = false;
}

void connection_impl::check_ready() const
{
    if (!stream || broken)
        throw_error(client_errc::connection_broken, "The connection is not open");
    if (busy)
        throw_error(client_errc::connection_busy, "A COPY operation is in progress");
}

void connection_impl::send()
{
    error_code ec;
    stream->write(st.write_buffer, ec);
    if (ec)
        fail(ec, "Writing to the server");
    st.write_buffer.clear();
}

protocol::any_backend_message connection_impl::read_message()
{
    while (true)
    {
        error_code io_ec;
        std::size_t bytes_read = 0u;
        auto res = st.read_msg_stream_fsm.resume(st, io_ec, bytes_read);
        while (res.type() == protocol::read_message_stream_fsm::result_type::read)
        {
            bytes_read = stream->read_some(res.read_buffer(), io_ec);
            res = st.read_msg_stream_fsm.resume(st, io_ec, bytes_read);
        }
        if (res.type() == protocol::read_message_stream_fsm::result_type::error)
            fail(res.error(), "Reading from the server");

        // Messages that may arrive at any time
        const auto& msg = res.message();
        if (const auto* param = get_if<protocol::parameter_status>(&msg))
        {
            st.parameters.insert_or_assign(std::string(param->name), std::string(param->value));
        }
        else if (const auto* notice = get_if<protocol::notice_response>(&msg))
        {
            if (st.notice_handler)
                st.notice_handler(*notice);
        }
        else if (const auto* notif = get_if<protocol::notification_response>(&msg))
        {
            notification n{notif->process_id, std::string(notif->channel_name), std::string(notif->payload)};
            if (notification_handler)
                notification_handler(n);
            else
                PGWIRE_LOG_DEBUG("Notification on channel {}: {}", n.channel, n.payload);
        }
        else
        {
            return msg;
        }
    }
}

void connection_impl::drain(std::optional<extended_error>& err)
{
    while (true)
    {
        auto msg = read_message();
        if (const auto* rfq = get_if<protocol::ready_for_query>(&msg))
        {
            st.status = rfq->status;
            return;
        }
        else if (const auto* e = get_if<protocol::error_response>(&msg))
        {
            if (!err)
                err = to_extended_error(*e);
        }
    }
}

void connection_impl::break_connection() noexcept
{
    broken = true;
    close_stream();
}

void connection_impl::fail(error_code ec, std::string_view what)
{
    PGWIRE_LOG_ERROR("{}: {}. The connection is no longer usable", what, ec.message());
    break_connection();
    throw_error(ec, what);
}

void connection_impl::close_stream() noexcept
{
    if (!stream)
        return;
    error_code ec;
    stream->close(ec);
    if (ec)
        PGWIRE_LOG_WARN("Closing the connection stream: {}", ec.message());
    stream.reset();
}

void connection_impl::forget_unnamed_statement() noexcept
{
    auto it = statements.find(std::string_view());
    if (it != statements.end())
        statements.erase(it);
}

prepared_statement connection_impl::describe_statement(
    std::string_view name,
    std::string_view sql,
    std::span<const std::int32_t> type_hints,
    bool close_first
)
{
    if (name.empty())
        forget_unnamed_statement();

    st.write_buffer.clear();
    if (close_first)
        compose(protocol::close{protocol::portal_or_statement::statement, name});
    compose(protocol::parse_t{name, sql, type_hints});
    compose(protocol::describe{protocol::portal_or_statement::statement, name});
    compose(protocol::sync{});

    exchange_guard guard(*this);
    send();

    prepared_statement res{std::string(name), std::string(sql), {}, {}};
    std::optional<extended_error> err;
    while (true)
    {
        auto msg = read_message();
        if (const auto* e = get_if<protocol::error_response>(&msg))
        {
            if (!err)
                err = to_extended_error(*e);
        }
        else if (const auto* params = get_if<protocol::parameter_description>(&msg))
        {
            const auto& oids = params->parameter_type_oids;
            res.parameter_types.reserve(oids.size());
            for (std::size_t i = 0; i < oids.size(); ++i)
                res.parameter_types.push_back(oids[i]);
        }
        else if (const auto* rows = get_if<protocol::row_description>(&msg))
        {
            for (const auto& field : rows->field_descriptions)
                res.fields.push_back(to_field_descriptor(field));
        }
        else if (const auto* rfq = get_if<protocol::ready_for_query>(&msg))
        {
            st.status = rfq->status;
            break;
        }
        else if (!holds_alternative<protocol::close_complete>(msg) &&
                 !holds_alternative<protocol::parse_complete>(msg) && !holds_alternative<protocol::no_data>(msg))
        {
            fail(client_errc::unexpected_message, "Preparing a statement");
        }
    }
    guard.done();

    if (err)
        throw_error(*err);
    return res;
}

std::optional<std::size_t> detail::encode_values(
    protocol::bind_context& ctx,
    const read_table& table,
    std::span<const std::int32_t> oids,
    std::span<const value> values
)
{
    BOOST_ASSERT(oids.size() == values.size());
    std::optional<std::size_t> failed;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (values[i].is_null())
        {
            ctx.add_null_parameter();
            continue;
        }
        ctx.start_parameter();
        if (auto ec = table.encode_binary(oids[i], values[i], ctx.buffer()))
        {
            ctx.add_error(ec);
            if (!failed)
                failed = i;
        }
    }
    return failed;
}

namespace {

// Feeds the rows of a response to a reader. Keeps the first error found:
// after it, rows are discarded until the end of the response
class row_response
{
    row_reader_ref reader_;
    const read_table& table_;
    std::vector<field_descriptor> fields_;
    bool has_fields_{false};
    std::vector<std::optional<std::span<const unsigned char>>> values_;
    std::optional<extended_error> err_;
    std::size_t num_results_{};

public:
    row_response(row_reader_ref reader, const read_table& table) noexcept : reader_(reader), table_(table) {}

    std::optional<extended_error>& error() noexcept { return err_; }
    std::size_t num_results() const noexcept { return num_results_; }

    void set_fields(std::vector<field_descriptor> fields)
    {
        fields_ = std::move(fields);
        has_fields_ = true;
        if (!err_)
            reader_.on_row_description(fields_);
    }

    void on_row_description(const protocol::row_description& msg)
    {
        std::vector<field_descriptor> fields;
        fields.reserve(msg.field_descriptions.size());
        for (const auto& field : msg.field_descriptions)
            fields.push_back(to_field_descriptor(field));
        set_fields(std::move(fields));
    }

    // Returns false if no row description preceded the row
    bool on_data_row(const protocol::data_row& msg)
    {
        if (!has_fields_)
            return false;
        if (err_)
            return true;

        if (msg.columns.size() != fields_.size())
        {
            err_ = extended_error{
                client_errc::column_count_mismatch,
                diagnostics("DataRow has " + std::to_string(msg.columns.size()) + " values, but " +
                            std::to_string(fields_.size()) + " columns were described")
            };
            return true;
        }

        values_.clear();
        for (auto col : msg.columns)
            values_.push_back(col);
        if (auto ec = reader_.on_row(raw_row(fields_, values_, table_)))
            err_ = extended_error{ec, diagnostics("Reading a row: " + ec.message())};
        return true;
    }

    void on_complete(std::string_view tag)
    {
        if (!err_)
        {
            reader_.on_complete(tag);
            ++num_results_;
        }
        has_fields_ = false;
    }

    void on_error(const protocol::error_response& msg)
    {
        if (!err_)
            err_ = to_extended_error(msg);
    }
};

}  // namespace

//
// connection
//

void detail::set_read_table(connection_impl& impl, std::shared_ptr<const read_table> table) noexcept
{
    impl.table = table ? std::move(table) : default_read_table();
}

connection::connection() : impl_(std::make_unique<connection_impl>()) {}

connection::connection(connection&&) noexcept = default;

connection& connection::operator=(connection&& rhs) noexcept
{
    if (this != &rhs)
    {
        close();
        impl_ = std::move(rhs.impl_);
    }
    return *this;
}

connection::~connection() { close(); }

connection_impl& connection::get_impl() const
{
    if (!impl_)
        throw_error(client_errc::connection_broken, "The connection was moved from");
    return *impl_;
}

void connection::connect(const connect_params& params)
{
    auto stream = std::make_unique<tcp_stream>();
    error_code ec;
    stream->connect(params.hostname, params.port, ec);
    if (ec)
    {
        throw_error(ec, "Connecting to " + params.hostname + ":" + std::to_string(params.port));
    }
    connect(std::move(stream), params);
}

void connection::connect(std::unique_ptr<byte_stream> stream, const connect_params& params)
{
    if (!impl_)
        impl_ = std::make_unique<connection_impl>();
    close();
    impl_->reset(std::move(stream));

    std::vector<std::pair<std::string_view, std::string_view>> extra_params;
    extra_params.reserve(params.extra_params.size());
    for (const auto& p : params.extra_params)
        extra_params.emplace_back(p.first, p.second);

    protocol::startup_params startup{
        .username = params.username,
        .password = params.password,
        .database = params.database.empty() ? std::nullopt : std::optional<std::string_view>(params.database),
        .params = extra_params,
    };

    // Run the startup algorithm until done
    protocol::startup_fsm fsm(startup);
    diagnostics diag;
    error_code io_ec;
    std::size_t bytes_transferred = 0u;
    error_code ec;
    while (true)
    {
        auto res = fsm.resume(impl_->st, diag, io_ec, bytes_transferred);
        if (res.type() == protocol::startup_fsm::result_type::done)
        {
            ec = res.error();
            break;
        }
        else if (res.type() == protocol::startup_fsm::result_type::write)
        {
            impl_->stream->write(res.write_data(), io_ec);
            bytes_transferred = res.write_data().size();
        }
        else
        {
            BOOST_ASSERT(res.type() == protocol::startup_fsm::result_type::read);
            bytes_transferred = impl_->stream->read_some(res.read_buffer(), io_ec);
        }
    }
    impl_->st.write_buffer.clear();

    if (ec)
    {
        impl_->break_connection();
        if (diag.message().empty())
            throw_error(ec, "Connection startup failed");
        throw_error(extended_error{ec, std::move(diag)});
    }

    PGWIRE_LOG_DEBUG(
        "Connected to database {} as user {} (backend process {})",
        params.database,
        params.username,
        impl_->st.backend_process_id
    );
}

void connection::close() noexcept
{
    if (!impl_ || !impl_->stream)
        return;

    // Terminate is a courtesy. A broken or busy connection can't send it
    if (!impl_->broken && !impl_->busy)
    {
        impl_->st.write_buffer.clear();
        if (auto ec = protocol::serialize(protocol::terminate{}, impl_->st.write_buffer); !ec)
        {
            impl_->stream->write(impl_->st.write_buffer, ec);
            if (ec)
                PGWIRE_LOG_WARN("Sending Terminate: {}", ec.message());
        }
        impl_->st.write_buffer.clear();
    }
    impl_->close_stream();
    impl_->statements.clear();
}

bool connection::is_open() const noexcept { return impl_ && impl_->stream && !impl_->broken; }

void connection::query_impl(std::string_view sql, row_reader_ref reader)
{
    get_impl().check_ready();
    auto& st = impl_->st;

    st.write_buffer.clear();
    impl_->compose(protocol::query{sql});

    exchange_guard guard(*impl_);
    impl_->send();

    row_response response(reader, *impl_->table);
    bool copy_in_seen = false, copy_out_seen = false;
    while (true)
    {
        auto msg = impl_->read_message();
        if (const auto* rows = get_if<protocol::row_description>(&msg))
        {
            response.on_row_description(*rows);
        }
        else if (const auto* row = get_if<protocol::data_row>(&msg))
        {
            if (!response.on_data_row(*row))
                impl_->fail(client_errc::unexpected_message, "DataRow without RowDescription");
        }
        else if (const auto* complete = get_if<protocol::command_complete>(&msg))
        {
            // COPY TO STDOUT produces no result, since its data was discarded
            if (!copy_out_seen)
                response.on_complete(complete->tag);
        }
        else if (holds_alternative<protocol::empty_query_response>(msg))
        {
            response.on_complete({});
        }
        else if (const auto* err = get_if<protocol::error_response>(&msg))
        {
            response.on_error(*err);
        }
        else if (holds_alternative<protocol::copy_in_response>(msg))
        {
            // We can't supply data here. The server answers with an error
            copy_in_seen = true;
            impl_->compose(protocol::copy_fail{"COPY FROM STDIN is not supported by query(). Use copy_writer"});
            impl_->send();
        }
        else if (holds_alternative<protocol::copy_out_response>(msg))
        {
            copy_out_seen = true;
        }
        else if (holds_alternative<protocol::copy_data>(msg) || holds_alternative<protocol::copy_done>(msg))
        {
            if (!copy_out_seen)
                impl_->fail(client_errc::unexpected_message, "CopyData outside a COPY operation");
        }
        else if (const auto* rfq = get_if<protocol::ready_for_query>(&msg))
        {
            st.status = rfq->status;
            break;
        }
        else
        {
            impl_->fail(client_errc::unexpected_message, "Running a query");
        }
    }
    guard.done();

    if (response.error())
        throw_error(*response.error());
    if (copy_in_seen)
        throw_error(client_errc::copy_in_not_supported, "The query contains a COPY FROM STDIN");
    if (copy_out_seen)
        throw_error(client_errc::copy_out_not_supported, "The query contains a COPY TO STDOUT");
}

const prepared_statement& connection::prepare(
    std::string_view name,
    std::string_view sql,
    std::span<const std::int32_t> type_hints
)
{
    get_impl().check_ready();

    // Re-preparing closes the old statement in the same batch
    auto it = impl_->statements.find(name);
    bool close_first = it != impl_->statements.end();
    if (close_first)
        impl_->statements.erase(it);

    auto stmt = impl_->describe_statement(name, sql, type_hints, close_first);
    PGWIRE_LOG_DEBUG("Prepared statement {} with {} parameters", name, stmt.parameter_types.size());
    auto res = impl_->statements.insert_or_assign(std::string(name), std::move(stmt));
    return res.first->second;
}

namespace {

void execute_statement(connection_impl& impl, const prepared_statement& stmt, std::span<const value> params, row_reader_ref reader)
{
    if (params.size() != stmt.parameter_types.size())
    {
        throw_error(
            client_errc::parameter_count_mismatch,
            "Statement '" + stmt.name + "' requires " + std::to_string(stmt.parameter_types.size()) +
                " parameters, but " + std::to_string(params.size()) + " were supplied"
        );
    }

    const read_table& table = *impl.table;
    auto& st = impl.st;
    st.write_buffer.clear();

    std::optional<std::size_t> failed_param;
    auto ec = protocol::serialize(
        protocol::bind{
            .portal_name = {},
            .statement_name = stmt.name,
            .parameter_fmt_codes = protocol::format_code::binary,
            .parameters_fn =
                [&](protocol::bind_context& ctx) {
                    failed_param = detail::encode_values(ctx, table, stmt.parameter_types, params);
                },
            .result_fmt_codes = protocol::format_code::binary,
        },
        st.write_buffer
    );
    if (ec)
    {
        if (failed_param)
        {
            throw_error(
                ec,
                "Encoding parameter $" + std::to_string(*failed_param + 1u) + " as type OID " +
                    std::to_string(stmt.parameter_types[*failed_param])
            );
        }
        throw_error(ec, "Composing a Bind message");
    }
    impl.compose(protocol::execute{{}, 0});
    impl.compose(protocol::sync{});

    exchange_guard guard(impl);
    impl.send();

    // Execute doesn't send RowDescription. We requested binary for all columns
    row_response response(reader, table);
    if (!stmt.fields.empty())
    {
        auto fields = stmt.fields;
        for (auto& f : fields)
            f.format = protocol::format_code::binary;
        response.set_fields(std::move(fields));
    }

    while (true)
    {
        auto msg = impl.read_message();
        if (const auto* row = get_if<protocol::data_row>(&msg))
        {
            if (!response.on_data_row(*row))
                impl.fail(client_errc::unexpected_message, "DataRow for a statement without rows");
        }
        else if (const auto* complete = get_if<protocol::command_complete>(&msg))
        {
            response.on_complete(complete->tag);
        }
        else if (holds_alternative<protocol::empty_query_response>(msg))
        {
            response.on_complete({});
        }
        else if (const auto* err = get_if<protocol::error_response>(&msg))
        {
            response.on_error(*err);
        }
        else if (const auto* rfq = get_if<protocol::ready_for_query>(&msg))
        {
            st.status = rfq->status;
            break;
        }
        else if (!holds_alternative<protocol::bind_complete>(msg))
        {
            impl.fail(client_errc::unexpected_message, "Executing a statement");
        }
    }
    guard.done();

    if (response.error())
        throw_error(*response.error());
    if (response.num_results() != 1u)
        throw_error(client_errc::unexpected_message, "Executing a statement didn't produce a result");
}

}  // namespace

void connection::execute_prepared_impl(std::string_view name, std::span<const value> params, row_reader_ref reader)
{
    get_impl().check_ready();
    const auto* stmt = find_prepared(name);
    if (!stmt)
        throw_error(client_errc::unknown_prepared_statement, "Unknown prepared statement: " + std::string(name));
    execute_statement(*impl_, *stmt, params, reader);
}

void connection::execute_impl(std::string_view sql, std::span<const value> params, row_reader_ref reader)
{
    get_impl().check_ready();
    auto stmt = impl_->describe_statement({}, sql, {}, false);
    execute_statement(*impl_, stmt, params, reader);
}

void connection::unprepare(std::string_view name)
{
    get_impl().check_ready();
    auto it = impl_->statements.find(name);
    if (it == impl_->statements.end())
        throw_error(client_errc::unknown_prepared_statement, "Unknown prepared statement: " + std::string(name));

    auto& st = impl_->st;
    st.write_buffer.clear();
    impl_->compose(protocol::close{protocol::portal_or_statement::statement, name});
    impl_->compose(protocol::sync{});

    // The local record goes away even if the server complains
    impl_->statements.erase(it);

    exchange_guard guard(*impl_);
    impl_->send();
    std::optional<extended_error> err;
    impl_->drain(err);
    guard.done();

    if (err)
        throw_error(*err);
    PGWIRE_LOG_DEBUG("Closed statement {}", name);
}

const prepared_statement* connection::find_prepared(std::string_view name) const
{
    const auto& statements = get_impl().statements;
    auto it = statements.find(name);
    return it == statements.end() ? nullptr : &it->second;
}

cancel_key connection::backend_key() const
{
    const auto& st = get_impl().st;
    return {st.backend_process_id, st.backend_secret_key};
}

const std::map<std::string, std::string, std::less<>>& connection::parameters() const
{
    return get_impl().st.parameters;
}

std::optional<std::string_view> connection::parameter(std::string_view name) const
{
    const auto& params = get_impl().st.parameters;
    auto it = params.find(name);
    if (it == params.end())
        return std::nullopt;
    return std::string_view(it->second);
}

protocol::transaction_status connection::status() const { return get_impl().st.status; }

std::int32_t connection::protocol_minor_version() const { return get_impl().st.protocol_minor_version; }

void connection::set_read_table(std::shared_ptr<const read_table> table)
{
    detail::set_read_table(get_impl(), std::move(table));
}

const std::shared_ptr<const read_table>& connection::get_read_table() const { return get_impl().table; }

void connection::set_notice_handler(std::function<void(const diagnostics&)> handler)
{
    get_impl().notice_handler = std::move(handler);
}

void connection::set_notification_handler(std::function<void(const notification&)> handler)
{
    get_impl().notification_handler = std::move(handler);
}

//
// Cancellation
//

void pgwire::cancel_request(byte_stream& stream, cancel_key key)
{
    std::vector<unsigned char> buff;
    if (auto ec = protocol::serialize(protocol::cancel_request{key.process_id, key.secret_key}, buff))
        throw_error(ec, "Composing a CancelRequest");

    error_code ec;
    stream.write(buff, ec);
    error_code close_ec;
    stream.close(close_ec);
    if (ec)
        throw_error(ec, "Sending a CancelRequest");
    if (close_ec)
        PGWIRE_LOG_WARN("Closing the cancellation stream: {}", close_ec.message());
}

void pgwire::cancel_request(const connect_params& params, cancel_key key)
{
    tcp_stream stream;
    error_code ec;
    stream.connect(params.hostname, params.port, ec);
    if (ec)
        throw_error(ec, "Connecting to " + params.hostname + ":" + std::to_string(params.port));
    cancel_request(stream, key);
    PGWIRE_LOG_DEBUG("Sent cancellation request for backend process {}", key.process_id);
}
