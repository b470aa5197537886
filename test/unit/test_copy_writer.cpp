//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/lightweight_test.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mock_stream.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/connection.hpp"
#include "pgwire/copy_writer.hpp"
#include "pgwire/sqlstate.hpp"
#include "pgwire/value.hpp"
#include "test_utils.hpp"

using namespace pgwire;
using namespace pgwire::test;

namespace {

using fields_t = std::vector<std::pair<std::string_view, std::int32_t>>;
using oids_t = std::vector<std::int32_t>;

constexpr std::int32_t int4_oid = 23;
constexpr std::int32_t text_oid = 25;

std::vector<unsigned char> to_bytes(std::string_view s) { return {s.begin(), s.end()}; }

// NULL-terminated
std::vector<unsigned char> to_cstring(std::string_view s)
{
    auto res = to_bytes(s);
    res.push_back(0u);
    return res;
}

// Response to Parse + Bind + Execute + Flush for a COPY FROM STDIN
std::vector<unsigned char> copy_start_response(std::int16_t num_columns)
{
    return server_script().parse_complete().bind_complete().copy_in_response(num_columns).bytes();
}

// Starts a COPY into users (id, name)
copy_writer start_users_copy(connection& conn, mock_stream_state& st)
{
    st.add_input(copy_start_response(2));
    return copy_writer(conn, "users", {"id", "name"}, {int4_oid, text_oid});
}

void test_start()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(copy_start_response(2));

    copy_writer writer(conn, "users", {"id", "name"}, {int4_oid, text_oid});

    BOOST_TEST(writer.is_open());
    BOOST_TEST_EQ(writer.rows_written(), 0u);
    const oids_t expected_types{int4_oid, text_oid};
    PGWIRE_TEST_CONT_EQ(writer.column_types(), expected_types);
    BOOST_TEST_EQ(frontend_message_types(st->written), "PBEH");
    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_parse{0x00};
    auto sql = to_cstring("COPY users (id, name) FROM STDIN (FORMAT BINARY)");
    expected_parse.insert(expected_parse.end(), sql.begin(), sql.end());
    expected_parse.insert(expected_parse.end(), {0x00, 0x00});
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_parse);
    BOOST_TEST(st->all_input_consumed());

    // Other operations are rejected while the COPY is in progress
    PGWIRE_TEST_THROWS_ERROR(conn.query("SELECT 1"), client_errc::connection_busy);
    PGWIRE_TEST_THROWS_ERROR(conn.prepare("s", "SELECT 1"), client_errc::connection_busy);
    PGWIRE_TEST_THROWS_ERROR(conn.execute("SELECT 1"), client_errc::connection_busy);
    BOOST_TEST(conn.is_open());

    st->add_input(server_script().command_complete("COPY 0").ready_for_query().bytes());
    BOOST_TEST_EQ(writer.close(), 0u);
}

// The COPY statement is parsed as the unnamed statement, replacing one prepared with an empty name
void test_start_replaces_unnamed_statement()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(server_script()
                      .parse_complete()
                      .parameter_description(oids_t{int4_oid})
                      .no_data()
                      .ready_for_query()
                      .bytes());
    conn.prepare("", "SELECT $1::int4");
    BOOST_TEST(conn.find_prepared("") != nullptr);

    {
        auto writer = start_users_copy(conn, *st);
        st->add_input(server_script().command_complete("COPY 0").ready_for_query().bytes());
        writer.close();
    }

    BOOST_TEST(conn.find_prepared("") == nullptr);
}

void test_start_all_columns()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(copy_start_response(1));

    copy_writer writer(conn, "logs", {}, {text_oid});

    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_parse{0x00};
    auto sql = to_cstring("COPY logs FROM STDIN (FORMAT BINARY)");
    expected_parse.insert(expected_parse.end(), sql.begin(), sql.end());
    expected_parse.insert(expected_parse.end(), {0x00, 0x00});
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_parse);

    st->add_input(server_script().command_complete("COPY 0").ready_for_query().bytes());
    writer.close();
}

void test_start_type_lookup()
{
    // Column types are described by the server
    connection conn;
    auto st = connect_mock(conn);
    server_script script;
    script.parse_complete()
        .parameter_description(oids_t{})
        .row_description(fields_t{
            {"id",   int4_oid},
            {"name", text_oid}
    })
        .ready_for_query()
        .raw(copy_start_response(2));
    st->add_input(script.bytes());

    copy_writer writer(conn, "users", {"id", "name"});

    const oids_t expected_types{int4_oid, text_oid};
    PGWIRE_TEST_CONT_EQ(writer.column_types(), expected_types);
    BOOST_TEST_EQ(frontend_message_types(st->written), "PDSPBEH");
    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_parse{0x00};
    auto sql = to_cstring("SELECT id, name FROM users");
    expected_parse.insert(expected_parse.end(), sql.begin(), sql.end());
    expected_parse.insert(expected_parse.end(), {0x00, 0x00});
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_parse);

    st->add_input(server_script().command_complete("COPY 0").ready_for_query().bytes());
    writer.close();
}

void test_start_type_lookup_all_columns()
{
    connection conn;
    auto st = connect_mock(conn);
    server_script script;
    script.parse_complete()
        .parameter_description(oids_t{})
        .row_description(fields_t{
            {"msg", text_oid}
    })
        .ready_for_query()
        .raw(copy_start_response(1));
    st->add_input(script.bytes());

    copy_writer writer(conn, "logs", {});

    const oids_t expected_types{text_oid};
    PGWIRE_TEST_CONT_EQ(writer.column_types(), expected_types);
    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_parse{0x00};
    auto sql = to_cstring("SELECT * FROM logs");
    expected_parse.insert(expected_parse.end(), sql.begin(), sql.end());
    expected_parse.insert(expected_parse.end(), {0x00, 0x00});
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_parse);

    st->add_input(server_script().command_complete("COPY 0").ready_for_query().bytes());
    writer.close();
}

void test_start_type_lookup_error()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(server_script().error_response("42P01", "relation \"nope\" does not exist").ready_for_query().bytes());

    PGWIRE_TEST_THROWS_ERROR(copy_writer(conn, "nope", {"a"}), sqlstate::undefined_table);
    BOOST_TEST_EQ(frontend_message_types(st->written), "PDS");
    BOOST_TEST(conn.is_open());
}

void test_start_server_error()
{
    // The server discards messages until Sync, which we send
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(server_script().error_response("42P01", "relation \"nope\" does not exist").ready_for_query().bytes());

    PGWIRE_TEST_THROWS_ERROR(copy_writer(conn, "nope", {"a"}, {int4_oid}), sqlstate::undefined_table);
    BOOST_TEST_EQ(frontend_message_types(st->written), "PBEHS");
    BOOST_TEST(st->all_input_consumed());
    BOOST_TEST(conn.is_open());

    // Not busy
    st->add_input(server_script().command_complete("SELECT 0").ready_for_query().bytes());
    conn.query("SELECT 1 WHERE false");
}

void test_start_column_count_mismatch()
{
    connection conn;
    auto st = connect_mock(conn);

    PGWIRE_TEST_THROWS_ERROR(
        copy_writer(conn, "users", {"id", "name"}, {int4_oid}),
        client_errc::column_count_mismatch
    );
    BOOST_TEST(st->written.empty());
}

void test_start_unexpected_message()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(server_script().parse_complete().data_row(std::vector<std::optional<std::string_view>>{"1"}).bytes());

    PGWIRE_TEST_THROWS_ERROR(copy_writer(conn, "t", {"a"}, {int4_oid}), client_errc::unexpected_message);
    BOOST_TEST_NOT(conn.is_open());
}

void test_start_not_connected()
{
    connection conn;
    PGWIRE_TEST_THROWS_ERROR(copy_writer(conn, "t", {"a"}, {int4_oid}), client_errc::connection_broken);
}

void test_write_and_close()
{
    connection conn;
    auto st = connect_mock(conn);
    auto writer = start_users_copy(conn, *st);
    st->written.clear();

    const std::vector<value> row1{std::int32_t(1), "ab"};
    const std::vector<value> row2{std::int32_t(2), null};
    writer.write_row(row1);
    writer.write_row(row2);
    BOOST_TEST_EQ(writer.rows_written(), 2u);

    // Rows are buffered
    BOOST_TEST(st->written.empty());

    st->add_input(server_script().command_complete("COPY 2").ready_for_query().bytes());
    auto count = writer.close();

    BOOST_TEST_EQ(count, 2u);
    BOOST_TEST_NOT(writer.is_open());
    BOOST_TEST_EQ(frontend_message_types(st->written), "ddddcS");
    auto msgs = split_frontend_messages(st->written);

    // Header
    std::vector<unsigned char> expected_header{'P', 'G', 'C', 'O', 'P', 'Y', '\n', 0xff, '\r', '\n', 0x00};
    expected_header.insert(expected_header.end(), 8u, 0x00);
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_header);

    // Rows
    const std::vector<unsigned char> expected_row1{
        0x00, 0x02, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x02, 'a', 'b',
    };
    PGWIRE_TEST_CONT_EQ(msgs.at(1).payload, expected_row1);
    const std::vector<unsigned char> expected_row2{
        0x00, 0x02, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x02, 0xff, 0xff, 0xff, 0xff,
    };
    PGWIRE_TEST_CONT_EQ(msgs.at(2).payload, expected_row2);

    // Trailer
    const std::vector<unsigned char> expected_trailer{0xff, 0xff};
    PGWIRE_TEST_CONT_EQ(msgs.at(3).payload, expected_trailer);
    BOOST_TEST(msgs.at(4).payload.empty());

    // The connection can be used again
    BOOST_TEST(conn.is_open());
    st->add_input(server_script().command_complete("SELECT 0").ready_for_query().bytes());
    conn.query("SELECT 1 WHERE false");
}

void test_write_row_column_count_mismatch()
{
    connection conn;
    auto st = connect_mock(conn);
    auto writer = start_users_copy(conn, *st);

    const std::vector<value> row{std::int32_t(1)};
    PGWIRE_TEST_THROWS_ERROR(writer.write_row(row), client_errc::column_count_mismatch);
    BOOST_TEST(writer.is_open());
    BOOST_TEST_EQ(writer.rows_written(), 0u);

    st->add_input(server_script().command_complete("COPY 0").ready_for_query().bytes());
    writer.close();
}

void test_write_row_encoding_error()
{
    // The row is not sent, and the writer remains usable
    connection conn;
    auto st = connect_mock(conn);
    auto writer = start_users_copy(conn, *st);
    st->written.clear();

    const std::vector<value> bad_row{"one", "ab"};
    PGWIRE_TEST_THROWS_ERROR(writer.write_row(bad_row), client_errc::incompatible_parameter_type);
    BOOST_TEST(writer.is_open());
    BOOST_TEST_EQ(writer.rows_written(), 0u);

    const std::vector<value> good_row{std::int32_t(1), "ab"};
    writer.write_row(good_row);
    st->add_input(server_script().command_complete("COPY 1").ready_for_query().bytes());
    BOOST_TEST_EQ(writer.close(), 1u);

    // Header, one row, trailer
    BOOST_TEST_EQ(frontend_message_types(st->written), "dddcS");
}

void test_write_row_flush()
{
    // Rows are sent when the buffer grows large
    connection conn;
    auto st = connect_mock(conn);
    auto writer = start_users_copy(conn, *st);
    st->written.clear();

    const std::string big(40000u, 'x');
    const std::vector<value> row{std::int32_t(1), big};
    writer.write_row(row);
    BOOST_TEST(st->written.empty());
    writer.write_row(row);
    BOOST_TEST_EQ(frontend_message_types(st->written), "ddd");

    st->add_input(server_script().command_complete("COPY 2").ready_for_query().bytes());
    BOOST_TEST_EQ(writer.close(), 2u);
    BOOST_TEST_EQ(frontend_message_types(st->written), "ddddcS");
}

void test_close_server_error()
{
    connection conn;
    auto st = connect_mock(conn);
    auto writer = start_users_copy(conn, *st);
    const std::vector<value> row{std::int32_t(1), "ab"};
    writer.write_row(row);

    st->add_input(server_script()
                      .error_response("23505", "duplicate key value violates unique constraint \"users_pkey\"")
                      .ready_for_query()
                      .bytes());
    PGWIRE_TEST_THROWS_ERROR(writer.close(), sqlstate::unique_violation);
    BOOST_TEST_NOT(writer.is_open());
    BOOST_TEST(conn.is_open());
    BOOST_TEST(st->all_input_consumed());

    PGWIRE_TEST_THROWS_ERROR(writer.close(), client_errc::copy_not_open);
}

void test_close_eof()
{
    connection conn;
    auto st = connect_mock(conn);
    auto writer = start_users_copy(conn, *st);

    PGWIRE_TEST_THROWS_ERROR(writer.close(), client_errc::connection_closed);
    BOOST_TEST_NOT(conn.is_open());
}

void test_abort()
{
    connection conn;
    auto st = connect_mock(conn);
    auto writer = start_users_copy(conn, *st);
    const std::vector<value> row{std::int32_t(1), "ab"};
    writer.write_row(row);
    st->written.clear();

    st->add_input(server_script()
                      .error_response("57014", "COPY from stdin failed: changed my mind")
                      .ready_for_query()
                      .bytes());
    PGWIRE_TEST_THROWS_ERROR(writer.abort("changed my mind"), sqlstate::query_canceled);

    // Buffered rows are discarded
    BOOST_TEST_EQ(frontend_message_types(st->written), "fS");
    auto msgs = split_frontend_messages(st->written);
    auto expected_reason = to_cstring("changed my mind");
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_reason);
    BOOST_TEST_NOT(writer.is_open());
    BOOST_TEST(conn.is_open());

    const std::vector<value> row2{std::int32_t(2), "cd"};
    PGWIRE_TEST_THROWS_ERROR(writer.write_row(row2), client_errc::copy_not_open);
    PGWIRE_TEST_THROWS_ERROR(writer.abort("again"), client_errc::copy_not_open);
}

void test_destructor_aborts()
{
    connection conn;
    auto st = connect_mock(conn);
    {
        auto writer = start_users_copy(conn, *st);
        st->written.clear();
        st->add_input(server_script().error_response("57014", "COPY from stdin failed").ready_for_query().bytes());
    }

    BOOST_TEST_EQ(frontend_message_types(st->written), "fS");
    BOOST_TEST(st->all_input_consumed());
    BOOST_TEST(conn.is_open());

    st->add_input(server_script().command_complete("SELECT 0").ready_for_query().bytes());
    conn.query("SELECT 1 WHERE false");
}

void test_destructor_after_close()
{
    // Nothing is sent
    connection conn;
    auto st = connect_mock(conn);
    {
        auto writer = start_users_copy(conn, *st);
        st->add_input(server_script().command_complete("COPY 0").ready_for_query().bytes());
        writer.close();
        st->written.clear();
    }
    BOOST_TEST(st->written.empty());
}

void test_connection_closed_while_open()
{
    // A busy connection doesn't send Terminate
    connection conn;
    auto st = connect_mock(conn);
    auto writer = start_users_copy(conn, *st);
    st->written.clear();

    conn.close();
    BOOST_TEST(st->written.empty());
    BOOST_TEST(st->closed);

    const std::vector<value> row{std::int32_t(1), "ab"};
    PGWIRE_TEST_THROWS_ERROR(writer.write_row(row), client_errc::connection_broken);
    PGWIRE_TEST_THROWS_ERROR(writer.close(), client_errc::connection_broken);
}

}  // namespace

int main()
{
    test_start();
    test_start_replaces_unnamed_statement();
    test_start_all_columns();
    test_start_type_lookup();
    test_start_type_lookup_all_columns();
    test_start_type_lookup_error();
    test_start_server_error();
    test_start_column_count_mismatch();
    test_start_unexpected_message();
    test_start_not_connected();

    test_write_and_close();
    test_write_row_column_count_mismatch();
    test_write_row_encoding_error();
    test_write_row_flush();
    test_close_server_error();
    test_close_eof();
    test_abort();
    test_destructor_aborts();
    test_destructor_after_close();
    test_connection_closed_while_open();

    return boost::report_errors();
}
