//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mock_stream.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/connection.hpp"
#include "pgwire/protocol/common.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/row_reader.hpp"
#include "pgwire/sqlstate.hpp"
#include "pgwire/types/oid.hpp"
#include "pgwire/value.hpp"
#include "printing.hpp"
#include "test_utils.hpp"

using namespace pgwire;
using namespace pgwire::test;
using boost::system::error_code;
using protocol::format_code;

namespace {

using fields_t = std::vector<std::pair<std::string_view, std::int32_t>>;
using oids_t = std::vector<std::int32_t>;
using binary_row = std::vector<std::optional<std::vector<unsigned char>>>;

constexpr std::int32_t int4_oid = 23;
constexpr std::int32_t int8_oid = 20;
constexpr std::int32_t text_oid = 25;
constexpr std::int32_t record_oid = 2249;

std::vector<unsigned char> to_bytes(std::string_view s) { return {s.begin(), s.end()}; }

// Appends a NULL-terminated string
void append_string(std::vector<unsigned char>& to, std::string_view s)
{
    to.insert(to.end(), s.begin(), s.end());
    to.push_back(0u);
}

// Response to Parse + Describe(statement) + Sync
server_script describe_response(const oids_t& params, const fields_t& fields)
{
    server_script res;
    res.parse_complete().parameter_description(params);
    if (fields.empty())
        res.no_data();
    else
        res.row_description(fields);
    res.ready_for_query();
    return res;
}

//
// prepare
//

void test_prepare()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response(
                      {int4_oid, int8_oid},
                      {
                          {"sum", int8_oid}
    }
    )
                      .bytes());

    const auto& stmt = conn.prepare("s1", "SELECT $1 + $2");

    BOOST_TEST_EQ(frontend_message_types(st->written), "PDS");
    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_parse;
    append_string(expected_parse, "s1");
    append_string(expected_parse, "SELECT $1 + $2");
    expected_parse.insert(expected_parse.end(), {0x00, 0x00});
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_parse);
    std::vector<unsigned char> expected_describe{'S'};
    append_string(expected_describe, "s1");
    PGWIRE_TEST_CONT_EQ(msgs.at(1).payload, expected_describe);

    BOOST_TEST_EQ(stmt.name, "s1");
    BOOST_TEST_EQ(stmt.query, "SELECT $1 + $2");
    const oids_t expected_types{int4_oid, int8_oid};
    PGWIRE_TEST_CONT_EQ(stmt.parameter_types, expected_types);
    BOOST_TEST_EQ(stmt.fields.size(), 1u);
    BOOST_TEST_EQ(stmt.fields.at(0).name, "sum");
    BOOST_TEST_EQ(stmt.fields.at(0).type_oid, int8_oid);
    BOOST_TEST(conn.find_prepared("s1") == &stmt);
    BOOST_TEST(conn.find_prepared("s2") == nullptr);
    BOOST_TEST(st->all_input_consumed());
}

void test_prepare_type_hints()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({int4_oid}, {}).bytes());

    const oids_t hints{int4_oid};
    const auto& stmt = conn.prepare("ins", "INSERT INTO t VALUES ($1)", hints);

    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_parse;
    append_string(expected_parse, "ins");
    append_string(expected_parse, "INSERT INTO t VALUES ($1)");
    expected_parse.insert(expected_parse.end(), {0x00, 0x01, 0x00, 0x00, 0x00, 0x17});
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_parse);
    BOOST_TEST(stmt.fields.empty());
    PGWIRE_TEST_CONT_EQ(stmt.parameter_types, hints);
}

void test_prepare_again()
{
    // The old statement is closed in the same batch
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({}, {{"a", int4_oid}}).bytes());
    conn.prepare("s", "SELECT 1 AS a");
    st->written.clear();

    server_script script;
    script.close_complete().raw(describe_response({}, {{"b", text_oid}}).bytes());
    st->add_input(script.bytes());
    const auto& stmt = conn.prepare("s", "SELECT 'x' AS b");

    BOOST_TEST_EQ(frontend_message_types(st->written), "CPDS");
    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_close{'S'};
    append_string(expected_close, "s");
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_close);
    BOOST_TEST_EQ(stmt.query, "SELECT 'x' AS b");
    BOOST_TEST_EQ(stmt.fields.at(0).name, "b");
    BOOST_TEST(conn.find_prepared("s") == &stmt);
}

void test_prepare_server_error()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(server_script().error_response("42601", "syntax error at or near \"SELEC\"").ready_for_query().bytes());

    PGWIRE_TEST_THROWS_ERROR(conn.prepare("s", "SELEC 1"), sqlstate::syntax_error);
    BOOST_TEST(conn.find_prepared("s") == nullptr);
    BOOST_TEST(conn.is_open());
    BOOST_TEST(st->all_input_consumed());
}

void test_prepare_again_server_error()
{
    // The previous statement was closed, so its record is gone
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({}, {{"a", int4_oid}}).bytes());
    conn.prepare("s", "SELECT 1 AS a");

    st->add_input(server_script()
                      .close_complete()
                      .error_response("42P01", "relation \"nope\" does not exist")
                      .ready_for_query()
                      .bytes());
    PGWIRE_TEST_THROWS_ERROR(conn.prepare("s", "SELECT * FROM nope"), sqlstate::undefined_table);
    BOOST_TEST(conn.find_prepared("s") == nullptr);
}

void test_prepare_unexpected_message()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(server_script().parse_complete().bind_complete().ready_for_query().bytes());

    PGWIRE_TEST_THROWS_ERROR(conn.prepare("s", "SELECT 1"), client_errc::unexpected_message);
    BOOST_TEST_NOT(conn.is_open());
}

//
// execute_prepared
//

void test_execute_prepared()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response(
                      {int4_oid, int8_oid},
                      {
                          {"sum", int8_oid}
    }
    )
                      .bytes());
    conn.prepare("s1", "SELECT $1 + $2");
    st->written.clear();

    st->add_input(server_script()
                      .bind_complete()
                      .data_row_binary(binary_row{
                          std::vector<unsigned char>{0, 0, 0, 0, 0, 0, 0, 12}
    })
                      .command_complete("SELECT 1")
                      .ready_for_query()
                      .bytes());
    const std::vector<value> params{std::int32_t(5), std::int64_t(7)};
    auto res = conn.execute_prepared("s1", params);

    BOOST_TEST_EQ(frontend_message_types(st->written), "BES");
    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_bind{0x00};
    append_string(expected_bind, "s1");
    expected_bind.insert(
        expected_bind.end(),
        {
            0x00, 0x01, 0x00, 0x01,                          // parameter formats: binary
            0x00, 0x02,                                      // 2 parameters
            0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x05,  // int4 5
            0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00, 0x00,  // int8 7
            0x00, 0x00, 0x00, 0x07,
            0x00, 0x01, 0x00, 0x01,  // result formats: binary
        }
    );
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_bind);
    const std::vector<unsigned char> expected_execute{0x00, 0x00, 0x00, 0x00, 0x00};
    PGWIRE_TEST_CONT_EQ(msgs.at(1).payload, expected_execute);

    BOOST_TEST_EQ(res.fields.size(), 1u);
    BOOST_TEST_EQ(res.fields.at(0).format, format_code::binary);
    BOOST_TEST_EQ(res.rows.size(), 1u);
    BOOST_TEST_EQ(res.rows.at(0).at(0), value(std::int64_t(12)));
    BOOST_TEST_EQ(res.command_tag, "SELECT 1");
    BOOST_TEST(st->all_input_consumed());
}

void test_execute_prepared_null_param()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({text_oid}, {}).bytes());
    conn.prepare("ins", "INSERT INTO t VALUES ($1)");
    st->written.clear();

    st->add_input(server_script().bind_complete().command_complete("INSERT 0 1").ready_for_query().bytes());
    const std::vector<value> params{null};
    auto res = conn.execute_prepared("ins", params);

    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_bind{0x00};
    append_string(expected_bind, "ins");
    expected_bind.insert(
        expected_bind.end(),
        {0x00, 0x01, 0x00, 0x01, 0x00, 0x01, 0xff, 0xff, 0xff, 0xff, 0x00, 0x01, 0x00, 0x01}
    );
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_bind);
    BOOST_TEST(res.fields.empty());
    BOOST_TEST_EQ(res.affected_rows(), 1u);
}

void test_execute_prepared_reader()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({}, {{"v", text_oid}}).bytes());
    conn.prepare("s", "SELECT v FROM t");

    st->add_input(server_script()
                      .bind_complete()
                      .data_row_binary(binary_row{to_bytes("abc")})
                      .data_row_binary(binary_row{std::nullopt})
                      .data_row_binary(binary_row{to_bytes("de")})
                      .command_complete("SELECT 3")
                      .ready_for_query()
                      .bytes());
    callback_reader<std::size_t> reader([](std::size_t& total, const raw_row& row) -> error_code {
        value v;
        if (auto ec = row.decode(0, v))
            return ec;
        if (!v.is_null())
            total += v.as<std::string>().size();
        return {};
    });
    auto total = conn.execute_prepared("s", {}, reader);

    BOOST_TEST_EQ(total, 5u);
}

void test_execute_prepared_unknown()
{
    connection conn;
    auto st = connect_mock(conn);

    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("nope"), client_errc::unknown_prepared_statement);
    BOOST_TEST(st->written.empty());
    BOOST_TEST(conn.is_open());
}

void test_execute_prepared_param_count()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({int4_oid, int4_oid}, {}).bytes());
    conn.prepare("s", "INSERT INTO t VALUES ($1, $2)");
    st->written.clear();

    const std::vector<value> params{std::int32_t(1)};
    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("s", params), client_errc::parameter_count_mismatch);
    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("s"), client_errc::parameter_count_mismatch);
    BOOST_TEST(st->written.empty());
    BOOST_TEST(conn.is_open());
}

void test_execute_prepared_encoding_error()
{
    // Nothing is sent, and the connection remains usable
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({int4_oid}, {}).bytes());
    conn.prepare("s", "INSERT INTO t VALUES ($1)");
    st->written.clear();

    const std::vector<value> params{"not a number"};
    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("s", params), client_errc::incompatible_parameter_type);
    BOOST_TEST(st->written.empty());
    BOOST_TEST(conn.is_open());

    st->add_input(server_script().bind_complete().command_complete("INSERT 0 1").ready_for_query().bytes());
    const std::vector<value> good_params{std::int32_t(3)};
    auto res = conn.execute_prepared("s", good_params);
    BOOST_TEST_EQ(res.affected_rows(), 1u);
    BOOST_TEST_EQ(frontend_message_types(st->written), "BES");
}

void test_execute_prepared_server_error()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({int4_oid}, {}).bytes());
    conn.prepare("s", "INSERT INTO t VALUES ($1)");

    st->add_input(server_script()
                      .bind_complete()
                      .error_response("23505", "duplicate key value violates unique constraint \"t_pkey\"")
                      .ready_for_query()
                      .bytes());
    const std::vector<value> params{std::int32_t(1)};
    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("s", params), sqlstate::unique_violation);
    BOOST_TEST(conn.is_open());
    BOOST_TEST(st->all_input_consumed());
}

void test_execute_prepared_decode_error()
{
    // An int8 column with 3 bytes
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({}, {{"n", int8_oid}}).bytes());
    conn.prepare("s", "SELECT n FROM t");

    st->add_input(server_script()
                      .bind_complete()
                      .data_row_binary(binary_row{
                          std::vector<unsigned char>{1, 2, 3}
    })
                      .command_complete("SELECT 1")
                      .ready_for_query()
                      .bytes());
    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("s"), client_errc::invalid_field_value);
    BOOST_TEST(conn.is_open());
    BOOST_TEST(st->all_input_consumed());
}

void test_execute_prepared_rows_without_fields()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({}, {}).bytes());
    conn.prepare("s", "DELETE FROM t");

    st->add_input(server_script()
                      .bind_complete()
                      .data_row_binary(binary_row{to_bytes("x")})
                      .command_complete("DELETE 1")
                      .ready_for_query()
                      .bytes());
    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("s"), client_errc::unexpected_message);
    BOOST_TEST_NOT(conn.is_open());
}

void test_execute_prepared_no_result()
{
    // The server must complete the statement
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({}, {}).bytes());
    conn.prepare("s", "DELETE FROM t");

    st->add_input(server_script().bind_complete().ready_for_query().bytes());
    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("s"), client_errc::unexpected_message);
}

//
// execute
//

void test_execute()
{
    connection conn;
    auto st = connect_mock(conn);
    server_script script;
    script.raw(describe_response({int4_oid}, {{"n", int4_oid}}).bytes())
        .bind_complete()
        .data_row_binary(binary_row{
            std::vector<unsigned char>{0, 0, 0, 42}
    })
        .command_complete("SELECT 1")
        .ready_for_query();
    st->add_input(script.bytes());

    const std::vector<value> params{std::int32_t(42)};
    auto res = conn.execute("SELECT $1", params);

    // Two round trips, on the unnamed statement
    BOOST_TEST_EQ(frontend_message_types(st->written), "PDSBES");
    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_parse{0x00};
    append_string(expected_parse, "SELECT $1");
    expected_parse.insert(expected_parse.end(), {0x00, 0x00});
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_parse);

    BOOST_TEST_EQ(res.rows.size(), 1u);
    BOOST_TEST_EQ(res.rows.at(0).at(0), value(std::int32_t(42)));
    BOOST_TEST(conn.find_prepared("") == nullptr);
}

// Executing an unnamed statement replaces one prepared with an empty name
void test_execute_replaces_unnamed_statement()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({int4_oid}, {{"n", int4_oid}}).bytes());
    conn.prepare("", "SELECT $1::int4");
    BOOST_TEST(conn.find_prepared("") != nullptr);

    server_script script;
    script.raw(describe_response({}, {{"x", text_oid}}).bytes())
        .bind_complete()
        .data_row_binary(binary_row{to_bytes("x")})
        .command_complete("SELECT 1")
        .ready_for_query();
    st->add_input(script.bytes());
    auto res = conn.execute("SELECT 'x'");
    BOOST_TEST_EQ(res.rows.at(0).at(0), value("x"));
    BOOST_TEST(conn.find_prepared("") == nullptr);

    // Binding with the old parameter types is rejected before sending anything
    st->written.clear();
    const std::vector<value> params{std::int32_t(1)};
    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("", params), client_errc::unknown_prepared_statement);
    BOOST_TEST(st->written.empty());
    BOOST_TEST(conn.is_open());
}

// A record decoder installed on the connection replaces the default one,
// and the default is back once the table is removed
void test_execute_record_decoder_override()
{
    connection conn;
    auto st = connect_mock(conn);

    // (10, 20)
    const std::vector<unsigned char> record{
        0x00, 0x00, 0x00, 0x02,                          // field count
        0x00, 0x00, 0x00, 0x17, 0x00, 0x00, 0x00, 0x04,  // int4, length 4
        0x00, 0x00, 0x00, 0x0a,                          // 10
        0x00, 0x00, 0x00, 0x17, 0x00, 0x00, 0x00, 0x04,  // int4, length 4
        0x00, 0x00, 0x00, 0x14,                          // 20
    };
    auto record_response = [&] {
        server_script script;
        script.raw(describe_response({}, {{"row", record_oid}}).bytes())
            .bind_complete()
            .data_row_binary(binary_row{record})
            .command_complete("SELECT 1")
            .ready_for_query();
        return script.bytes();
    };

    // Formats records as (a . b . c)
    auto table = read_table::derive(read_table::builtin());
    table->set_decoder(
        types::pg_oid_type::record,
        [](std::span<const unsigned char> data, std::int32_t oid, const read_table&, value& to) -> error_code {
            value rec;
            if (auto ec = read_table::builtin()->decode_binary(oid, data, rec))
                return ec;
            std::string res = "(";
            for (const auto& field : rec.as<row_value>().fields)
            {
                const auto* n = field.get_if<std::int32_t>();
                if (!n)
                    return client_errc::invalid_field_value;
                if (res.size() > 1u)
                    res += " . ";
                res += std::to_string(*n);
            }
            res += ')';
            to = std::move(res);
            return {};
        }
    );

    {
        scoped_read_table guard(conn, table);
        st->add_input(record_response());
        auto res = conn.execute("SELECT (10, 20)");
        BOOST_TEST_EQ(res.rows.at(0).at(0), value("(10 . 20)"));
    }

    st->add_input(record_response());
    auto res = conn.execute("SELECT (10, 20)");
    BOOST_TEST_EQ(res.rows.at(0).at(0), value(make_row({std::int32_t(10), std::int32_t(20)})));
}

void test_execute_command()
{
    connection conn;
    auto st = connect_mock(conn);
    server_script script;
    script.raw(describe_response({text_oid}, {}).bytes())
        .bind_complete()
        .command_complete("UPDATE 4")
        .ready_for_query();
    st->add_input(script.bytes());

    const std::vector<value> params{"x"};
    auto n = conn.execute("UPDATE t SET v = $1", params, command_reader());

    BOOST_TEST_EQ(n, 4u);
}

void test_execute_empty_query()
{
    connection conn;
    auto st = connect_mock(conn);
    server_script script;
    script.raw(describe_response({}, {}).bytes()).bind_complete().empty_query_response().ready_for_query();
    st->add_input(script.bytes());

    auto res = conn.execute("");

    BOOST_TEST(res.fields.empty());
    BOOST_TEST_EQ(res.command_tag, "");
}

void test_execute_parse_error()
{
    // Nothing is executed
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(server_script().error_response("42P01", "relation \"nope\" does not exist").ready_for_query().bytes());

    PGWIRE_TEST_THROWS_ERROR(conn.execute("SELECT * FROM nope"), sqlstate::undefined_table);
    BOOST_TEST_EQ(frontend_message_types(st->written), "PDS");
    BOOST_TEST(conn.is_open());
}

void test_execute_param_count()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({int4_oid}, {}).bytes());

    PGWIRE_TEST_THROWS_ERROR(conn.execute("SELECT $1"), client_errc::parameter_count_mismatch);
    BOOST_TEST_EQ(frontend_message_types(st->written), "PDS");
    BOOST_TEST(conn.is_open());
}

//
// unprepare
//

void test_unprepare()
{
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({}, {}).bytes());
    conn.prepare("s", "DELETE FROM t");
    st->written.clear();

    st->add_input(server_script().close_complete().ready_for_query().bytes());
    conn.unprepare("s");

    BOOST_TEST_EQ(frontend_message_types(st->written), "CS");
    auto msgs = split_frontend_messages(st->written);
    std::vector<unsigned char> expected_close{'S'};
    append_string(expected_close, "s");
    PGWIRE_TEST_CONT_EQ(msgs.at(0).payload, expected_close);
    BOOST_TEST(conn.find_prepared("s") == nullptr);
    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("s"), client_errc::unknown_prepared_statement);
}

void test_unprepare_unknown()
{
    connection conn;
    auto st = connect_mock(conn);

    PGWIRE_TEST_THROWS_ERROR(conn.unprepare("nope"), client_errc::unknown_prepared_statement);
    BOOST_TEST(st->written.empty());
}

void test_unprepare_server_error()
{
    // The local record goes away anyway
    connection conn;
    auto st = connect_mock(conn);
    st->add_input(describe_response({}, {}).bytes());
    conn.prepare("s", "DELETE FROM t");

    st->add_input(server_script().error_response("XX000", "internal error").ready_for_query().bytes());
    PGWIRE_TEST_THROWS_ERROR(conn.unprepare("s"), sqlstate::internal_error);
    BOOST_TEST(conn.find_prepared("s") == nullptr);
    BOOST_TEST(conn.is_open());
}

}  // namespace

int main()
{
    test_prepare();
    test_prepare_type_hints();
    test_prepare_again();
    test_prepare_server_error();
    test_prepare_again_server_error();
    test_prepare_unexpected_message();

    test_execute_prepared();
    test_execute_prepared_null_param();
    test_execute_prepared_reader();
    test_execute_prepared_unknown();
    test_execute_prepared_param_count();
    test_execute_prepared_encoding_error();
    test_execute_prepared_server_error();
    test_execute_prepared_decode_error();
    test_execute_prepared_rows_without_fields();
    test_execute_prepared_no_result();

    test_execute();
    test_execute_replaces_unnamed_statement();
    test_execute_record_decoder_override();
    test_execute_command();
    test_execute_empty_query();
    test_execute_parse_error();
    test_execute_param_count();

    test_unprepare();
    test_unprepare_unknown();
    test_unprepare_server_error();

    return boost::report_errors();
}
