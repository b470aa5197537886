//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Runs against the server in PGWIRE_TEST_HOST. The remaining connection parameters
// are read from the usual PG* environment variables

#include <boost/core/lightweight_test.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "pgwire/client_errc.hpp"
#include "pgwire/connect_params.hpp"
#include "pgwire/connection.hpp"
#include "pgwire/copy_writer.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/row_reader.hpp"
#include "pgwire/sqlstate.hpp"
#include "pgwire/types/oid.hpp"
#include "pgwire/value.hpp"
#include "test_utils.hpp"

using namespace pgwire;
using namespace pgwire::test;
using boost::system::error_code;
using namespace std::chrono_literals;

namespace {

connect_params test_params()
{
    auto params = connect_params_from_env();
    params.hostname = std::getenv("PGWIRE_TEST_HOST");
    return params;
}

connection make_connection()
{
    connection conn;
    conn.connect(test_params());
    return conn;
}

bit_string make_bits(std::string_view pattern)
{
    bit_string res;
    for (char c : pattern)
        res.bits.push_back(c == '1');
    return res;
}

bytes random_bytes(std::size_t size)
{
    std::mt19937 gen(42u);
    std::uniform_int_distribution<int> dist(0, 255);
    bytes res;
    for (std::size_t i = 0; i < size; ++i)
        res.push_back(static_cast<unsigned char>(dist(gen)));
    return res;
}

// Sends v as a parameter and checks that the server echoes it back unchanged
void check_round_trip(connection& conn, std::string_view type_name, const value& v)
{
    context_frame frame(type_name);
    const std::string sql = "SELECT $1::" + std::string(type_name);
    auto res = conn.execute(sql, std::span<const value>(&v, 1u));
    PGWIRE_TEST_EQ(res.rows.size(), 1u);
    PGWIRE_TEST_EQ(res.rows.at(0).size(), 1u);
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), v);
}

void test_scalar_round_trip()
{
    auto conn = make_connection();

    check_round_trip(conn, "bool", true);
    check_round_trip(conn, "bool", false);
    check_round_trip(conn, "int2", (std::numeric_limits<std::int16_t>::min)());
    check_round_trip(conn, "int2", (std::numeric_limits<std::int16_t>::max)());
    check_round_trip(conn, "int4", std::int32_t(0));
    check_round_trip(conn, "int4", (std::numeric_limits<std::int32_t>::min)());
    check_round_trip(conn, "int4", (std::numeric_limits<std::int32_t>::max)());
    check_round_trip(conn, "int8", (std::numeric_limits<std::int64_t>::min)());
    check_round_trip(conn, "int8", (std::numeric_limits<std::int64_t>::max)());
    check_round_trip(conn, "float4", -1.5f);
    check_round_trip(conn, "float8", 3.25);
    check_round_trip(conn, "float8", -0.125);
    check_round_trip(conn, "numeric", numeric(1, 4));
    check_round_trip(conn, "numeric", numeric(-123456789));
    check_round_trip(conn, "text", "hello");
    check_round_trip(conn, "text", "\xc3\xb1" "and\xc3\xba\twith tabs \xe2\x82\xac");
    check_round_trip(conn, "varchar", "");
    check_round_trip(conn, "bytea", random_bytes(8192u));
    check_round_trip(conn, "bytea", bytes{});
    check_round_trip(
        conn,
        "uuid",
        uuid{0xa0, 0xee, 0xbc, 0x99, 0x9c, 0x0b, 0x4e, 0xf8, 0xbb, 0x6d, 0x6b, 0xb9, 0xbd, 0x38, 0x0a, 0x11}
    );
    check_round_trip(conn, "date", date(std::chrono::year{2024} / 3 / 5));
    check_round_trip(conn, "date", date(std::chrono::year{1999} / 12 / 31));
    check_round_trip(conn, "time", time_of_day(13h + 45min + 30s + 250us));
    check_round_trip(
        conn,
        "timestamp",
        timestamp(std::chrono::local_days{std::chrono::year{2024} / 1 / 15} + 10h + 123456us)
    );
    check_round_trip(
        conn,
        "timestamptz",
        timestamptz(std::chrono::sys_days{std::chrono::year{1970} / 1 / 1} + 1us)
    );
    check_round_trip(conn, "interval", interval{90min, 2, 14});
    check_round_trip(conn, "point", point{1.5, -2.0});
    check_round_trip(conn, "varbit", make_bits("10110"));
}

void test_array_round_trip()
{
    auto conn = make_connection();

    check_round_trip(conn, "int4[]", make_array({std::int32_t(1), null, std::int32_t(-3)}));
    check_round_trip(
        conn,
        "text[]",
        make_array({
            make_array({"a", "b c"}),
            make_array({"{}", null}),
    })
    );
    check_round_trip(conn, "int8[]", array_value{});
}

void test_array_in_record()
{
    auto conn = make_connection();

    auto res = conn.execute("SELECT row(ARRAY[1, 2, 3])");
    PGWIRE_TEST_EQ(res.rows.size(), 1u);
    PGWIRE_TEST_EQ(res.rows.at(0).size(), 1u);
    value expected = make_row({make_array({std::int32_t(1), std::int32_t(2), std::int32_t(3)})});
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), expected);

    res = conn.execute("SELECT row(ARRAY['x', NULL, 'y z'])");
    expected = make_row({make_array({"x", null, "y z"})});
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), expected);

    res = conn.execute("SELECT row(ARRAY[true, false])");
    expected = make_row({make_array({true, false})});
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), expected);

    res = conn.execute("SELECT row(ARRAY[1.5::float8, -2.25::float8])");
    expected = make_row({make_array({1.5, -2.25})});
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), expected);

    // Bit strings keep their declared width
    res = conn.execute("SELECT row(ARRAY[cast(32 as bit(16))])");
    expected = make_row({make_array({make_bits("0000000000100000")})});
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), expected);

    // Same in text format
    auto text_res = conn.query("SELECT ARRAY[1, 2, 3]");
    PGWIRE_TEST_EQ(
        text_res.at(0).rows.at(0).at(0),
        value(make_array({std::int32_t(1), std::int32_t(2), std::int32_t(3)}))
    );
}

void test_unprepare_statement()
{
    auto conn = make_connection();

    conn.prepare("test", "SELECT true");
    conn.unprepare("test");
    conn.prepare("test", "SELECT false");
    auto res = conn.execute_prepared("test");

    PGWIRE_TEST_EQ(res.rows.size(), 1u);
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), value(false));
}

void test_prepare_again()
{
    // Without unpreparing first
    auto conn = make_connection();

    conn.prepare("test", "SELECT 1");
    conn.prepare("test", "SELECT 'replaced'");
    auto res = conn.execute_prepared("test");

    PGWIRE_TEST_EQ(res.rows.at(0).at(0), value("replaced"));
}

void test_prepared_params()
{
    auto conn = make_connection();

    const auto& stmt = conn.prepare("add", "SELECT $1::int4 + $2::int8 AS total");
    PGWIRE_TEST_EQ(stmt.parameter_types.size(), 2u);
    PGWIRE_TEST_EQ(stmt.fields.size(), 1u);
    PGWIRE_TEST_EQ(stmt.fields.at(0).name, "total");

    const std::vector<value> params{std::int32_t(40), std::int64_t(2)};
    auto res = conn.execute_prepared("add", params);
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), value(std::int64_t(42)));

    // NULL for any type
    const std::vector<value> null_params{null, std::int64_t(2)};
    res = conn.execute_prepared("add", null_params);
    PGWIRE_TEST(res.rows.at(0).at(0).is_null());

    PGWIRE_TEST_THROWS_ERROR(conn.execute_prepared("add"), client_errc::parameter_count_mismatch);
}

void test_error_isolation()
{
    auto conn = make_connection();

    BOOST_TEST(
        throws_condition([&] { conn.query("SELEC 1"); }, sqlstate_class::syntax_error_or_access_rule_violation)
    );
    PGWIRE_TEST(conn.is_open());

    auto res = conn.query("SELECT 1");
    PGWIRE_TEST_EQ(res.at(0).rows.at(0).at(0), value(std::int32_t(1)));
}

void test_unique_violation()
{
    auto conn = make_connection();
    conn.query("CREATE TEMP TABLE uv (id int4 PRIMARY KEY)");
    conn.query("INSERT INTO uv VALUES (1)");

    PGWIRE_TEST_THROWS_ERROR(conn.query("INSERT INTO uv VALUES (1)"), sqlstate::unique_violation);
    BOOST_TEST(
        throws_condition([&] { conn.query("INSERT INTO uv VALUES (1)"); }, sqlstate_class::integrity_constraint_violation)
    );

    try
    {
        conn.query("INSERT INTO uv VALUES (1)");
        BOOST_ERROR("No exception was thrown");
    }
    catch (const error_with_diagnostics& err)
    {
        PGWIRE_TEST_EQ(err.get_diagnostics().sqlstate(), "23505");
        PGWIRE_TEST_EQ(err.get_diagnostics().severity(), "ERROR");
        PGWIRE_TEST(err.get_diagnostics().constraint_name().has_value());
        PGWIRE_TEST(err.get_diagnostics().detail().has_value());
    }
}

void test_custom_decoder()
{
    auto conn = make_connection();
    auto table = read_table::derive(read_table::builtin());
    table->set_decoder(
        types::pg_oid_type::point,
        [](std::span<const unsigned char> data, std::int32_t oid, const read_table&, value& to) -> error_code {
            value pt;
            if (auto ec = read_table::builtin()->decode_binary(oid, data, pt))
                return ec;
            const auto& p = pt.as<point>();
            to = "(" + std::to_string(static_cast<int>(p.x)) + " . " + std::to_string(static_cast<int>(p.y)) + ")";
            return {};
        }
    );

    {
        scoped_read_table guard(conn, table);
        auto res = conn.execute("SELECT point(10, 20)");
        PGWIRE_TEST_EQ(res.rows.at(0).at(0), value("(10 . 20)"));

        // Nested occurrences use the same table
        res = conn.execute("SELECT ARRAY[point(1, 2)]");
        PGWIRE_TEST_EQ(res.rows.at(0).at(0), value(make_array({"(1 . 2)"})));
    }

    auto res = conn.execute("SELECT point(30, 40)");
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), value(point{30.0, 40.0}));
}

// Records decode to a custom string while the table is installed, then back to row_value
void test_custom_record_decoder()
{
    auto conn = make_connection();
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
        auto res = conn.execute("SELECT (10, 20)");
        PGWIRE_TEST_EQ(res.rows.at(0).at(0), value("(10 . 20)"));
    }

    auto res = conn.execute("SELECT (10, 20)");
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), value(make_row({std::int32_t(10), std::int32_t(20)})));
}

void test_copy()
{
    auto conn = make_connection();
    conn.query("CREATE TEMP TABLE copy_target (id int4, name text, d date, ts timestamp, tags int4[])");

    const std::vector<std::vector<value>> rows{
        {std::int32_t(1),
         "plain",
         date(std::chrono::year{2024} / 1 / 15),
         timestamp(std::chrono::local_days{std::chrono::year{2024} / 1 / 15} + 10h),
         make_array({std::int32_t(1), std::int32_t(2)})},
        {std::int32_t(2),
         "\xc3\xb1" "and\xc3\xba\ttab",
         date(std::chrono::year{1999} / 12 / 31),
         timestamp(std::chrono::local_days{std::chrono::year{1999} / 12 / 31} + 23h + 59min + 59s + 999999us),
         make_array({})},
        {std::int32_t(3),
         "\xe2\x82\xac uro",
         date(std::chrono::year{2000} / 1 / 1),
         timestamp(std::chrono::local_days{std::chrono::year{2000} / 1 / 1}),
         make_array({null, std::int32_t(-7)})},
        {std::int32_t(4), null, null, null, null},
    };

    {
        copy_writer writer(conn, "copy_target", {"id", "name", "d", "ts", "tags"});
        for (const auto& row : rows)
            writer.write_row(row);
        PGWIRE_TEST_EQ(writer.rows_written(), 4u);
        PGWIRE_TEST_EQ(writer.close(), 4u);
    }

    auto res = conn.execute("SELECT id, name, d, ts, tags FROM copy_target ORDER BY id");
    PGWIRE_TEST_EQ(res.rows.size(), rows.size());
    for (std::size_t i = 0; i < rows.size() && i < res.rows.size(); ++i)
    {
        context_frame frame("row " + std::to_string(i));
        PGWIRE_TEST_EQ(res.rows[i].size(), rows[i].size());
        for (std::size_t j = 0; j < rows[i].size() && j < res.rows[i].size(); ++j)
            PGWIRE_TEST_EQ(res.rows[i][j], rows[i][j]);
    }
}

void test_copy_abort()
{
    auto conn = make_connection();
    conn.query("CREATE TEMP TABLE copy_abort (id int4)");

    {
        copy_writer writer(conn, "copy_abort", {"id"});
        const std::vector<value> row{std::int32_t(1)};
        writer.write_row(row);
        PGWIRE_TEST_THROWS_ERROR(writer.abort("test abort"), sqlstate::query_canceled);
    }

    // Nothing was inserted, and the connection is usable
    auto res = conn.execute("SELECT count(*) FROM copy_abort");
    PGWIRE_TEST_EQ(res.rows.at(0).at(0), value(std::int64_t(0)));
}

void test_notices()
{
    auto conn = make_connection();
    std::vector<std::string> notices;
    conn.set_notice_handler([&](const diagnostics& diag) { notices.emplace_back(diag.server_message()); });

    conn.query("DO $$ BEGIN RAISE NOTICE 'hello from the server'; END $$");

    PGWIRE_TEST_EQ(notices.size(), 1u);
    if (!notices.empty())
        PGWIRE_TEST_EQ(notices[0], "hello from the server");
}

void test_cancel()
{
    auto conn = make_connection();
    auto key = conn.backend_key();
    auto params = test_params();

    std::exception_ptr cancel_error;
    std::thread canceller([&] {
        try
        {
            std::this_thread::sleep_for(500ms);
            cancel_request(params, key);
        }
        catch (const std::exception&)
        {
            cancel_error = std::current_exception();
        }
    });

    PGWIRE_TEST_THROWS_ERROR(conn.query("SELECT pg_sleep(30)"), sqlstate::query_canceled);
    canceller.join();
    PGWIRE_TEST(!cancel_error);

    // The session survives
    auto res = conn.query("SELECT 1");
    PGWIRE_TEST_EQ(res.size(), 1u);
}

void test_session_state()
{
    auto conn = make_connection();

    PGWIRE_TEST(conn.parameter("server_version").has_value());
    PGWIRE_TEST(conn.parameter("client_encoding") == std::optional<std::string_view>("UTF8"));
    PGWIRE_TEST(conn.backend_key().process_id != 0);

    conn.query("BEGIN");
    PGWIRE_TEST(conn.status() == protocol::transaction_status::in_transaction);
    PGWIRE_TEST_THROWS_ERROR(conn.query("SELECT 1/0"), sqlstate::division_by_zero);
    PGWIRE_TEST(conn.status() == protocol::transaction_status::failed);
    conn.query("ROLLBACK");
    PGWIRE_TEST(conn.status() == protocol::transaction_status::idle);

    conn.close();
    PGWIRE_TEST(!conn.is_open());
}

}  // namespace

int main()
{
    if (!std::getenv("PGWIRE_TEST_HOST"))
    {
        std::cout << "PGWIRE_TEST_HOST is not set, skipping\n";
        return 77;
    }

    test_scalar_round_trip();
    test_array_round_trip();
    test_array_in_record();
    test_unprepare_statement();
    test_prepare_again();
    test_prepared_params();
    test_error_isolation();
    test_unique_violation();
    test_custom_decoder();
    test_custom_record_decoder();
    test_copy();
    test_copy_abort();
    test_notices();
    test_cancel();
    test_session_state();

    return boost::report_errors();
}
