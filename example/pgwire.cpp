//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Connects using the PGHOST, PGUSER, PGPASSWORD... environment variables
// and runs a few statements

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "pgwire/connect_params.hpp"
#include "pgwire/connection.hpp"
#include "pgwire/copy_writer.hpp"
#include "pgwire/diagnostics.hpp"
#include "pgwire/row_reader.hpp"
#include "pgwire/sqlstate.hpp"
#include "pgwire/value.hpp"

using namespace pgwire;

static void run()
{
    // Connect
    connection conn;
    conn.connect(connect_params_from_env());
    std::cout << "Connected to server version " << conn.parameter("server_version").value_or("unknown") << '\n';

    // Simple queries. Several statements may be sent at once
    auto results = conn.query(
        "CREATE TEMP TABLE products (id int4 PRIMARY KEY, name text, price numeric, added date);"
        "INSERT INTO products VALUES (1, 'apple', 0.5, '2024-01-15'), (2, 'pear', 0.75, '2024-02-01')"
    );
    std::cout << "Inserted " << results.at(1).affected_rows() << " rows\n";

    // Prepared statements. Parameters are sent separately from the query text
    conn.prepare("by_id", "SELECT name, price FROM products WHERE id = $1");
    const std::vector<value> params{std::int32_t(2)};
    auto res = conn.execute_prepared("by_id", params);
    for (const auto& row : res.rows)
        std::cout << "Product 2: " << row.at(0) << ", price " << row.at(1) << '\n';

    // Bulk loading
    {
        copy_writer writer(conn, "products", {"id", "name", "price", "added"});
        for (std::int32_t i = 3; i < 100; ++i)
        {
            const std::vector<value> row{
                i,
                "product " + std::to_string(i),
                numeric(i, 10),
                date(std::chrono::year{2024} / 3 / 1),
            };
            writer.write_row(row);
        }
        std::cout << "Copied " << writer.close() << " rows\n";
    }

    // Folding rows without storing them
    auto totals = conn.query(
        "SELECT price FROM products",
        callback_reader<double>([](double& total, const raw_row& row) {
            value price;
            if (auto ec = row.decode(0, price))
                return ec;
            total += static_cast<double>(price.as<numeric>());
            return boost::system::error_code();
        })
    );
    std::cout << "Total price: " << totals.at(0) << '\n';

    // Server errors are reported as exceptions. The connection remains usable
    try
    {
        conn.query("INSERT INTO products VALUES (1, 'duplicate', 1, NULL)");
    }
    catch (const error_with_diagnostics& err)
    {
        if (err.code() == sqlstate_class::integrity_constraint_violation)
            std::cout << "Constraint violated: " << err.get_diagnostics().message() << '\n';
        else
            throw;
    }

    conn.close();
}

int main()
{
    try
    {
        run();
    }
    catch (const error_with_diagnostics& err)
    {
        std::cerr << "Error: " << err.what() << '\n' << "Server diagnostics: " << err.get_diagnostics().message() << '\n';
        return 1;
    }
    catch (const std::exception& err)
    {
        std::cerr << "Error: " << err.what() << '\n';
        return 1;
    }
}
