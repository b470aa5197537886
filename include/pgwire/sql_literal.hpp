//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SQL_LITERAL_HPP
#define PGWIRE_SQL_LITERAL_HPP

#include <string>
#include <string_view>

#include "pgwire/value.hpp"

namespace pgwire {

// Text of a value as it would appear in SQL. If needs_quoting is true,
// text must be passed through quote_literal before splicing it into a query
struct sql_string
{
    std::string text;
    bool needs_quoting{};

    friend bool operator==(const sql_string&, const sql_string&) = default;
};

// Formats values for building SQL text. This is independent of parameter encoding:
//   - NULL, true and false render as keywords.
//   - Numbers render in their exact decimal form. numeric values without one render as
//     a division: (1::numeric / 3).
//   - Everything else renders in the server's input syntax and needs quoting.
//     bytea renders as \x hex; arrays as {...} and records as (...) literals.
sql_string to_sql_string(const value& v);

// Wraps s in single quotes, doubling embedded quotes. If s contains backslashes,
// uses the E'' syntax, doubling them too
std::string quote_literal(std::string_view s);

// Wraps s in double quotes, doubling embedded double quotes
std::string quote_identifier(std::string_view s);

// to_sql_string plus quote_literal where needed
std::string to_sql_literal(const value& v);

}  // namespace pgwire

#endif
