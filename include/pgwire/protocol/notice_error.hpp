//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_NOTICE_ERROR_HPP
#define PGWIRE_PROTOCOL_NOTICE_ERROR_HPP

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

namespace pgwire {
namespace protocol {

// Errors and notices. error_response and notice_response share the same structure.
// All of the fields are optional, and user-defined functions may use them as they like,
// so we tolerate almost anything in them.
// See https://www.postgresql.org/docs/current/protocol-error-fields.html
struct error_notice_fields
{
    // ERROR, FATAL, or PANIC (in an error message), or WARNING, NOTICE, DEBUG, INFO, or LOG
    // (in a notice message). Non-localized.
    std::optional<std::string_view> severity;

    // Like severity, but possibly localized.
    std::optional<std::string_view> localized_severity;

    // SQLSTATE code
    std::optional<std::string_view> sqlstate;

    // The primary human-readable error message. Typically one line.
    std::optional<std::string_view> message;

    // An optional secondary error message carrying more detail about the problem.
    std::optional<std::string_view> detail;

    // An optional suggestion what to do about the problem.
    std::optional<std::string_view> hint;

    // A decimal ASCII integer, indicating an error cursor position as an index into the original
    // query string. The first character has index 1, and positions are measured in characters not bytes.
    std::optional<std::string_view> position;

    // Like position, but refers to internal_query.
    std::optional<std::string_view> internal_position;

    // The text of a failed internally-generated command (e.g. an SQL query issued by a PL/pgSQL function).
    std::optional<std::string_view> internal_query;

    // Context in which the error occurred (call stack traceback, one entry per line).
    std::optional<std::string_view> where;

    std::optional<std::string_view> schema_name;
    std::optional<std::string_view> table_name;
    std::optional<std::string_view> column_name;
    std::optional<std::string_view> data_type_name;

    // Indexes are treated as constraints, even if they weren't created with constraint syntax.
    std::optional<std::string_view> constraint_name;

    // Source code location where the error was reported.
    std::optional<std::string_view> file_name;
    std::optional<std::string_view> line_number;
    std::optional<std::size_t> parsed_line_number() const;
    std::optional<std::string_view> routine;
};

struct error_response : error_notice_fields
{
};
boost::system::error_code parse(std::span<const unsigned char> data, error_response& to);

struct notice_response : error_notice_fields
{
};
boost::system::error_code parse(std::span<const unsigned char> data, notice_response& to);

}  // namespace protocol
}  // namespace pgwire

#endif
