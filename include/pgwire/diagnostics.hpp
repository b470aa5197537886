//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_DIAGNOSTICS_HPP
#define PGWIRE_DIAGNOSTICS_HPP

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <optional>
#include <string>
#include <string_view>

#include "pgwire/protocol/notice_error.hpp"

namespace pgwire {

// Owning version of the fields in an ErrorResponse or NoticeResponse.
// Messages point into the network buffer, so they must be copied before reading the next one
class diagnostics
{
    std::string msg_;
    std::string severity_;
    std::string sqlstate_;
    std::string server_message_;
    std::optional<std::string> detail_;
    std::optional<std::string> hint_;
    std::optional<std::string> position_;
    std::optional<std::string> internal_position_;
    std::optional<std::string> internal_query_;
    std::optional<std::string> where_;
    std::optional<std::string> schema_name_;
    std::optional<std::string> table_name_;
    std::optional<std::string> column_name_;
    std::optional<std::string> data_type_name_;
    std::optional<std::string> constraint_name_;
    std::optional<std::string> file_name_;
    std::optional<std::string> line_number_;
    std::optional<std::string> routine_;

public:
    diagnostics() = default;

    // A client-side message, without any server fields
    explicit diagnostics(std::string msg) noexcept : msg_(std::move(msg)) {}

    explicit diagnostics(const protocol::error_notice_fields& msg) { assign(msg); }

    void assign(const protocol::error_notice_fields& msg);

    // A formatted message, like "ERROR: 23505: duplicate key value violates unique constraint"
    std::string_view message() const { return msg_; }

    // Non-localized severity (ERROR, FATAL, PANIC, WARNING, NOTICE...)
    std::string_view severity() const { return severity_; }

    // The 5 character SQLSTATE. Empty for client errors
    std::string_view sqlstate() const { return sqlstate_; }

    // The primary human readable message, as sent by the server
    std::string_view server_message() const { return server_message_; }

    const std::optional<std::string>& detail() const { return detail_; }
    const std::optional<std::string>& hint() const { return hint_; }
    const std::optional<std::string>& position() const { return position_; }
    const std::optional<std::string>& internal_position() const { return internal_position_; }
    const std::optional<std::string>& internal_query() const { return internal_query_; }
    const std::optional<std::string>& where() const { return where_; }
    const std::optional<std::string>& schema_name() const { return schema_name_; }
    const std::optional<std::string>& table_name() const { return table_name_; }
    const std::optional<std::string>& column_name() const { return column_name_; }
    const std::optional<std::string>& data_type_name() const { return data_type_name_; }
    const std::optional<std::string>& constraint_name() const { return constraint_name_; }
    const std::optional<std::string>& file_name() const { return file_name_; }
    const std::optional<std::string>& line_number() const { return line_number_; }
    const std::optional<std::string>& routine() const { return routine_; }

    friend bool operator==(const diagnostics& lhs, const diagnostics& rhs) noexcept = default;
};

// An error code plus the diagnostics the server sent, if any
struct extended_error
{
    boost::system::error_code code;
    diagnostics diag;

    friend bool operator==(const extended_error& lhs, const extended_error& rhs) noexcept = default;
};

// Exception thrown by all the connection functions
class error_with_diagnostics : public boost::system::system_error
{
    diagnostics diag_;

public:
    error_with_diagnostics(const boost::system::error_code& ec, diagnostics diag)
        : boost::system::system_error(ec, std::string(diag.message())), diag_(std::move(diag))
    {
    }

    const diagnostics& get_diagnostics() const noexcept { return diag_; }
};

// Builds the error code and diagnostics for an ErrorResponse
extended_error to_extended_error(const protocol::error_response& err);

[[noreturn]] void throw_error(const extended_error& err);
[[noreturn]] void throw_error(boost::system::error_code ec, std::string_view message = {});

}  // namespace pgwire

#endif
