//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_COPY_WRITER_HPP
#define PGWIRE_COPY_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pgwire/connection.hpp"
#include "pgwire/value.hpp"

namespace pgwire {

namespace detail {
class connection_impl;
}

// Bulk-inserts rows into a table using COPY ... FROM STDIN (FORMAT BINARY).
// While open, the connection rejects other operations with client_errc::connection_busy.
// The writer must not outlive its connection.
// Table and column names are inserted in the generated SQL as given, so quote them if required
class copy_writer
{
public:
    // Looks up the column types with the server. An empty column list means all columns
    copy_writer(connection& conn, std::string_view table, std::vector<std::string> columns);

    // Uses the given column types, one per column
    copy_writer(
        connection& conn,
        std::string_view table,
        std::vector<std::string> columns,
        std::vector<std::int32_t> column_types
    );

    copy_writer(const copy_writer&) = delete;
    copy_writer& operator=(const copy_writer&) = delete;

    // Aborts the operation if still open, logging any error
    ~copy_writer();

    // Encodes and sends a row. values must contain one value per column.
    // A row that can't be encoded is not sent, and the writer remains open
    void write_row(std::span<const value> values);

    // Finishes the operation. Returns the number of rows copied
    std::uint64_t close();

    // Cancels the operation. No row is inserted. Throws the error the server reports
    void abort(std::string_view reason);

    bool is_open() const noexcept { return state_ == state_t::open; }
    std::size_t rows_written() const noexcept { return rows_written_; }
    const std::vector<std::int32_t>& column_types() const noexcept { return column_types_; }

private:
    enum class state_t
    {
        open,
        finished,
        aborted,
    };

    detail::connection_impl* impl_;
    std::vector<std::string> columns_;
    std::vector<std::int32_t> column_types_;
    state_t state_{state_t::aborted};
    std::size_t rows_written_{};

    void start(std::string_view table);
    void check_open() const;
    void flush_rows();
};

}  // namespace pgwire

#endif
