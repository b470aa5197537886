//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_ROW_READER_HPP
#define PGWIRE_ROW_READER_HPP

#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pgwire/protocol/common.hpp"
#include "pgwire/protocol/describe.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/value.hpp"

namespace pgwire {

// Owning version of a RowDescription field
struct field_descriptor
{
    std::string name;

    // The table and column this field comes from, or zero
    std::int32_t table_oid{};
    std::int16_t column_attribute{};

    std::int32_t type_oid{};

    // Negative values denote variable-width types
    std::int16_t type_size{};

    std::int32_t type_modifier{};
    protocol::format_code format{protocol::format_code::text};

    friend bool operator==(const field_descriptor&, const field_descriptor&) = default;
};

field_descriptor to_field_descriptor(const protocol::field_description& desc);

// A row as received from the server, before decoding.
// Points into the network buffer: only valid within on_row
class raw_row
{
    std::span<const field_descriptor> fields_;
    std::span<const std::optional<std::span<const unsigned char>>> values_;
    const read_table* table_;

public:
    raw_row(
        std::span<const field_descriptor> fields,
        std::span<const std::optional<std::span<const unsigned char>>> values,
        const read_table& table
    ) noexcept
        : fields_(fields), values_(values), table_(&table)
    {
        BOOST_ASSERT(fields.size() == values.size());
    }

    std::size_t size() const { return values_.size(); }
    const field_descriptor& field(std::size_t i) const { return fields_[i]; }
    std::span<const field_descriptor> fields() const { return fields_; }

    // The serialized value, or std::nullopt for NULL
    std::optional<std::span<const unsigned char>> raw_value(std::size_t i) const { return values_[i]; }
    bool is_null(std::size_t i) const { return !values_[i].has_value(); }

    // The table active for the operation
    const read_table& table() const { return *table_; }

    // Decodes the i-th value with the active table, according to its format
    boost::system::error_code decode(std::size_t i, value& to) const;
};

// Consumes the rows of one statement at a time.
//   - on_row_description is called when a statement returns rows.
//   - on_row is called for each row. Returning an error stops decoding: the rest of the
//     response is discarded and the operation fails with that error.
//   - on_complete is called when a statement finishes, with its command tag ("INSERT 0 1").
//     It's called for statements that don't return rows, too.
// Readers must leave themselves ready for the next statement after on_complete
template <class T>
concept row_reader = requires(
    T& reader,
    std::span<const field_descriptor> fields,
    const raw_row& row,
    std::string_view tag
) {
    typename T::result_type;
    { reader.on_row_description(fields) };
    { reader.on_row(row) } -> std::same_as<boost::system::error_code>;
    { reader.on_complete(tag) } -> std::same_as<typename T::result_type>;
};

// Type-erased reference to a row reader plus the vector where its results are stored
class row_reader_ref
{
    using on_row_description_fn = void (*)(void*, std::span<const field_descriptor>);
    using on_row_fn = boost::system::error_code (*)(void*, const raw_row&);
    using on_complete_fn = void (*)(void*, void*, std::string_view);

    void* obj_;
    void* results_;
    on_row_description_fn on_row_description_;
    on_row_fn on_row_;
    on_complete_fn on_complete_;

    template <class T>
    static void do_on_row_description(void* obj, std::span<const field_descriptor> fields)
    {
        static_cast<T*>(obj)->on_row_description(fields);
    }

    template <class T>
    static boost::system::error_code do_on_row(void* obj, const raw_row& row)
    {
        return static_cast<T*>(obj)->on_row(row);
    }

    template <class T>
    static void do_on_complete(void* obj, void* results, std::string_view tag)
    {
        static_cast<std::vector<typename T::result_type>*>(results)->push_back(
            static_cast<T*>(obj)->on_complete(tag)
        );
    }

public:
    template <row_reader T>
        requires(!std::same_as<T, row_reader_ref>)
    row_reader_ref(T& obj, std::vector<typename T::result_type>& results) noexcept
        : obj_(&obj),
          results_(&results),
          on_row_description_(&do_on_row_description<T>),
          on_row_(&do_on_row<T>),
          on_complete_(&do_on_complete<T>)
    {
    }

    void on_row_description(std::span<const field_descriptor> fields) { on_row_description_(obj_, fields); }
    boost::system::error_code on_row(const raw_row& row) { return on_row_(obj_, row); }
    void on_complete(std::string_view tag) { on_complete_(obj_, results_, tag); }
};

// The number of rows affected by a command, from its tag: "INSERT 0 5" => 5, "UPDATE 2" => 2.
// Zero for commands without a row count
std::uint64_t affected_rows(std::string_view command_tag);

//
// Readers
//

struct result_set
{
    std::vector<field_descriptor> fields;
    std::vector<std::vector<value>> rows;
    std::string command_tag;

    std::uint64_t affected_rows() const { return pgwire::affected_rows(command_tag); }
};

// Decodes every row into a vector of values, in column order
class rows_reader
{
    result_set current_;

public:
    using result_type = result_set;

    void on_row_description(std::span<const field_descriptor> fields);
    boost::system::error_code on_row(const raw_row& row);
    result_set on_complete(std::string_view tag);
};

struct named_result_set
{
    std::vector<field_descriptor> fields;
    std::vector<std::vector<std::pair<std::string, value>>> rows;
    std::string command_tag;
};

// Decodes every row into (column name, value) pairs, in column order
class named_rows_reader
{
    named_result_set current_;

public:
    using result_type = named_result_set;

    void on_row_description(std::span<const field_descriptor> fields);
    boost::system::error_code on_row(const raw_row& row);
    named_result_set on_complete(std::string_view tag);
};

// Folds the rows of each statement into a State, starting from initial
template <class State>
class callback_reader
{
public:
    using result_type = State;
    using row_function = std::function<boost::system::error_code(State&, const raw_row&)>;

    explicit callback_reader(row_function fn, State initial = State())
        : fn_(std::move(fn)), initial_(initial), current_(std::move(initial))
    {
    }

    void on_row_description(std::span<const field_descriptor>) { current_ = initial_; }
    boost::system::error_code on_row(const raw_row& row) { return fn_(current_, row); }
    State on_complete(std::string_view) { return std::exchange(current_, initial_); }

private:
    row_function fn_;
    State initial_;
    State current_;
};

// Discards rows, returning only the number of affected rows
class command_reader
{
public:
    using result_type = std::uint64_t;

    void on_row_description(std::span<const field_descriptor>) {}
    boost::system::error_code on_row(const raw_row&) { return {}; }
    std::uint64_t on_complete(std::string_view tag) { return affected_rows(tag); }
};

}  // namespace pgwire

#endif
