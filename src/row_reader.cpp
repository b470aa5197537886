//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pgwire/protocol/common.hpp"
#include "pgwire/protocol/describe.hpp"
#include "pgwire/row_reader.hpp"
#include "pgwire/value.hpp"

using namespace pgwire;
using boost::system::error_code;

field_descriptor pgwire::to_field_descriptor(const protocol::field_description& desc)
{
    return {
        .name = std::string(desc.name),
        .table_oid = desc.table_oid,
        .column_attribute = desc.column_attribute,
        .type_oid = desc.type_oid,
        .type_size = desc.type_length,
        .type_modifier = desc.type_modifier,
        .format = desc.fmt_code,
    };
}

error_code raw_row::decode(std::size_t i, value& to) const
{
    const auto& field = fields_[i];
    return field.format == protocol::format_code::binary ? table_->decode_binary(field.type_oid, values_[i], to)
                                                         : table_->decode_text(field.type_oid, values_[i], to);
}

std::uint64_t pgwire::affected_rows(std::string_view command_tag)
{
    // The count is the last word, if it's a number
    auto pos = command_tag.rfind(' ');
    if (pos == std::string_view::npos)
        return 0u;
    auto count = command_tag.substr(pos + 1);
    std::uint64_t res{};
    auto parse_res = std::from_chars(count.data(), count.data() + count.size(), res);
    if (parse_res.ec != std::errc() || parse_res.ptr != count.data() + count.size())
        return 0u;
    return res;
}

void rows_reader::on_row_description(std::span<const field_descriptor> fields)
{
    current_ = result_set{};
    current_.fields.assign(fields.begin(), fields.end());
}

error_code rows_reader::on_row(const raw_row& row)
{
    std::vector<value> values(row.size());
    for (std::size_t i = 0; i < row.size(); ++i)
    {
        if (auto ec = row.decode(i, values[i]))
            return ec;
    }
    current_.rows.push_back(std::move(values));
    return {};
}

result_set rows_reader::on_complete(std::string_view tag)
{
    current_.command_tag = tag;
    return std::exchange(current_, result_set{});
}

void named_rows_reader::on_row_description(std::span<const field_descriptor> fields)
{
    current_ = named_result_set{};
    current_.fields.assign(fields.begin(), fields.end());
}

error_code named_rows_reader::on_row(const raw_row& row)
{
    std::vector<std::pair<std::string, value>> values;
    values.reserve(row.size());
    for (std::size_t i = 0; i < row.size(); ++i)
    {
        value v;
        if (auto ec = row.decode(i, v))
            return ec;
        values.emplace_back(row.field(i).name, std::move(v));
    }
    current_.rows.push_back(std::move(values));
    return {};
}

named_result_set named_rows_reader::on_complete(std::string_view tag)
{
    current_.command_tag = tag;
    return std::exchange(current_, named_result_set{});
}
