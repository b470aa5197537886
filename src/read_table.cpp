//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codecs.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/read_table.hpp"
#include "pgwire/types/oid.hpp"
#include "pgwire/value.hpp"

using namespace pgwire;
using boost::system::error_code;

namespace {

std::shared_ptr<const read_table> make_builtin()
{
    auto res = std::make_shared<read_table>();
    detail::register_binary_codecs(*res);
    detail::register_text_codecs(*res);
    return res;
}

std::mutex default_table_mtx;
std::shared_ptr<const read_table> default_table;

}  // namespace

std::shared_ptr<const read_table> read_table::builtin()
{
    static const std::shared_ptr<const read_table> res = make_builtin();
    return res;
}

void read_table::set_decoder(std::int32_t oid, binary_decoder binary, text_decoder text)
{
    auto& entry = codecs_[oid];
    if (binary)
        entry.decode_binary = std::move(binary);
    if (text)
        entry.decode_text = std::move(text);
}

void read_table::set_encoder(std::int32_t oid, binary_encoder encoder) { codecs_[oid].encode_binary = std::move(encoder); }

void read_table::set_codec(std::int32_t oid, type_codec codec) { codecs_[oid] = std::move(codec); }

void read_table::set_array_type(std::int32_t array_oid, std::int32_t element_oid)
{
    array_elements_[array_oid] = element_oid;
}

template <class Fn>
const Fn* read_table::find_fn(std::int32_t oid, Fn type_codec::*member) const
{
    for (const read_table* table = this; table; table = table->parent_.get())
    {
        auto it = table->codecs_.find(oid);
        if (it != table->codecs_.end() && it->second.*member)
            return &(it->second.*member);
    }
    return nullptr;
}

const binary_decoder* read_table::find_binary_decoder(std::int32_t oid) const
{
    return find_fn(oid, &type_codec::decode_binary);
}

const text_decoder* read_table::find_text_decoder(std::int32_t oid) const
{
    return find_fn(oid, &type_codec::decode_text);
}

const binary_encoder* read_table::find_binary_encoder(std::int32_t oid) const
{
    return find_fn(oid, &type_codec::encode_binary);
}

std::optional<std::int32_t> read_table::element_type(std::int32_t array_oid) const
{
    for (const read_table* table = this; table; table = table->parent_.get())
    {
        auto it = table->array_elements_.find(array_oid);
        if (it != table->array_elements_.end())
            return it->second;
    }
    return std::nullopt;
}

error_code read_table::decode_binary(
    std::int32_t oid,
    std::optional<std::span<const unsigned char>> data,
    value& to
) const
{
    if (!data)
    {
        to = null;
        return {};
    }
    const auto* decoder = find_binary_decoder(oid);
    if (!decoder)
        return client_errc::unknown_type_oid;
    return (*decoder)(*data, oid, *this, to);
}

error_code read_table::decode_text(std::int32_t oid, std::optional<std::span<const unsigned char>> data, value& to)
    const
{
    if (!data)
    {
        to = null;
        return {};
    }
    auto text = detail::to_string_view(*data);
    const auto* decoder = find_text_decoder(oid);
    if (!decoder)
    {
        if (!detail::is_valid_utf8(text))
            return client_errc::invalid_utf8;
        to = std::string(text);
        return {};
    }
    return (*decoder)(text, oid, *this, to);
}

error_code read_table::encode_binary(std::int32_t oid, const value& from, std::vector<unsigned char>& to) const
{
    const auto* encoder = find_binary_encoder(oid);
    if (!encoder)
        return client_errc::unknown_type_oid;
    return (*encoder)(from, oid, *this, to);
}

std::shared_ptr<const read_table> pgwire::default_read_table()
{
    std::lock_guard<std::mutex> guard(default_table_mtx);
    if (!default_table)
        default_table = read_table::builtin();
    return default_table;
}

void pgwire::install_default_read_table(std::shared_ptr<const read_table> table)
{
    std::lock_guard<std::mutex> guard(default_table_mtx);
    default_table = table ? std::move(table) : read_table::builtin();
}

std::string_view types::to_string(pg_oid_type t) noexcept
{
    switch (t)
    {
    case pg_oid_type::bool_: return "bool";
    case pg_oid_type::bytea: return "bytea";
    case pg_oid_type::char_: return "char";
    case pg_oid_type::name: return "name";
    case pg_oid_type::int8: return "int8";
    case pg_oid_type::int2: return "int2";
    case pg_oid_type::int4: return "int4";
    case pg_oid_type::regproc: return "regproc";
    case pg_oid_type::text: return "text";
    case pg_oid_type::oid: return "oid";
    case pg_oid_type::xid: return "xid";
    case pg_oid_type::cid: return "cid";
    case pg_oid_type::float4: return "float4";
    case pg_oid_type::float8: return "float8";
    case pg_oid_type::money: return "money";
    case pg_oid_type::numeric: return "numeric";
    case pg_oid_type::varchar: return "varchar";
    case pg_oid_type::bpchar: return "bpchar";
    case pg_oid_type::json: return "json";
    case pg_oid_type::jsonb: return "jsonb";
    case pg_oid_type::xml: return "xml";
    case pg_oid_type::unknown: return "unknown";
    case pg_oid_type::uuid: return "uuid";
    case pg_oid_type::bit: return "bit";
    case pg_oid_type::varbit: return "varbit";
    case pg_oid_type::point: return "point";
    case pg_oid_type::date: return "date";
    case pg_oid_type::time: return "time";
    case pg_oid_type::timestamp: return "timestamp";
    case pg_oid_type::timestamptz: return "timestamptz";
    case pg_oid_type::interval: return "interval";
    case pg_oid_type::record: return "record";
    case pg_oid_type::bool_array: return "_bool";
    case pg_oid_type::bytea_array: return "_bytea";
    case pg_oid_type::char_array: return "_char";
    case pg_oid_type::name_array: return "_name";
    case pg_oid_type::int2_array: return "_int2";
    case pg_oid_type::int4_array: return "_int4";
    case pg_oid_type::regproc_array: return "_regproc";
    case pg_oid_type::text_array: return "_text";
    case pg_oid_type::xid_array: return "_xid";
    case pg_oid_type::cid_array: return "_cid";
    case pg_oid_type::bpchar_array: return "_bpchar";
    case pg_oid_type::varchar_array: return "_varchar";
    case pg_oid_type::int8_array: return "_int8";
    case pg_oid_type::point_array: return "_point";
    case pg_oid_type::float4_array: return "_float4";
    case pg_oid_type::float8_array: return "_float8";
    case pg_oid_type::oid_array: return "_oid";
    case pg_oid_type::money_array: return "_money";
    case pg_oid_type::xml_array: return "_xml";
    case pg_oid_type::json_array: return "_json";
    case pg_oid_type::date_array: return "_date";
    case pg_oid_type::time_array: return "_time";
    case pg_oid_type::timestamp_array: return "_timestamp";
    case pg_oid_type::timestamptz_array: return "_timestamptz";
    case pg_oid_type::interval_array: return "_interval";
    case pg_oid_type::bit_array: return "_bit";
    case pg_oid_type::varbit_array: return "_varbit";
    case pg_oid_type::numeric_array: return "_numeric";
    case pg_oid_type::record_array: return "_record";
    case pg_oid_type::uuid_array: return "_uuid";
    case pg_oid_type::jsonb_array: return "_jsonb";
    default: return {};
    }
}
