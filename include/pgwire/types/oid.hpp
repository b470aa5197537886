//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_TYPES_OID_HPP
#define PGWIRE_TYPES_OID_HPP

#include <cstdint>
#include <string_view>

namespace pgwire {
namespace types {

/// PostgreSQL built-in type OIDs.
/// Source: pg_type.dat (PostgreSQL source)
enum class pg_oid_type : std::int32_t
{
    // Boolean & binary
    bool_ = 16,
    bytea = 17,
    char_ = 18,
    name = 19,
    int8 = 20,
    int2 = 21,
    int4 = 23,
    regproc = 24,
    text = 25,
    oid = 26,
    xid = 28,
    cid = 29,

    // Numeric types
    float4 = 700,
    float8 = 701,
    money = 790,
    numeric = 1700,

    // Character string types
    varchar = 1043,
    bpchar = 1042,
    json = 114,
    jsonb = 3802,
    xml = 142,
    unknown = 705,
    uuid = 2950,

    // Bit strings
    bit = 1560,
    varbit = 1562,

    // Geometric
    point = 600,

    // Date & time types
    date = 1082,
    time = 1083,
    timestamp = 1114,
    timestamptz = 1184,
    interval = 1186,

    // Anonymous composite
    record = 2249,

    // Arrays
    bool_array = 1000,
    bytea_array = 1001,
    char_array = 1002,
    name_array = 1003,
    int2_array = 1005,
    int4_array = 1007,
    regproc_array = 1008,
    text_array = 1009,
    xid_array = 1011,
    cid_array = 1012,
    bpchar_array = 1014,
    varchar_array = 1015,
    int8_array = 1016,
    point_array = 1017,
    float4_array = 1021,
    float8_array = 1022,
    oid_array = 1028,
    money_array = 791,
    xml_array = 143,
    json_array = 199,
    date_array = 1182,
    time_array = 1183,
    timestamp_array = 1115,
    timestamptz_array = 1185,
    interval_array = 1187,
    bit_array = 1561,
    varbit_array = 1563,
    numeric_array = 1231,
    record_array = 2287,
    uuid_array = 2951,
    jsonb_array = 3807,
};

/// The raw OID, as it appears on the wire
constexpr std::int32_t to_oid(pg_oid_type t) noexcept { return static_cast<std::int32_t>(t); }

/// The SQL name of a built-in type (e.g. "int4", "_int4" for arrays). Empty for other OIDs
std::string_view to_string(pg_oid_type t) noexcept;

}  // namespace types
}  // namespace pgwire

#endif
