//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_READ_TABLE_HPP
#define PGWIRE_READ_TABLE_HPP

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pgwire/types/oid.hpp"
#include "pgwire/value.hpp"

namespace pgwire {

class read_table;

// Decodes a non-NULL field in binary format. The table is the one active for the whole decode
// operation, so composite and array decoders can decode their members through it
using binary_decoder = std::function<boost::system::error_code(
    std::span<const unsigned char> data,
    std::int32_t oid,
    const read_table& table,
    value& to
)>;

// Decodes a non-NULL field in text format
using text_decoder = std::function<
    boost::system::error_code(std::string_view data, std::int32_t oid, const read_table& table, value& to)>;

// Appends the binary representation of a non-NULL value to to
using binary_encoder = std::function<boost::system::error_code(
    const value& from,
    std::int32_t oid,
    const read_table& table,
    std::vector<unsigned char>& to
)>;

// The functions registered for a type OID. Any of them may be empty
struct type_codec
{
    binary_decoder decode_binary;
    binary_encoder encode_binary;
    text_decoder decode_text;
};

// Maps type OIDs to codecs. A table may have a parent: lookups that miss
// (including missing functions within an entry) continue in the parent.
// Tables are shared between connections as shared_ptr<const read_table>,
// so derive a new one instead of modifying a table in use
class read_table
{
public:
    explicit read_table(std::shared_ptr<const read_table> parent = nullptr) noexcept
        : parent_(std::move(parent))
    {
    }

    // The immutable table containing the built-in codecs
    static std::shared_ptr<const read_table> builtin();

    // A new, empty table that falls back to parent
    static std::shared_ptr<read_table> derive(std::shared_ptr<const read_table> parent)
    {
        return std::make_shared<read_table>(std::move(parent));
    }

    const std::shared_ptr<const read_table>& parent() const noexcept { return parent_; }

    // Empty functions leave the ones registered in this table untouched
    void set_decoder(std::int32_t oid, binary_decoder binary, text_decoder text = {});
    void set_encoder(std::int32_t oid, binary_encoder encoder);
    void set_codec(std::int32_t oid, type_codec codec);

    void set_decoder(types::pg_oid_type oid, binary_decoder binary, text_decoder text = {})
    {
        set_decoder(types::to_oid(oid), std::move(binary), std::move(text));
    }
    void set_encoder(types::pg_oid_type oid, binary_encoder encoder)
    {
        set_encoder(types::to_oid(oid), std::move(encoder));
    }

    // Declares array_oid as an array of element_oid. Used by the text decoder and
    // the binary encoder, since their input doesn't carry the element type
    void set_array_type(std::int32_t array_oid, std::int32_t element_oid);

    // Lookups, following the parent chain. nullptr if not found
    const binary_decoder* find_binary_decoder(std::int32_t oid) const;
    const text_decoder* find_text_decoder(std::int32_t oid) const;
    const binary_encoder* find_binary_encoder(std::int32_t oid) const;
    std::optional<std::int32_t> element_type(std::int32_t array_oid) const;

    // Decodes a field. NULL fields (std::nullopt) decode to null.
    // A binary field whose OID has no decoder fails with client_errc::unknown_type_oid.
    // A text field whose OID has no decoder decodes to its raw text
    boost::system::error_code decode_binary(
        std::int32_t oid,
        std::optional<std::span<const unsigned char>> data,
        value& to
    ) const;
    boost::system::error_code decode_text(
        std::int32_t oid,
        std::optional<std::span<const unsigned char>> data,
        value& to
    ) const;

    // Appends the binary representation of a non-NULL value.
    // Fails with client_errc::unknown_type_oid if the OID has no encoder
    boost::system::error_code encode_binary(std::int32_t oid, const value& from, std::vector<unsigned char>& to)
        const;

private:
    std::shared_ptr<const read_table> parent_;
    std::unordered_map<std::int32_t, type_codec> codecs_;
    std::unordered_map<std::int32_t, std::int32_t> array_elements_;

    template <class Fn>
    const Fn* find_fn(std::int32_t oid, Fn type_codec::*member) const;
};

// The table used by connections that don't set one explicitly.
// Initially, read_table::builtin()
std::shared_ptr<const read_table> default_read_table();

// Replaces the process-wide default table. Affects connections created afterwards.
// Thread-safe
void install_default_read_table(std::shared_ptr<const read_table> table);

}  // namespace pgwire

#endif
