//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant2/variant.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

#include "base64.hpp"
#include "parse_context.hpp"
#include "pgwire/client_errc.hpp"
#include "pgwire/protocol/async.hpp"
#include "pgwire/protocol/bind.hpp"
#include "pgwire/protocol/cancel_request.hpp"
#include "pgwire/protocol/close.hpp"
#include "pgwire/protocol/common.hpp"
#include "pgwire/protocol/copy.hpp"
#include "pgwire/protocol/describe.hpp"
#include "pgwire/protocol/execute.hpp"
#include "pgwire/protocol/header.hpp"
#include "pgwire/protocol/messages.hpp"
#include "pgwire/protocol/notice_error.hpp"
#include "pgwire/protocol/parse.hpp"
#include "pgwire/protocol/query.hpp"
#include "pgwire/protocol/scram_sha256.hpp"
#include "pgwire/protocol/startup.hpp"
#include "pgwire/protocol/sync.hpp"
#include "serialization_context.hpp"

using namespace pgwire::protocol;

namespace {

enum class backend_message_type : char
{
    authentication_request = 'R',
    backend_key_data = 'K',
    bind_complete = '2',
    close_complete = '3',
    command_complete = 'C',
    copy_data = 'd',
    copy_done = 'c',
    copy_in_response = 'G',
    copy_out_response = 'H',
    copy_both_response = 'W',
    data_row = 'D',
    empty_query_response = 'I',
    error_response = 'E',
    negotiate_protocol_version = 'v',
    no_data = 'n',
    notice_response = 'N',
    notification_response = 'A',
    parameter_description = 't',
    parameter_status = 'S',
    parse_complete = '1',
    portal_suspended = 's',
    ready_for_query = 'Z',
    row_description = 'T',
};

enum class authentication_message_type : std::int32_t
{
    ok = 0,
    kerberos_v5 = 2,
    cleartext_password = 3,
    md5_password = 5,
    gss = 7,
    gss_continue = 8,
    sspi = 9,
    sasl = 10,
    sasl_continue = 11,
    sasl_final = 12,
};

template <class MessageType>
boost::system::error_code parse_impl(std::span<const unsigned char> from, any_backend_message& to)
{
    MessageType res{};
    auto ec = parse(from, res);
    if (!ec)
        to = res;
    return ec;
}

boost::system::error_code parse_authentication_request(
    std::span<const unsigned char> from,
    any_backend_message& to
)
{
    // Get the authentication request type code
    if (from.size() < 4u)
        return pgwire::client_errc::incomplete_message;
    auto type = static_cast<authentication_message_type>(boost::endian::load_big_s32(from.data()));
    from = from.subspan(4);

    switch (type)
    {
    case authentication_message_type::ok: return parse_impl<authentication_ok>(from, to);
    case authentication_message_type::kerberos_v5: return parse_impl<authentication_kerberos_v5>(from, to);
    case authentication_message_type::cleartext_password:
        return parse_impl<authentication_cleartext_password>(from, to);
    case authentication_message_type::md5_password: return parse_impl<authentication_md5_password>(from, to);
    case authentication_message_type::gss: return parse_impl<authentication_gss>(from, to);
    case authentication_message_type::gss_continue: return parse_impl<authentication_gss_continue>(from, to);
    case authentication_message_type::sspi: return parse_impl<authentication_sspi>(from, to);
    case authentication_message_type::sasl: return parse_impl<authentication_sasl>(from, to);
    case authentication_message_type::sasl_continue:
        return parse_impl<authentication_sasl_continue>(from, to);
    case authentication_message_type::sasl_final: return parse_impl<authentication_sasl_final>(from, to);
    default: return pgwire::client_errc::protocol_value_error;
    }
}

// https://www.postgresql.org/docs/current/protocol-error-fields.html
enum class error_field_type : unsigned char
{
    severity_i18n = 'S',
    severity = 'V',
    sqlstate = 'C',
    message = 'M',
    detail = 'D',
    hint = 'H',
    position = 'P',
    internal_position = 'p',
    internal_query = 'q',
    where = 'W',
    schema_name = 's',
    table_name = 't',
    column_name = 'c',
    data_type_name = 'd',
    constraint_name = 'n',
    file_name = 'F',
    line_number = 'L',
    routine = 'R',
};

void populate_field(detail::parse_context& ctx, error_field_type type, error_notice_fields& to)
{
    switch (type)
    {
    case error_field_type::severity_i18n: to.localized_severity = ctx.get_string(); break;
    case error_field_type::severity: to.severity = ctx.get_string(); break;
    case error_field_type::sqlstate: to.sqlstate = ctx.get_string(); break;
    case error_field_type::message: to.message = ctx.get_string(); break;
    case error_field_type::detail: to.detail = ctx.get_string(); break;
    case error_field_type::hint: to.hint = ctx.get_string(); break;
    case error_field_type::position: to.position = ctx.get_string(); break;
    case error_field_type::internal_position: to.internal_position = ctx.get_string(); break;
    case error_field_type::internal_query: to.internal_query = ctx.get_string(); break;
    case error_field_type::where: to.where = ctx.get_string(); break;
    case error_field_type::schema_name: to.schema_name = ctx.get_string(); break;
    case error_field_type::table_name: to.table_name = ctx.get_string(); break;
    case error_field_type::column_name: to.column_name = ctx.get_string(); break;
    case error_field_type::data_type_name: to.data_type_name = ctx.get_string(); break;
    case error_field_type::constraint_name: to.constraint_name = ctx.get_string(); break;
    case error_field_type::file_name: to.file_name = ctx.get_string(); break;
    case error_field_type::line_number: to.line_number = ctx.get_string(); break;
    case error_field_type::routine: to.routine = ctx.get_string(); break;
    default: ctx.get_string(); break;  // Unknown fields are skipped
    }
}

// Shared between errors and notices
boost::system::error_code parse_error_notice(std::span<const unsigned char> data, error_notice_fields& to)
{
    detail::parse_context ctx(data);

    // A collection of fields, with a 1 byte header stating the field meaning, followed by a string.
    // Terminated by a NULL byte.
    while (true)
    {
        // Get the type byte. On error, this returns 0, which is OK
        unsigned char type_byte = ctx.get_byte();
        if (type_byte == 0u)
            break;
        populate_field(ctx, static_cast<error_field_type>(type_byte), to);
    }

    return ctx.check();
}

bool is_valid_status(transaction_status v)
{
    switch (v)
    {
    case transaction_status::idle:
    case transaction_status::in_transaction:
    case transaction_status::failed: return true;
    default: return false;
    }
}

bool is_valid_format_code(format_code v)
{
    switch (v)
    {
    case format_code::text:
    case format_code::binary: return true;
    default: return false;
    }
}

// The size of the fixed-length fields in a field description of a RowDescription message
constexpr std::size_t field_description_fixed_size = 18u;

// Like format_code, but only in 1 byte. Used in copy messages
enum class overall_format_code : std::uint8_t
{
    text = 0,
    binary = 1,
};

bool is_valid_format_code(overall_format_code v)
{
    switch (v)
    {
    case overall_format_code::text:
    case overall_format_code::binary: return true;
    default: return false;
    }
}

// Shared between copy_in_response, copy_out_response, copy_both_response
boost::system::error_code parse_copy_response(
    std::span<const unsigned char> data,
    format_code& overall_code_output,
    random_access_parsing_view<format_code>& fmt_codes_output
)
{
    detail::parse_context ctx(data);

    // Overall format code
    auto overall_code = static_cast<overall_format_code>(ctx.get_byte());
    if (!is_valid_format_code(overall_code))
    {
        ctx.add_error(pgwire::client_errc::protocol_value_error);
        return ctx.check();
    }

    // If the overall format is text, subsequent codes should be text, too.
    const bool should_be_text = overall_code == overall_format_code::text;

    // Number of format codes
    auto num_items = static_cast<std::size_t>(ctx.get_nonnegative_integral<std::int16_t>());

    // Individual format codes start here
    const auto* fmt_codes_first = ctx.first();

    for (std::size_t i = 0; i < num_items; ++i)
    {
        auto code = static_cast<format_code>(ctx.get_integral<std::int16_t>());
        if ((should_be_text && code != format_code::text) || !is_valid_format_code(code))
            ctx.add_error(pgwire::client_errc::protocol_value_error);
    }

    overall_code_output = static_cast<format_code>(static_cast<std::int16_t>(overall_code));
    fmt_codes_output = {fmt_codes_first, num_items};

    return ctx.check();
}

// For messages that only have a header
boost::system::error_code serialize_header_only(char header, std::vector<unsigned char>& to)
{
    std::array<unsigned char, 5> buff{};
    auto ec = serialize_header({static_cast<unsigned char>(header), 0u}, buff);
    BOOST_ASSERT(!ec);
    to.insert(to.end(), buff.begin(), buff.end());
    return ec;
}

bool scram_is_printable(unsigned char c) { return (c >= 0x21 && c <= 0x2b) || (c >= 0x2d && c <= 0x7e); }

}  // namespace

//
// Framing
//

boost::system::error_code pgwire::protocol::serialize_header(
    message_header header,
    std::array<unsigned char, 5>& to
)
{
    // Range check the length. It should fit an int32, counting the 4 extra bytes in the length field
    constexpr std::size_t max_size = (std::numeric_limits<std::int32_t>::max)() - 4u;
    if (header.size > max_size)
        return client_errc::value_too_big;

    to[0] = header.type;
    boost::endian::store_big_s32(to.data() + 1, static_cast<std::int32_t>(header.size + 4u));
    return {};
}

boost::system::error_code pgwire::protocol::parse_header(
    std::span<const unsigned char, 5> from,
    message_header& to
)
{
    unsigned char msg_type = from[0];
    auto size = boost::endian::load_big_s32(from.data() + 1u);

    // Range check the length. The actual length (4 bytes) is included in this count
    if (size < 4 || static_cast<std::size_t>(size) - 4u > max_message_size)
        return client_errc::invalid_message_length;

    to = {msg_type, static_cast<std::size_t>(size) - 4u};
    return {};
}

boost::system::error_code pgwire::protocol::parse(
    std::uint8_t message_type,
    std::span<const unsigned char> data,
    any_backend_message& to
)
{
    switch (static_cast<backend_message_type>(message_type))
    {
    case backend_message_type::authentication_request: return parse_authentication_request(data, to);
    case backend_message_type::backend_key_data: return parse_impl<backend_key_data>(data, to);
    case backend_message_type::bind_complete: return parse_impl<bind_complete>(data, to);
    case backend_message_type::close_complete: return parse_impl<close_complete>(data, to);
    case backend_message_type::command_complete: return parse_impl<command_complete>(data, to);
    case backend_message_type::copy_data: return parse_impl<copy_data>(data, to);
    case backend_message_type::copy_done: return parse_impl<copy_done>(data, to);
    case backend_message_type::copy_in_response: return parse_impl<copy_in_response>(data, to);
    case backend_message_type::copy_out_response: return parse_impl<copy_out_response>(data, to);
    case backend_message_type::copy_both_response: return parse_impl<copy_both_response>(data, to);
    case backend_message_type::data_row: return parse_impl<data_row>(data, to);
    case backend_message_type::empty_query_response: return parse_impl<empty_query_response>(data, to);
    case backend_message_type::error_response: return parse_impl<error_response>(data, to);
    case backend_message_type::negotiate_protocol_version:
        return parse_impl<negotiate_protocol_version>(data, to);
    case backend_message_type::no_data: return parse_impl<no_data>(data, to);
    case backend_message_type::notice_response: return parse_impl<notice_response>(data, to);
    case backend_message_type::notification_response: return parse_impl<notification_response>(data, to);
    case backend_message_type::parameter_description: return parse_impl<parameter_description>(data, to);
    case backend_message_type::parameter_status: return parse_impl<parameter_status>(data, to);
    case backend_message_type::parse_complete: return parse_impl<parse_complete>(data, to);
    case backend_message_type::portal_suspended: return parse_impl<portal_suspended>(data, to);
    case backend_message_type::ready_for_query: return parse_impl<ready_for_query>(data, to);
    case backend_message_type::row_description: return parse_impl<row_description>(data, to);
    default: return client_errc::unexpected_message;
    }
}

//
// Backend messages
//

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, backend_key_data& to)
{
    detail::parse_context ctx(data);
    to.process_id = ctx.get_integral<std::int32_t>();
    to.secret_key = ctx.get_integral<std::int32_t>();
    return ctx.check();
}

boost::system::error_code pgwire::protocol::parse(
    std::span<const unsigned char> data,
    authentication_md5_password& to
)
{
    detail::parse_context ctx(data);
    to.salt = ctx.get_byte_array<4>();
    return ctx.check();
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, authentication_sasl& to)
{
    detail::parse_context ctx(data);

    // This is a list of strings, terminated by a NULL byte (that is, an empty string).
    const unsigned char* mechanisms_first = ctx.first();

    // On error, get_string returns an empty string, so this is safe
    std::size_t num_items = 0u;
    while (!ctx.get_string().empty())
        ++num_items;

    // Strings end in the NULL byte - that is, one byte before what we are now.
    // The check avoids UB in case of empty messages
    const auto* current = ctx.first();
    const unsigned char* mechanisms_last = current > mechanisms_first ? current - 1 : current;

    to.mechanisms = {
        num_items,
        {mechanisms_first, mechanisms_last}
    };
    return ctx.check();
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, command_complete& to)
{
    detail::parse_context ctx(data);
    to.tag = ctx.get_string();
    return ctx.check();
}

format_code pgwire::protocol::detail::random_access_traits<format_code>::dereference(const unsigned char* data)
{
    return static_cast<format_code>(unchecked_get_integral<std::int16_t>(data));
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, copy_in_response& to)
{
    return parse_copy_response(data, to.overall_fmt_code, to.fmt_codes);
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, copy_out_response& to)
{
    return parse_copy_response(data, to.overall_fmt_code, to.fmt_codes);
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, copy_both_response& to)
{
    return parse_copy_response(data, to.overall_fmt_code, to.fmt_codes);
}

// Each field is: Int32 size + Byte<n>
std::optional<std::span<const unsigned char>> pgwire::protocol::detail::forward_traits<
    std::optional<std::span<const unsigned char>>>::dereference(const unsigned char* data)
{
    auto size = boost::endian::load_big_s32(data);
    if (size == -1)
        return std::nullopt;
    return std::span<const unsigned char>(data + 4u, static_cast<std::size_t>(size));
}

const unsigned char* pgwire::protocol::detail::forward_traits<
    std::optional<std::span<const unsigned char>>>::advance(const unsigned char* data)
{
    auto size = boost::endian::load_big_s32(data);
    return data + 4u + (size > 0 ? size : 0);
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, data_row& to)
{
    detail::parse_context ctx(data);

    auto num_columns = static_cast<std::size_t>(ctx.get_nonnegative_integral<std::int16_t>());

    // The values start here, record it
    const auto* values_begin = ctx.first();

    // Iterate over all columns to check if there's any error
    for (std::size_t i = 0u; i < num_columns; ++i)
        ctx.get_nullable_bytes();

    const auto* values_end = ctx.first();

    to.columns = forward_parsing_view<std::optional<std::span<const unsigned char>>>(
        num_columns,
        {values_begin, values_end}
    );
    return ctx.check();
}

std::string_view pgwire::protocol::detail::forward_traits<std::string_view>::dereference(
    const unsigned char* data
)
{
    return detail::unchecked_get_string(data);
}

const unsigned char* pgwire::protocol::detail::forward_traits<std::string_view>::advance(
    const unsigned char* data
)
{
    detail::unchecked_get_string(data);
    return data;
}

boost::system::error_code pgwire::protocol::parse(
    std::span<const unsigned char> data,
    negotiate_protocol_version& to
)
{
    detail::parse_context ctx(data);

    to.minor_version = ctx.get_nonnegative_integral<std::int32_t>();
    auto num_ops = static_cast<std::size_t>(ctx.get_nonnegative_integral<std::int32_t>());

    // Check that all strings are well-formed
    const auto* opts_first = ctx.first();
    for (std::size_t i = 0u; i < num_ops; ++i)
        ctx.get_string();
    const auto* opts_last = ctx.first();

    to.non_recognized_options = {
        num_ops,
        {opts_first, opts_last}
    };
    return ctx.check();
}

std::optional<std::size_t> pgwire::protocol::error_notice_fields::parsed_line_number() const
{
    if (!line_number.has_value())
        return {};

    // Attempt to parse the value, return nothing on error
    std::size_t res = 0u;
    const char* first = line_number->data();
    const char* last = first + line_number->size();
    auto result = std::from_chars(first, last, res);
    if (result.ec != std::errc() || result.ptr != last)
        return {};
    return res;
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, error_response& to)
{
    return parse_error_notice(data, to);
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, notice_response& to)
{
    return parse_error_notice(data, to);
}

boost::system::error_code pgwire::protocol::parse(
    std::span<const unsigned char> data,
    notification_response& to
)
{
    detail::parse_context ctx(data);
    to.process_id = ctx.get_integral<std::int32_t>();
    to.channel_name = ctx.get_string();
    to.payload = ctx.get_string();
    return ctx.check();
}

std::int32_t pgwire::protocol::detail::random_access_traits<std::int32_t>::dereference(const unsigned char* ptr)
{
    return boost::endian::load_big_s32(ptr);
}

boost::system::error_code pgwire::protocol::parse(
    std::span<const unsigned char> data,
    parameter_description& to
)
{
    detail::parse_context ctx(data);

    auto num_params = static_cast<std::size_t>(ctx.get_nonnegative_integral<std::int16_t>());

    // An Int32 for each parameter. Ints can't fail deserialization
    const auto* oids_first = ctx.first();
    ctx.check_size_and_advance(num_params * 4u);
    to.parameter_type_oids = {oids_first, num_params};

    return ctx.check();
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, parameter_status& to)
{
    detail::parse_context ctx(data);
    to.name = ctx.get_string();
    to.value = ctx.get_string();
    return ctx.check();
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, ready_for_query& to)
{
    detail::parse_context ctx(data);

    // On error, get_byte returns a zero byte, which is not valid, either
    auto status = static_cast<transaction_status>(ctx.get_byte());
    if (!is_valid_status(status))
        ctx.add_error(client_errc::protocol_value_error);
    to.status = status;

    return ctx.check();
}

pgwire::protocol::field_description pgwire::protocol::detail::forward_traits<field_description>::dereference(
    const unsigned char* data
)
{
    // Evaluation order of initializers is well defined
    return {
        detail::unchecked_get_string(data),                  // name
        detail::unchecked_get_integral<std::int32_t>(data),  // table_oid
        detail::unchecked_get_integral<std::int16_t>(data),  // column_attribute
        detail::unchecked_get_integral<std::int32_t>(data),  // type_oid
        detail::unchecked_get_integral<std::int16_t>(data),  // type_length
        detail::unchecked_get_integral<std::int32_t>(data),  // type_modifier
        static_cast<format_code>(detail::unchecked_get_integral<std::int16_t>(data)),
    };
}

const unsigned char* pgwire::protocol::detail::forward_traits<field_description>::advance(
    const unsigned char* data
)
{
    // The string is the only variable-size item
    detail::unchecked_get_string(data);
    return data + field_description_fixed_size;
}

boost::system::error_code pgwire::protocol::parse(std::span<const unsigned char> data, row_description& to)
{
    detail::parse_context ctx(data);

    auto num_items = static_cast<std::size_t>(ctx.get_nonnegative_integral<std::int16_t>());

    const auto* data_first = ctx.first();
    for (std::size_t i = 0u; i < num_items; ++i)
    {
        // The name (string) is variable size, so we must get it
        ctx.get_string();

        // Fixed fields are integrals and can't be invalid.
        // Stop before the format code field, which needs to be checked
        ctx.check_size_and_advance(field_description_fixed_size - 2u);

        auto fmt_code = static_cast<format_code>(ctx.get_integral<std::int16_t>());
        if (!is_valid_format_code(fmt_code))
            ctx.add_error(client_errc::protocol_value_error);
    }
    const auto* data_last = ctx.first();

    to.field_descriptions = {
        num_items,
        {data_first, data_last}
    };
    return ctx.check();
}

//
// Frontend messages
//

struct pgwire::protocol::detail::bind_context_access
{
    static std::size_t num_params(const bind_context& ctx) { return ctx.num_params_; }
    static void maybe_finish_parameter(bind_context& ctx) { ctx.maybe_finish_parameter(); }
};

namespace {

struct format_codes_serializer
{
    detail::serialization_context& ctx;

    void operator()(format_code f) const
    {
        ctx.add_integral(static_cast<std::int16_t>(1));
        ctx.add_integral(static_cast<std::int16_t>(f));
    }
    void operator()(std::span<const format_code> codes) const
    {
        if (codes.size() > static_cast<std::size_t>((std::numeric_limits<std::int16_t>::max)()))
        {
            ctx.add_error(pgwire::client_errc::value_too_big);
        }
        else
        {
            ctx.add_integral(static_cast<std::int16_t>(codes.size()));
            for (auto c : codes)
                ctx.add_integral(static_cast<std::int16_t>(c));
        }
    }
};

void serialize_fmt_codes(const bind::format_codes& fmt_codes, detail::serialization_context& ctx)
{
    boost::variant2::visit(format_codes_serializer{ctx}, fmt_codes);
}

// An Int16 count followed by length-prefixed values. Shared by Bind and binary COPY rows
void serialize_params(const std::function<void(bind_context&)>& parameters_fn, detail::serialization_context& ctx)
{
    // Allocate space for the number of parameters (not yet known)
    auto& buffer = ctx.buffer();
    std::size_t num_params_offset = buffer.size();
    buffer.resize(buffer.size() + 2u);

    // Call the user function, which will serialize all the parameters
    bind_context bind_ctx(buffer);
    if (parameters_fn)
        parameters_fn(bind_ctx);
    detail::bind_context_access::maybe_finish_parameter(bind_ctx);
    ctx.add_error(bind_ctx.error());

    std::size_t num_params = detail::bind_context_access::num_params(bind_ctx);
    if (num_params > static_cast<std::size_t>((std::numeric_limits<std::int16_t>::max)()))
    {
        ctx.add_error(pgwire::client_errc::value_too_big);
        return;
    }
    boost::endian::store_big_s16(buffer.data() + num_params_offset, static_cast<std::int16_t>(num_params));
}

}  // namespace

void pgwire::protocol::bind_context::maybe_finish_parameter()
{
    // If there is no pending parameter, do nothing
    if (param_offset_ == no_offset)
        return;

    // The number of bytes added by the user minus the header. Zero-length values are valid
    BOOST_ASSERT(buff_.size() >= param_offset_ + 4u);
    std::size_t param_size = buff_.size() - param_offset_ - 4u;

    if (param_size > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)()))
    {
        add_error(client_errc::value_too_big);
        param_offset_ = no_offset;
        return;
    }

    boost::endian::store_big_s32(buff_.data() + param_offset_, static_cast<std::int32_t>(param_size));
    param_offset_ = no_offset;
}

void pgwire::protocol::bind_context::add_null_parameter()
{
    maybe_finish_parameter();
    ++num_params_;
    detail::append_integral(buff_, static_cast<std::int32_t>(-1));
}

boost::system::error_code pgwire::protocol::serialize(const bind& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('B');

    // Portal and statement name
    ctx.add_string(msg.portal_name);
    ctx.add_string(msg.statement_name);

    serialize_fmt_codes(msg.parameter_fmt_codes, ctx);
    serialize_params(msg.parameters_fn, ctx);
    serialize_fmt_codes(msg.result_fmt_codes, ctx);

    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(const describe& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('D');
    ctx.add_byte(static_cast<unsigned char>(msg.type));
    ctx.add_string(msg.name);
    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(const close& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('C');
    ctx.add_byte(static_cast<unsigned char>(msg.type));
    ctx.add_string(msg.name);
    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(const parse_t& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('P');

    ctx.add_string(msg.statement_name);
    ctx.add_string(msg.query);

    // Parameter types
    if (msg.parameter_type_oids.size() > static_cast<std::size_t>((std::numeric_limits<std::int16_t>::max)()))
    {
        ctx.add_error(client_errc::value_too_big);
    }
    else
    {
        ctx.add_integral(static_cast<std::int16_t>(msg.parameter_type_oids.size()));
        for (auto oid : msg.parameter_type_oids)
            ctx.add_integral(oid);
    }

    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(const copy_data& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('d');
    ctx.add_bytes(msg.data);
    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(copy_binary_header, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('d');
    ctx.add_bytes(copy_binary_signature);
    ctx.add_integral(static_cast<std::int32_t>(0));  // flags
    ctx.add_integral(static_cast<std::int32_t>(0));  // header extension length
    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(const copy_binary_row& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('d');
    serialize_params(msg.fields_fn, ctx);
    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(copy_binary_trailer, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('d');
    ctx.add_integral(static_cast<std::int16_t>(-1));
    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(const copy_fail& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('f');
    ctx.add_string(msg.error_message);
    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(copy_done, std::vector<unsigned char>& to)
{
    return serialize_header_only('c', to);
}

boost::system::error_code pgwire::protocol::serialize(const execute& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('E');
    ctx.add_string(msg.portal_name);
    ctx.add_integral(msg.max_num_rows);
    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(flush, std::vector<unsigned char>& to)
{
    return serialize_header_only('H', to);
}

boost::system::error_code pgwire::protocol::serialize(sync, std::vector<unsigned char>& to)
{
    return serialize_header_only('S', to);
}

boost::system::error_code pgwire::protocol::serialize(terminate, std::vector<unsigned char>& to)
{
    return serialize_header_only('X', to);
}

boost::system::error_code pgwire::protocol::serialize(const password& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('p');
    ctx.add_string(msg.password);
    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::serialize(const startup_message& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);

    // This message does not have a message type, but it does have a length.
    auto length_offset = to.size();
    ctx.add_bytes(std::array<unsigned char, 4>{});

    // The most significant 16 bits are the major version number, the least significant 16 bits the minor
    ctx.add_integral(protocol_version);

    ctx.add_string("user");
    ctx.add_string(msg.user);

    if (msg.database.has_value())
    {
        ctx.add_string("database");
        ctx.add_string(*msg.database);
    }

    for (auto param : msg.params)
    {
        ctx.add_string(param.first);
        ctx.add_string(param.second);
    }

    // Terminator
    ctx.add_byte(0);

    auto msg_length = to.size() - length_offset;
    if (msg_length > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)()))
        ctx.add_error(client_errc::value_too_big);

    if (auto err = ctx.error())
    {
        to.resize(length_offset);
        return err;
    }

    boost::endian::store_big_s32(to.data() + length_offset, static_cast<std::int32_t>(msg_length));
    return {};
}

boost::system::error_code pgwire::protocol::serialize(const cancel_request& msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);

    // The message has no type code. It has a length, but it's constant
    ctx.add_integral(static_cast<std::int32_t>(16));        // length
    ctx.add_integral(static_cast<std::int32_t>(80877102));  // cancel request code
    ctx.add_integral(msg.process_id);
    ctx.add_integral(msg.secret_key);

    return ctx.error();
}

boost::system::error_code pgwire::protocol::serialize(query msg, std::vector<unsigned char>& to)
{
    detail::serialization_context ctx(to);
    ctx.add_header('Q');
    ctx.add_string(msg.query);
    return ctx.finalize_message();
}

//
// SCRAM-SHA-256
//

boost::system::error_code pgwire::protocol::serialize(
    const scram_sha256_client_first_message& msg,
    std::vector<unsigned char>& to
)
{
    detail::serialization_context ctx(to);

    // SASLInitialResponse
    ctx.add_header('p');
    ctx.add_string(msg.mechanism);

    // The rest of the message is a client-first-message, preceeded by its Int32 length.
    // Reserve empty space for this size
    std::size_t length_offset = to.size();
    ctx.add_bytes(std::array<unsigned char, 4>{});

    // client-first-message = gs2-header client-first-message-bare
    // gs2-header      = gs2-cbind-flag "," [ authzid ] ","
    // client-first-message-bare =
    //      [reserved-mext ","] username "," nonce ["," extensions]
    // username        = "n=" saslname ;; always empty in our case, sent in the startup msg
    // nonce           = "r=" c-nonce [s-nonce] ;; printable
    ctx.add_bytes("n,,n=,r=");
    ctx.add_bytes(msg.nonce);

    auto data_length = to.size() - length_offset - 4u;
    if (data_length > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)()))
        ctx.add_error(client_errc::value_too_big);
    else
        boost::endian::store_big_s32(to.data() + length_offset, static_cast<std::int32_t>(data_length));

    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::parse(
    std::span<const unsigned char> data,
    scram_sha256_server_first_message& to
)
{
    // server-first-message = [reserved-mext ","] nonce "," salt "," iteration-count ["," extensions]
    // reserved-mext  = "m=" 1*(value-char) ;; if this is present, we're missing extensions and should fail
    // nonce          = "r=" c-nonce [s-nonce] ;; printable
    // printable       =%x21-2B / %x2D-7E
    // salt            = "s=" base64
    // iteration-count = "i=" posit-number
    // extensions = attr-val *("," attr-val) ;; to be ignored

    const unsigned char* p = data.data();
    const unsigned char* last = data.data() + data.size();

    // Try to match reserved-mext
    if (p != last && *p == static_cast<unsigned char>('m'))
    {
        ++p;
        return (p == last || *p != '=') ? client_errc::invalid_scram_message
                                        : client_errc::mandatory_scram_extension_not_supported;
    }

    // Parse the nonce
    if (p == last || *p++ != 'r')
        return client_errc::invalid_scram_message;
    if (p == last || *p++ != '=')
        return client_errc::invalid_scram_message;
    const auto* nonce_first = p;
    while (true)
    {
        if (p == last)
            return client_errc::invalid_scram_message;
        if (*p == ',')
            break;
        if (!scram_is_printable(*p))
            return client_errc::invalid_scram_message;
        ++p;
    }
    if (p == nonce_first)
        return client_errc::invalid_scram_message;
    to.nonce = {reinterpret_cast<const char*>(nonce_first), static_cast<std::size_t>(p - nonce_first)};
    ++p;  // skip the final comma

    // Parse the salt
    if (p == last || *p++ != 's')
        return client_errc::invalid_scram_message;
    if (p == last || *p++ != '=')
        return client_errc::invalid_scram_message;
    const auto* salt_first = p;
    while (true)
    {
        if (p == last)
            return client_errc::invalid_scram_message;
        if (*p == ',')
            break;
        ++p;
    }
    to.salt.clear();
    if (auto ec = detail::base64_decode({salt_first, p}, to.salt))
        return ec;
    ++p;  // skip the final comma

    // Parse the iteration count. from_chars doesn't accept a sign for unsigned types
    if (p == last || *p++ != 'i')
        return client_errc::invalid_scram_message;
    if (p == last || *p++ != '=')
        return client_errc::invalid_scram_message;
    const char* i_first = reinterpret_cast<const char*>(p);
    const char* i_last = std::find(i_first, reinterpret_cast<const char*>(last), ',');
    auto parse_result = std::from_chars(i_first, i_last, to.iteration_count);
    if (parse_result.ec != std::errc() || parse_result.ptr != i_last || to.iteration_count == 0u)
        return client_errc::invalid_scram_message;

    return {};
}

boost::system::error_code pgwire::protocol::serialize(
    const scram_sha256_client_final_message& msg,
    std::vector<unsigned char>& to
)
{
    detail::serialization_context ctx(to);

    // SASLResponse
    ctx.add_header('p');

    // client-final-message = client-final-message-without-proof "," proof
    // client-final-message-without-proof = channel-binding "," nonce ["," extensions]
    // channel-binding = "c=" base64 ;; base64 encoding of cbind-input.
    // cbind-input   = gs2-header [ cbind-data ] ;; cbind-data absent if no channel binding is present
    // proof           = "p=" base64

    // gs2-header is always "n,," when no channel binding is present.
    // This makes channel-binding always equal to "c=biws"
    ctx.add_bytes("c=biws,r=");
    ctx.add_bytes(msg.nonce);

    // proof
    ctx.add_bytes(",p=");
    detail::base64_encode(msg.proof, to);

    return ctx.finalize_message();
}

boost::system::error_code pgwire::protocol::parse(
    std::span<const unsigned char> data,
    scram_sha256_server_final_message& to
)
{
    // server-final-message = (server-error / verifier) ["," extensions]
    // server-error = "e=" server-error-value
    // verifier     = "v=" base64 ;; base-64 encoded ServerSignature.
    std::string_view msg(reinterpret_cast<const char*>(data.data()), data.size());
    if (msg.size() < 2u || msg[0] != 'v' || msg[1] != '=')
        return client_errc::invalid_scram_message;

    // Extensions are ignored
    auto sig = msg.substr(2);
    sig = sig.substr(0, sig.find(','));
    to.server_signature.clear();
    return detail::base64_decode(
        {reinterpret_cast<const unsigned char*>(sig.data()), sig.size()},
        to.server_signature
    );
}
