//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/error.hpp>
#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mock_stream.hpp"
#include "pgwire/connection.hpp"

using namespace pgwire::test;
using boost::system::error_code;

namespace {

// Appends big-endian integers and strings to a payload
class payload_builder
{
    std::vector<unsigned char> bytes_;

public:
    payload_builder& i8(std::int8_t v)
    {
        bytes_.push_back(static_cast<unsigned char>(v));
        return *this;
    }

    payload_builder& i16(std::int16_t v)
    {
        std::array<unsigned char, 2> buff{};
        boost::endian::store_big_s16(buff.data(), v);
        bytes_.insert(bytes_.end(), buff.begin(), buff.end());
        return *this;
    }

    payload_builder& i32(std::int32_t v)
    {
        std::array<unsigned char, 4> buff{};
        boost::endian::store_big_s32(buff.data(), v);
        bytes_.insert(bytes_.end(), buff.begin(), buff.end());
        return *this;
    }

    payload_builder& bytes(std::span<const unsigned char> v)
    {
        bytes_.insert(bytes_.end(), v.begin(), v.end());
        return *this;
    }

    payload_builder& raw_string(std::string_view v)
    {
        bytes_.insert(bytes_.end(), v.begin(), v.end());
        return *this;
    }

    // NULL-terminated
    payload_builder& string(std::string_view v)
    {
        raw_string(v);
        bytes_.push_back(0u);
        return *this;
    }

    const std::vector<unsigned char>& get() const { return bytes_; }
};

}  // namespace

std::size_t mock_stream::read_some(std::span<unsigned char> buff, error_code& ec)
{
    ec.clear();
    std::size_t remaining = st_->input.size() - st_->input_offset;
    if (remaining == 0u)
    {
        ec = boost::asio::error::eof;
        return 0u;
    }
    std::size_t n = (std::min)(remaining, buff.size());
    if (st_->max_read_size)
        n = (std::min)(n, *st_->max_read_size);
    std::copy_n(st_->input.begin() + static_cast<std::ptrdiff_t>(st_->input_offset), n, buff.begin());
    st_->input_offset += n;
    return n;
}

void mock_stream::write(std::span<const unsigned char> data, error_code& ec)
{
    ec = st_->write_error;
    if (!ec)
        st_->written.insert(st_->written.end(), data.begin(), data.end());
}

void mock_stream::close(error_code& ec)
{
    ec.clear();
    st_->closed = true;
}

server_script& server_script::message(char type, std::span<const unsigned char> payload)
{
    bytes_.push_back(static_cast<unsigned char>(type));
    std::array<unsigned char, 4> len{};
    boost::endian::store_big_s32(len.data(), static_cast<std::int32_t>(payload.size() + 4u));
    bytes_.insert(bytes_.end(), len.begin(), len.end());
    bytes_.insert(bytes_.end(), payload.begin(), payload.end());
    return *this;
}

server_script& server_script::authentication(std::int32_t code)
{
    return message('R', payload_builder().i32(code).get());
}

server_script& server_script::authentication_ok() { return authentication(0); }

server_script& server_script::authentication_cleartext() { return authentication(3); }

server_script& server_script::authentication_md5(std::array<unsigned char, 4> salt)
{
    return message('R', payload_builder().i32(5).bytes(salt).get());
}

server_script& server_script::authentication_sasl(std::span<const std::string_view> mechanisms)
{
    payload_builder p;
    p.i32(10);
    for (auto mech : mechanisms)
        p.string(mech);
    p.i8(0);
    return message('R', p.get());
}

server_script& server_script::authentication_sasl_continue(std::string_view data)
{
    return message('R', payload_builder().i32(11).raw_string(data).get());
}

server_script& server_script::authentication_sasl_final(std::string_view data)
{
    return message('R', payload_builder().i32(12).raw_string(data).get());
}

server_script& server_script::parameter_status(std::string_view name, std::string_view value)
{
    return message('S', payload_builder().string(name).string(value).get());
}

server_script& server_script::backend_key_data(std::int32_t process_id, std::int32_t secret_key)
{
    return message('K', payload_builder().i32(process_id).i32(secret_key).get());
}

server_script& server_script::ready_for_query(char status)
{
    return message('Z', payload_builder().i8(static_cast<std::int8_t>(status)).get());
}

server_script& server_script::row_description(std::span<const std::pair<std::string_view, std::int32_t>> fields)
{
    payload_builder p;
    p.i16(static_cast<std::int16_t>(fields.size()));
    for (const auto& f : fields)
    {
        p.string(f.first);
        p.i32(0);            // table OID
        p.i16(0);            // column attribute
        p.i32(f.second);     // type OID
        p.i16(-1);           // type length
        p.i32(-1);           // type modifier
        p.i16(0);            // format code
    }
    return message('T', p.get());
}

server_script& server_script::data_row(std::span<const std::optional<std::string_view>> values)
{
    payload_builder p;
    p.i16(static_cast<std::int16_t>(values.size()));
    for (const auto& v : values)
    {
        if (!v)
        {
            p.i32(-1);
            continue;
        }
        p.i32(static_cast<std::int32_t>(v->size()));
        p.raw_string(*v);
    }
    return message('D', p.get());
}

server_script& server_script::data_row_binary(std::span<const std::optional<std::vector<unsigned char>>> values)
{
    payload_builder p;
    p.i16(static_cast<std::int16_t>(values.size()));
    for (const auto& v : values)
    {
        if (!v)
        {
            p.i32(-1);
            continue;
        }
        p.i32(static_cast<std::int32_t>(v->size()));
        p.bytes(*v);
    }
    return message('D', p.get());
}

server_script& server_script::command_complete(std::string_view tag)
{
    return message('C', payload_builder().string(tag).get());
}

server_script& server_script::empty_query_response() { return message('I', {}); }

server_script& server_script::error_response(std::string_view sqlstate, std::string_view msg, std::string_view severity)
{
    payload_builder p;
    p.i8('S').string(severity);
    p.i8('V').string(severity);
    if (!sqlstate.empty())
        p.i8('C').string(sqlstate);
    p.i8('M').string(msg);
    p.i8(0);
    return message('E', p.get());
}

server_script& server_script::notice_response(std::string_view msg)
{
    payload_builder p;
    p.i8('S').string("NOTICE");
    p.i8('C').string("00000");
    p.i8('M').string(msg);
    p.i8(0);
    return message('N', p.get());
}

server_script& server_script::notification_response(
    std::int32_t process_id,
    std::string_view channel,
    std::string_view payload
)
{
    return message('A', payload_builder().i32(process_id).string(channel).string(payload).get());
}

server_script& server_script::parse_complete() { return message('1', {}); }

server_script& server_script::bind_complete() { return message('2', {}); }

server_script& server_script::close_complete() { return message('3', {}); }

server_script& server_script::no_data() { return message('n', {}); }

server_script& server_script::parameter_description(std::span<const std::int32_t> oids)
{
    payload_builder p;
    p.i16(static_cast<std::int16_t>(oids.size()));
    for (auto oid : oids)
        p.i32(oid);
    return message('t', p.get());
}

server_script& server_script::copy_in_response(std::int16_t num_columns)
{
    payload_builder p;
    p.i8(1);
    p.i16(num_columns);
    for (std::int16_t i = 0; i < num_columns; ++i)
        p.i16(1);
    return message('G', p.get());
}

server_script& server_script::copy_out_response(std::int16_t num_columns)
{
    payload_builder p;
    p.i8(0);
    p.i16(num_columns);
    for (std::int16_t i = 0; i < num_columns; ++i)
        p.i16(0);
    return message('H', p.get());
}

server_script& server_script::copy_data(std::string_view data)
{
    return message('d', payload_builder().raw_string(data).get());
}

server_script& server_script::copy_done() { return message('c', {}); }

server_script& server_script::raw(std::span<const unsigned char> bytes)
{
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
    return *this;
}

std::vector<frontend_message> pgwire::test::split_frontend_messages(
    std::span<const unsigned char> bytes,
    bool has_startup
)
{
    std::vector<frontend_message> res;
    std::size_t offset = 0u;
    if (has_startup)
    {
        BOOST_ASSERT(bytes.size() >= 4u);
        auto len = static_cast<std::size_t>(boost::endian::load_big_s32(bytes.data()));
        BOOST_ASSERT(bytes.size() >= len);
        res.push_back({'\0', std::vector<unsigned char>(bytes.begin() + 4, bytes.begin() + len)});
        offset = len;
    }
    while (offset < bytes.size())
    {
        BOOST_ASSERT(bytes.size() - offset >= 5u);
        char type = static_cast<char>(bytes[offset]);
        auto len = static_cast<std::size_t>(boost::endian::load_big_s32(bytes.data() + offset + 1u));
        BOOST_ASSERT(bytes.size() - offset >= len + 1u);
        auto first = bytes.begin() + static_cast<std::ptrdiff_t>(offset + 5u);
        auto last = bytes.begin() + static_cast<std::ptrdiff_t>(offset + 1u + len);
        res.push_back({type, std::vector<unsigned char>(first, last)});
        offset += len + 1u;
    }
    return res;
}

std::string pgwire::test::frontend_message_types(std::span<const unsigned char> bytes, bool has_startup)
{
    std::string res;
    for (const auto& msg : split_frontend_messages(bytes, has_startup))
    {
        if (msg.type != '\0')
            res.push_back(msg.type);
    }
    return res;
}

std::shared_ptr<mock_stream_state> pgwire::test::connect_mock(connection& conn, const connect_params& params)
{
    auto st = std::make_shared<mock_stream_state>();
    st->add_input(server_script()
                      .authentication_ok()
                      .parameter_status("server_version", "16.2")
                      .parameter_status("client_encoding", "UTF8")
                      .parameter_status("DateStyle", "ISO, MDY")
                      .backend_key_data(1234, 5678)
                      .ready_for_query('I')
                      .bytes());
    conn.connect(std::make_unique<mock_stream>(st), params);
    st->written.clear();
    return st;
}
