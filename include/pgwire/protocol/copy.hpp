//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_COPY_HPP
#define PGWIRE_PROTOCOL_COPY_HPP

#include <boost/system/error_code.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

#include "pgwire/protocol/bind.hpp"
#include "pgwire/protocol/common.hpp"
#include "pgwire/protocol/views.hpp"

namespace pgwire {
namespace protocol {
namespace detail {

template <>
struct random_access_traits<format_code>
{
    static format_code dereference(const unsigned char* data);
};

}  // namespace detail

// Signature at the start of binary COPY data: "PGCOPY\n\377\r\n\0"
inline constexpr std::array<unsigned char, 11> copy_binary_signature{
    'P',
    'G',
    'C',
    'O',
    'P',
    'Y',
    '\n',
    0xff,
    '\r',
    '\n',
    0,
};

struct copy_data
{
    // Data that forms part of a COPY data stream. Messages sent from the backend will always correspond to
    // single data rows, but messages sent by frontends might divide the data stream arbitrarily.
    std::span<const unsigned char> data;
};
inline boost::system::error_code parse(std::span<const unsigned char> data, copy_data& to)
{
    to.data = data;
    return {};
}
boost::system::error_code serialize(const copy_data& msg, std::vector<unsigned char>& to);

// A CopyData message containing the binary COPY file header (signature, flags and
// header extension length, all zero)
struct copy_binary_header
{
};
boost::system::error_code serialize(copy_binary_header, std::vector<unsigned char>& to);

// A CopyData message containing a binary COPY tuple: an Int16 field count followed by
// length-prefixed fields. fields_fn is called once to serialize the fields
struct copy_binary_row
{
    std::function<void(bind_context&)> fields_fn;
};
boost::system::error_code serialize(const copy_binary_row& msg, std::vector<unsigned char>& to);

// A CopyData message containing the binary COPY trailer (an Int16 -1)
struct copy_binary_trailer
{
};
boost::system::error_code serialize(copy_binary_trailer, std::vector<unsigned char>& to);

struct copy_done
{
};
inline boost::system::error_code parse(std::span<const unsigned char> data, copy_done&)
{
    return detail::check_empty(data);
}
boost::system::error_code serialize(copy_done, std::vector<unsigned char>& to);

struct copy_fail
{
    // An error message to report as the cause of failure.
    std::string_view error_message;
};
boost::system::error_code serialize(const copy_fail& msg, std::vector<unsigned char>& to);

struct copy_in_response
{
    // Indicates whether the overall COPY format is textual (rows separated by newlines, columns separated by
    // separator characters, etc.) or binary (similar to DataRow format).
    format_code overall_fmt_code;

    // The format codes to be used for each column. If overall_fmt_code is text, all these must be zero.
    random_access_parsing_view<format_code> fmt_codes;
};
boost::system::error_code parse(std::span<const unsigned char> data, copy_in_response& to);

struct copy_out_response
{
    format_code overall_fmt_code;
    random_access_parsing_view<format_code> fmt_codes;
};
boost::system::error_code parse(std::span<const unsigned char> data, copy_out_response& to);

struct copy_both_response
{
    format_code overall_fmt_code;
    random_access_parsing_view<format_code> fmt_codes;
};
boost::system::error_code parse(std::span<const unsigned char> data, copy_both_response& to);

}  // namespace protocol
}  // namespace pgwire

#endif
