//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_PROTOCOL_SCRAM_SHA256_HPP
#define PGWIRE_PROTOCOL_SCRAM_SHA256_HPP

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace pgwire {
namespace protocol {

// Message formats described in https://datatracker.ietf.org/doc/html/rfc5802.
// Channel binding is not supported, so the gs2 header is always "n,,"

inline constexpr std::string_view scram_sha256_mechanism = "SCRAM-SHA-256";

// SASLInitialResponse, containing the client-first-message
struct scram_sha256_client_first_message
{
    // The SASL mechanism name that was chosen
    std::string_view mechanism;

    // The nonce sent to the server
    std::string_view nonce;
};
boost::system::error_code serialize(const scram_sha256_client_first_message& msg, std::vector<unsigned char>& to);

// Contained in an AuthenticationSASLContinue message
struct scram_sha256_server_first_message
{
    // The nonce sent by the server, should contain the nonce we sent and an extra value created by the server
    std::string_view nonce;

    // The salt sent by the server. This comes as base64
    std::vector<unsigned char> salt;

    // Iteration count. As an arbitrary fixed-width integer to set an upper limit
    std::uint32_t iteration_count;
};
boost::system::error_code parse(std::span<const unsigned char> data, scram_sha256_server_first_message&);

// SASLResponse, containing the client-final-message
struct scram_sha256_client_final_message
{
    // The nonce sent to the server (client + server parts)
    std::string_view nonce;

    // Proof that we have the password, to be b64 encoded
    std::span<const unsigned char> proof;
};
boost::system::error_code serialize(const scram_sha256_client_final_message& msg, std::vector<unsigned char>& to);

// Contained in an AuthenticationSASLFinal message
struct scram_sha256_server_final_message
{
    // Decoded from base64
    std::vector<unsigned char> server_signature;
};
boost::system::error_code parse(std::span<const unsigned char> data, scram_sha256_server_final_message&);

}  // namespace protocol
}  // namespace pgwire

#endif
