//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGWIRE_SRC_PASSWORD_HPP
#define PGWIRE_SRC_PASSWORD_HPP

#include <boost/system/error_code.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pgwire {
namespace protocol {
namespace detail {

using sha256_digest = std::array<unsigned char, 32>;

// "md5" followed by the hex MD5 of (hex MD5 of password + user) + salt
[[nodiscard]] boost::system::error_code md5_password(
    std::string_view user,
    std::string_view password,
    std::array<unsigned char, 4> salt,
    std::string& output
);

// 18 random bytes, base64-encoded. Never contains a comma
[[nodiscard]] boost::system::error_code generate_scram_nonce(std::string& output);

// Hi(password, salt, i) from RFC 5802, i.e. PBKDF2 with HMAC-SHA-256
[[nodiscard]] boost::system::error_code scram_sha256_salted_password(
    std::string_view password,
    std::span<const unsigned char> salt,
    std::uint32_t iteration_count,
    sha256_digest& output
);

// ClientKey XOR HMAC(H(ClientKey), AuthMessage)
[[nodiscard]] boost::system::error_code scram_sha256_client_proof(
    const sha256_digest& salted_password,
    std::string_view auth_message,
    sha256_digest& output
);

// HMAC(HMAC(SaltedPassword, "Server Key"), AuthMessage)
[[nodiscard]] boost::system::error_code scram_sha256_server_signature(
    const sha256_digest& salted_password,
    std::string_view auth_message,
    sha256_digest& output
);

}  // namespace detail
}  // namespace protocol
}  // namespace pgwire

#endif
