//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/system/error_code.hpp>

#include <array>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include "base64.hpp"
#include "password.hpp"
#include "pgwire/client_errc.hpp"

using namespace pgwire::protocol::detail;
using boost::system::error_code;
using pgwire::client_errc;

namespace {

constexpr std::size_t md5_digest_size = 16u;
constexpr std::size_t scram_nonce_size = 18u;

// Appends the lowercase hex representation of a MD5 digest of input
error_code append_md5_hex(std::string_view input, std::string& to)
{
    constexpr char hex_digits[] = "0123456789abcdef";

    std::array<unsigned char, md5_digest_size> digest{};
    unsigned int digest_size = 0u;
    if (EVP_Digest(input.data(), input.size(), digest.data(), &digest_size, EVP_md5(), nullptr) != 1 ||
        digest_size != md5_digest_size)
        return client_errc::crypto_error;

    for (unsigned char c : digest)
    {
        to.push_back(hex_digits[c >> 4]);
        to.push_back(hex_digits[c & 0x0f]);
    }
    return {};
}

error_code hmac_sha256(
    std::span<const unsigned char> key,
    std::span<const unsigned char> data,
    sha256_digest& output
)
{
    unsigned int size = 0u;
    auto* res = HMAC(
        EVP_sha256(),
        key.data(),
        static_cast<int>(key.size()),
        data.data(),
        data.size(),
        output.data(),
        &size
    );
    return (res == nullptr || size != output.size()) ? error_code(client_errc::crypto_error) : error_code();
}

error_code hmac_sha256(std::span<const unsigned char> key, std::string_view data, sha256_digest& output)
{
    return hmac_sha256(key, {reinterpret_cast<const unsigned char*>(data.data()), data.size()}, output);
}

error_code sha256(std::span<const unsigned char> data, sha256_digest& output)
{
    unsigned int size = 0u;
    if (EVP_Digest(data.data(), data.size(), output.data(), &size, EVP_sha256(), nullptr) != 1 ||
        size != output.size())
        return client_errc::crypto_error;
    return {};
}

}  // namespace

error_code pgwire::protocol::detail::md5_password(
    std::string_view user,
    std::string_view password,
    std::array<unsigned char, 4> salt,
    std::string& output
)
{
    // Inner digest: md5(password + user)
    std::string inner(password);
    inner.append(user);
    std::string inner_hex;
    if (auto ec = append_md5_hex(inner, inner_hex))
        return ec;

    // Outer digest: md5(hex(inner) + salt)
    inner_hex.append(reinterpret_cast<const char*>(salt.data()), salt.size());
    output = "md5";
    return append_md5_hex(inner_hex, output);
}

error_code pgwire::protocol::detail::generate_scram_nonce(std::string& output)
{
    std::array<unsigned char, scram_nonce_size> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1)
        return client_errc::crypto_error;
    output = base64_encode(raw);
    return {};
}

error_code pgwire::protocol::detail::scram_sha256_salted_password(
    std::string_view password,
    std::span<const unsigned char> salt,
    std::uint32_t iteration_count,
    sha256_digest& output
)
{
    if (iteration_count == 0u || iteration_count > static_cast<std::uint32_t>(INT_MAX))
        return client_errc::invalid_scram_message;

    // SASLprep leaves ASCII strings unchanged. Anything else would need Unicode
    // normalization, so it's rejected rather than hashed verbatim
    for (char c : password)
    {
        if (static_cast<unsigned char>(c) >= 0x80u)
            return client_errc::scram_password_not_ascii;
    }

    int res = PKCS5_PBKDF2_HMAC(
        password.data(),
        static_cast<int>(password.size()),
        salt.data(),
        static_cast<int>(salt.size()),
        static_cast<int>(iteration_count),
        EVP_sha256(),
        static_cast<int>(output.size()),
        output.data()
    );
    return res == 1 ? error_code() : error_code(client_errc::crypto_error);
}

error_code pgwire::protocol::detail::scram_sha256_client_proof(
    const sha256_digest& salted_password,
    std::string_view auth_message,
    sha256_digest& output
)
{
    // ClientKey = HMAC(SaltedPassword, "Client Key")
    sha256_digest client_key{};
    if (auto ec = hmac_sha256(salted_password, "Client Key", client_key))
        return ec;

    // StoredKey = H(ClientKey)
    sha256_digest stored_key{};
    if (auto ec = sha256(client_key, stored_key))
        return ec;

    // ClientSignature = HMAC(StoredKey, AuthMessage)
    sha256_digest client_signature{};
    if (auto ec = hmac_sha256(stored_key, auth_message, client_signature))
        return ec;

    for (std::size_t i = 0u; i < output.size(); ++i)
        output[i] = client_key[i] ^ client_signature[i];
    return {};
}

error_code pgwire::protocol::detail::scram_sha256_server_signature(
    const sha256_digest& salted_password,
    std::string_view auth_message,
    sha256_digest& output
)
{
    sha256_digest server_key{};
    if (auto ec = hmac_sha256(salted_password, "Server Key", server_key))
        return ec;
    return hmac_sha256(server_key, auth_message, output);
}
