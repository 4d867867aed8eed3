#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

// Unpadded base64url (RFC 4648 §5) of raw bytes.
inline std::string base64url_encode(const std::vector<std::uint8_t>& bytes)
{
    if (bytes.empty()) return {};

    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            bytes.data(), static_cast<int>(bytes.size()));
    out.resize(static_cast<std::size_t>(n));

    while (!out.empty() && out.back() == '=') out.pop_back();
    for (char& ch : out) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    return out;
}

// Reset token: `numBytes` bytes from the OpenSSL CSPRNG, base64url-encoded.
// 32 bytes -> 256 bits of entropy, 43 characters.
inline std::string generate_reset_token(std::size_t numBytes = 32)
{
    if (numBytes == 0) throw std::invalid_argument("Token length must be positive");

    std::vector<std::uint8_t> raw(numBytes);
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed in generate_reset_token");
    }
    std::string token = base64url_encode(raw);
    OPENSSL_cleanse(raw.data(), raw.size());
    return token;
}

inline std::vector<std::uint8_t> sha256(const std::string& data)
{
    std::vector<std::uint8_t> digest(SHA256_DIGEST_LENGTH);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(SHA-256) failed");
    }
    digest.resize(len);
    return digest;
}
