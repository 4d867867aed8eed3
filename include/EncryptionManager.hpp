#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>

// GCM tag did not verify: wrong key, wrong AAD or tampered bytes.
class AuthenticationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Handles key derivation (Argon2id) and AES-256-GCM encrypt/decrypt.
// The key lives only in RAM; one instance is shared read-only by all
// components for the life of the process.
class EncryptionManager {
public:
    static constexpr std::size_t KEY_LEN  = 32;
    static constexpr std::size_t SALT_LEN = 16;

    // Derive a 32-byte key from a passphrase and 16-byte salt (Argon2id).
    static std::vector<std::uint8_t> deriveKey(
        const std::string& passphrase,
        const std::vector<std::uint8_t>& salt
    );

    // Fresh random 32-byte key. Anything encrypted under it is lost
    // with the process.
    static std::vector<std::uint8_t> generateKey();

    // Construct with 32-byte key (K_enc).
    explicit EncryptionManager(const std::vector<std::uint8_t>& key);
    ~EncryptionManager();

    struct EncResult {
        std::vector<std::uint8_t> iv;         // 12-byte random IV
        std::vector<std::uint8_t> encAndTag;  // ciphertext || 16-byte tag
    };

    // Optional AAD lets you bind extra metadata; can be empty.
    EncResult encrypt(const std::vector<std::uint8_t>& plaintext,
                      const std::vector<std::uint8_t>& aad = {}) const;

    // Throws AuthenticationError on tag failure, std::invalid_argument on
    // malformed input, std::runtime_error on OpenSSL API error.
    std::vector<std::uint8_t> decrypt(const std::vector<std::uint8_t>& iv,
                                      const std::vector<std::uint8_t>& encAndTag,
                                      const std::vector<std::uint8_t>& aad = {}) const;

private:
    std::vector<std::uint8_t> m_key;

    static constexpr std::size_t IV_LEN  = 12;
    static constexpr std::size_t TAG_LEN = 16;

    static constexpr uint32_t T_COST = 3;               // iterations
    static constexpr uint32_t M_COST_KiB = 64 * 1024;   // memory (~64 MiB)
    static constexpr uint32_t PARALLELISM = 1;          // lanes
};
