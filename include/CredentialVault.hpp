#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/fwd.h>

#include "VaultStatus.hpp"

class DatabaseManager;
class EncryptionManager;

// Decrypted view of a UserCredential
struct PlainCredential {
    std::string username;
    std::string password;
    std::string hint;
    bool biometric_enabled = false;
};

struct RetrieveResult {
    VaultStatus status = VaultStatus::NotFound;
    std::optional<PlainCredential> credential;   // set iff status == Ok

    bool ok() const { return status == VaultStatus::Ok; }
};

// Encrypted username/password storage keyed by user_id.
//
// Username and password are sealed separately with AES-256-GCM; each
// ciphertext's AAD is "<user_id>\n<field>", so a blob copied to another user
// or swapped between fields fails authentication. StorageError from the
// database propagates to the caller.
class CredentialVault {
public:
    CredentialVault(DatabaseManager& db,
                    const EncryptionManager& enc,
                    std::shared_ptr<spdlog::logger> logger = nullptr);

    // ValidationError if userId, username or password is empty.
    // Overwrites any prior record (hint included) and drops its reset token.
    VaultStatus store(const std::string& userId,
                      const std::string& username,
                      const std::string& password,
                      const std::string& hint = "");

    // NotFound, DecryptionError or Ok with the decrypted credential.
    RetrieveResult retrieve(const std::string& userId) const;

    // Delete credential, reset token and biometric profile.
    VaultStatus remove(const std::string& userId);

    bool exists(const std::string& userId) const;

private:
    DatabaseManager& m_db;
    const EncryptionManager& m_enc;
    std::shared_ptr<spdlog::logger> m_log;
};
