#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/fwd.h>

#include "EncryptionManager.hpp"

class DatabaseManager;

// Turns the vault passphrase into the process-wide EncryptionManager.
//
// First run stores two random 16-byte salts: the KDF salt (key material)
// and the verifier salt. The verifier is Argon2id(passphrase, verifier_salt),
// so a wrong passphrase is rejected up front instead of surfacing later as a
// DecryptionError on every record. Neither the key nor the passphrase is
// persisted.
class KeyManager {
public:
    explicit KeyManager(DatabaseManager& db,
                        std::shared_ptr<spdlog::logger> logger = nullptr);

    // True once both the KDF salt and the verifier have been recorded.
    bool isInitialized() const;

    // First run. Throws std::invalid_argument on empty passphrase and
    // std::logic_error if the vault is already initialized. Salt and verifier
    // are committed in one transaction.
    EncryptionManager initialize(const std::string& passphrase);

    // nullopt if the passphrase does not match the stored verifier.
    // Throws std::logic_error if the vault was never initialized.
    std::optional<EncryptionManager> unlock(const std::string& passphrase) const;

private:
    DatabaseManager& m_db;
    std::shared_ptr<spdlog::logger> m_log;
};
