#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <cstdint>

// Forward-declare sqlite3 so consumers of this header don't need sqlite3.h
struct sqlite3;

// Any SQLite failure (open, prepare, bind, step). Never retried.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One row of user_credentials. Both secrets carry their own 12-byte IV.
struct CredentialRecord {
    std::string user_id;
    std::vector<std::uint8_t> enc_username;   // ciphertext || 16-byte tag
    std::vector<std::uint8_t> username_iv;
    std::vector<std::uint8_t> enc_password;   // ciphertext || 16-byte tag
    std::vector<std::uint8_t> password_iv;
    std::string hint;
    bool biometric_enabled = false;
    std::string updated_at;                   // ISO-8601 (UTC)
};

// One row of reset_tokens. Only the SHA-256 of the token is kept.
struct ResetTokenRecord {
    std::string user_id;
    std::vector<std::uint8_t> token_hash;
    std::string expires_at;                   // ISO-8601 (UTC), parsed by the caller
};

// One row of user_biometrics; encoding is packed doubles.
struct BiometricRecord {
    std::string user_id;
    std::vector<std::uint8_t> encoding;
    std::string enrolled_at;
};

// Argon2id verifier for the vault passphrase.
struct PassphraseVerifier {
    std::vector<std::uint8_t> salt;  // 16 bytes
    std::vector<std::uint8_t> hash;  // 32 bytes
};

// Owns the single SQLite connection. Every public call is serialized on an
// internal mutex; multi-statement calls run in one BEGIN IMMEDIATE transaction.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& dbPath);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Create tables if not present
    void init();

    // ---- Credentials
    // Upsert by user_id and drop the user's reset token, atomically.
    // rec.biometric_enabled is ignored: an existing row keeps its flag,
    // a new row starts enabled only if a profile already exists.
    void upsertCredential(const CredentialRecord& rec);
    std::optional<CredentialRecord> getCredential(const std::string& userId) const;
    // Deletes credential, reset token and biometric profile.
    // Returns false if no credential row existed.
    bool deleteUser(const std::string& userId);

    // ---- Reset tokens (one per user)
    // Returns false, writing nothing, if rec.user_id has no credential.
    bool upsertResetToken(const ResetTokenRecord& rec);
    std::optional<ResetTokenRecord> getResetToken(const std::string& userId) const;
    bool deleteResetToken(const std::string& userId);
    // Loads the user's token and deletes it iff accept(row) returns true,
    // inside one transaction. Returns what accept returned (false if no row).
    // accept runs with the store locked: it must not call back into this
    // DatabaseManager.
    bool consumeResetToken(const std::string& userId,
                           const std::function<bool(const ResetTokenRecord&)>& accept);

    // ---- Biometric profiles (one per user)
    // Upsert the profile and set biometric_enabled on the credential, if any.
    void upsertBiometric(const BiometricRecord& rec);
    std::vector<BiometricRecord> getAllBiometrics() const;   // ordered by user_id
    // Delete the profile and clear biometric_enabled. False if none existed.
    bool deleteBiometric(const std::string& userId);

    // ---- App settings (KDF salt at id=1)
    void storeKdfSalt(const std::vector<std::uint8_t>& kdfSalt);
    std::optional<std::vector<std::uint8_t>> loadKdfSalt() const;

    // ---- Passphrase verifier (id=1)
    void storeVerifier(const PassphraseVerifier& verifier);
    std::optional<PassphraseVerifier> loadVerifier() const;

    // First-run key setup: salt and verifier land together or not at all.
    void storeKeyMaterial(const std::vector<std::uint8_t>& kdfSalt,
                          const PassphraseVerifier& verifier);

private:
    std::string m_dbPath;
    sqlite3*    m_db = nullptr; // persistent DB connection
    mutable std::mutex m_mutex;

    // helper to run raw SQL without parameters on m_db
    void exec(const std::string& sql) const;
    // BEGIN IMMEDIATE / COMMIT around body; ROLLBACK and rethrow on failure.
    // Caller must hold m_mutex.
    void inTransaction(const std::function<void()>& body);
};
