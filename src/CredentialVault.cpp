#include "CredentialVault.hpp"
#include "DatabaseManager.hpp"
#include "EncryptionManager.hpp"
#include "logging.hpp"

#include <openssl/crypto.h>  // OPENSSL_cleanse
#include <cstdint>
#include <vector>

namespace {
    std::vector<std::uint8_t> toBytes(const std::string& s) {
        return { s.begin(), s.end() };
    }

    // AAD = user_id \n field
    std::vector<std::uint8_t> makeAAD(const std::string& userId, const char* field) {
        return toBytes(userId + "\n" + field);
    }

    std::string takeString(std::vector<std::uint8_t>& bytes) {
        std::string s(bytes.begin(), bytes.end());
        OPENSSL_cleanse(bytes.data(), bytes.size());
        return s;
    }
}

CredentialVault::CredentialVault(DatabaseManager& db,
                                 const EncryptionManager& enc,
                                 std::shared_ptr<spdlog::logger> logger)
    : m_db(db), m_enc(enc), m_log(Log::orDefault(std::move(logger)))
{
}

VaultStatus CredentialVault::store(const std::string& userId,
                                   const std::string& username,
                                   const std::string& password,
                                   const std::string& hint) {
    if (userId.empty() || username.empty() || password.empty()) {
        m_log->warn("store rejected for '{}': missing required field", userId);
        return VaultStatus::ValidationError;
    }

    auto user = toBytes(username);
    auto pass = toBytes(password);
    auto encUser = m_enc.encrypt(user, makeAAD(userId, "username"));
    auto encPass = m_enc.encrypt(pass, makeAAD(userId, "password"));
    OPENSSL_cleanse(user.data(), user.size());
    OPENSSL_cleanse(pass.data(), pass.size());

    CredentialRecord rec;
    rec.user_id      = userId;
    rec.enc_username = std::move(encUser.encAndTag);
    rec.username_iv  = std::move(encUser.iv);
    rec.enc_password = std::move(encPass.encAndTag);
    rec.password_iv  = std::move(encPass.iv);
    rec.hint         = hint;

    m_db.upsertCredential(rec);
    m_log->info("Stored credentials for user: {}", userId);
    return VaultStatus::Ok;
}

RetrieveResult CredentialVault::retrieve(const std::string& userId) const {
    RetrieveResult out;

    auto row = m_db.getCredential(userId);
    if (!row) {
        m_log->info("retrieve: no credentials for user: {}", userId);
        out.status = VaultStatus::NotFound;
        return out;
    }

    try {
        auto user = m_enc.decrypt(row->username_iv, row->enc_username, makeAAD(userId, "username"));
        auto pass = m_enc.decrypt(row->password_iv, row->enc_password, makeAAD(userId, "password"));

        PlainCredential c;
        c.username          = takeString(user);
        c.password          = takeString(pass);
        c.hint              = row->hint;
        c.biometric_enabled = row->biometric_enabled;

        out.status = VaultStatus::Ok;
        out.credential = std::move(c);
    } catch (const AuthenticationError&) {
        m_log->error("retrieve: ciphertext for user {} failed authentication", userId);
        out.status = VaultStatus::DecryptionError;
    } catch (const std::invalid_argument& ex) {
        m_log->error("retrieve: malformed ciphertext for user {}: {}", userId, ex.what());
        out.status = VaultStatus::DecryptionError;
    }
    return out;
}

VaultStatus CredentialVault::remove(const std::string& userId) {
    if (!m_db.deleteUser(userId)) {
        m_log->info("remove: no credentials for user: {}", userId);
        return VaultStatus::NotFound;
    }
    m_log->info("Removed user: {}", userId);
    return VaultStatus::Ok;
}

bool CredentialVault::exists(const std::string& userId) const {
    return m_db.getCredential(userId).has_value();
}
