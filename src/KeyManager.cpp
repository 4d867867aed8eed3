#include "KeyManager.hpp"
#include "DatabaseManager.hpp"
#include "logging.hpp"

#include <openssl/crypto.h> // CRYPTO_memcmp, OPENSSL_cleanse
#include <openssl/rand.h>   // RAND_bytes
#include <stdexcept>

namespace {
    std::vector<std::uint8_t> random_salt() {
        std::vector<std::uint8_t> salt(EncryptionManager::SALT_LEN);
        if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed for salt");
        }
        return salt;
    }
}

KeyManager::KeyManager(DatabaseManager& db, std::shared_ptr<spdlog::logger> logger)
    : m_db(db), m_log(Log::orDefault(std::move(logger)))
{
}

bool KeyManager::isInitialized() const {
    return m_db.loadVerifier().has_value() && m_db.loadKdfSalt().has_value();
}

EncryptionManager KeyManager::initialize(const std::string& passphrase) {
    if (passphrase.empty()) {
        throw std::invalid_argument("initialize: passphrase must not be empty");
    }
    if (isInitialized()) {
        throw std::logic_error("initialize: vault passphrase already set");
    }

    // A lone salt is reused; a lone verifier is replaced.
    auto kdfSalt = m_db.loadKdfSalt();
    if (!kdfSalt) kdfSalt = random_salt();

    PassphraseVerifier verifier;
    verifier.salt = random_salt();
    verifier.hash = EncryptionManager::deriveKey(passphrase, verifier.salt);

    auto key = EncryptionManager::deriveKey(passphrase, *kdfSalt);
    EncryptionManager enc(key);
    OPENSSL_cleanse(key.data(), key.size());

    m_db.storeKeyMaterial(*kdfSalt, verifier);
    m_log->info("Vault passphrase initialized");
    return enc;
}

std::optional<EncryptionManager> KeyManager::unlock(const std::string& passphrase) const {
    auto verifier = m_db.loadVerifier();
    auto kdfSalt = m_db.loadKdfSalt();
    if (!verifier || !kdfSalt) {
        throw std::logic_error("unlock: vault passphrase not set");
    }
    if (verifier->salt.size() != EncryptionManager::SALT_LEN ||
        verifier->hash.size() != EncryptionManager::KEY_LEN) {
        m_log->error("Stored passphrase verifier is malformed");
        return std::nullopt;
    }

    auto recomputed = EncryptionManager::deriveKey(passphrase, verifier->salt);
    bool match = CRYPTO_memcmp(recomputed.data(), verifier->hash.data(), recomputed.size()) == 0;
    OPENSSL_cleanse(recomputed.data(), recomputed.size());
    if (!match) {
        m_log->warn("Vault unlock rejected: passphrase mismatch");
        return std::nullopt;
    }

    auto key = EncryptionManager::deriveKey(passphrase, *kdfSalt);
    EncryptionManager enc(key);
    OPENSSL_cleanse(key.data(), key.size());

    m_log->info("Vault unlocked");
    return enc;
}
