#include "ResetTokenManager.hpp"
#include "DatabaseManager.hpp"
#include "logging.hpp"
#include "time_utils.hpp"
#include "token_gen.hpp"

#include <openssl/crypto.h>  // CRYPTO_memcmp
#include <openssl/sha.h>

namespace {
    using TimePoint = std::chrono::system_clock::time_point;

    bool well_formed(const ResetTokenRecord& stored) {
        return stored.token_hash.size() == SHA256_DIGEST_LENGTH &&
               parse_utc_iso8601(stored.expires_at).has_value();
    }

    // Pure check over the stored row; safe to run inside a store transaction.
    bool token_matches(const ResetTokenRecord& stored,
                       const std::vector<std::uint8_t>& candidateHash,
                       TimePoint now) {
        if (!well_formed(stored)) return false;
        bool equal = CRYPTO_memcmp(candidateHash.data(), stored.token_hash.data(),
                                   SHA256_DIGEST_LENGTH) == 0;
        return equal && now < *parse_utc_iso8601(stored.expires_at);
    }
}

ResetTokenManager::ResetTokenManager(DatabaseManager& db,
                                     std::shared_ptr<spdlog::logger> logger,
                                     Clock clock)
    : m_db(db),
      m_log(Log::orDefault(std::move(logger))),
      m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
}

IssueResult ResetTokenManager::issue(const std::string& userId) {
    IssueResult out;
    if (userId.empty()) {
        out.status = VaultStatus::NotFound;
        return out;
    }

    using namespace std::chrono;
    // stored at second resolution; keep the returned expiry identical to it
    auto expiry = time_point_cast<seconds>(m_clock()) + TOKEN_TTL;

    ResetToken reset;
    reset.token  = generate_reset_token();
    reset.expiry = expiry;

    ResetTokenRecord rec;
    rec.user_id    = userId;
    rec.token_hash = sha256(reset.token);
    rec.expires_at = to_utc_iso8601(expiry);
    if (!m_db.upsertResetToken(rec)) {
        m_log->warn("No user found for {}", userId);
        out.status = VaultStatus::NotFound;
        return out;
    }

    m_log->info("Issued reset token for user {} (expires {})", userId, rec.expires_at);
    out.status = VaultStatus::Ok;
    out.reset  = std::move(reset);
    return out;
}

bool ResetTokenManager::verify(const std::string& userId, const std::string& token) const {
    auto stored = m_db.getResetToken(userId);
    if (!stored) {
        m_log->debug("verify: no reset token for user {}", userId);
        return false;
    }
    if (!well_formed(*stored)) {
        m_log->warn("Malformed reset token row for user {}", userId);
        return false;
    }
    bool ok = token_matches(*stored, sha256(token), m_clock());
    m_log->info("Reset token verification for user {}: {}", userId, ok ? "valid" : "invalid");
    return ok;
}

bool ResetTokenManager::redeem(const std::string& userId, const std::string& token) {
    // Clock and hash are taken before the store is locked.
    const auto now = m_clock();
    const auto candidate = sha256(token);
    bool malformed = false;
    bool ok = m_db.consumeResetToken(userId, [&](const ResetTokenRecord& stored) {
        malformed = !well_formed(stored);
        return token_matches(stored, candidate, now);
    });
    if (malformed) m_log->warn("Malformed reset token row for user {}", userId);
    m_log->info("Reset token redemption for user {}: {}", userId, ok ? "accepted" : "rejected");
    return ok;
}

bool ResetTokenManager::revoke(const std::string& userId) {
    bool removed = m_db.deleteResetToken(userId);
    if (removed) m_log->info("Revoked reset token for user {}", userId);
    return removed;
}
