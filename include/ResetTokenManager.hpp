#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/fwd.h>

#include "VaultStatus.hpp"

class DatabaseManager;

struct ResetToken {
    std::string token;                               // raw token; shown once
    std::chrono::system_clock::time_point expiry;
};

struct IssueResult {
    VaultStatus status = VaultStatus::NotFound;
    std::optional<ResetToken> reset;                 // set iff status == Ok

    bool ok() const { return status == VaultStatus::Ok; }
};

// Password-reset tokens, one active per user, valid for a fixed window.
//
// Only SHA-256(token) is persisted; comparison is constant time over the
// digests. verify() leaves the token in place; redeem() is the single-use
// variant and deletes it on success.
class ResetTokenManager {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::chrono::hours TOKEN_TTL{24};

    ResetTokenManager(DatabaseManager& db,
                      std::shared_ptr<spdlog::logger> logger = nullptr,
                      Clock clock = nullptr);

    // NotFound if the user has no credential; otherwise replaces any prior token.
    IssueResult issue(const std::string& userId);

    bool verify(const std::string& userId, const std::string& token) const;
    bool redeem(const std::string& userId, const std::string& token);

    // True if a token was removed.
    bool revoke(const std::string& userId);

private:
    DatabaseManager& m_db;
    std::shared_ptr<spdlog::logger> m_log;
    Clock m_clock;
};
