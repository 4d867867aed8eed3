// src/DatabaseManager.cpp
#include "DatabaseManager.hpp"
#include "time_utils.hpp"

#include <sqlite3.h>
#include <string>
#include <vector>
#include <memory>     // std::unique_ptr
#include <optional>   // std::optional
#include <cstdint>

// Helper: RAII closer for sqlite3_stmt* + small helpers
namespace {
    struct StmtCloser {
        void operator()(sqlite3_stmt* stmt) const {
            if (stmt) sqlite3_finalize(stmt);
        }
    };
    using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtCloser>;

    [[noreturn]] void throw_db(sqlite3* db, const std::string& what) {
        throw StorageError(what + ": " + sqlite3_errmsg(db));
    }

    StmtPtr prepare(sqlite3* db, const char* sql, const char* what) {
        sqlite3_stmt* stmtRaw = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmtRaw, nullptr);
        if (rc != SQLITE_OK) {
            if (stmtRaw) sqlite3_finalize(stmtRaw);
            throw_db(db, std::string("sqlite3_prepare_v2(") + what + ")");
        }
        return StmtPtr(stmtRaw);
    }

    void bind_text(sqlite3* db, sqlite3_stmt* st, int idx, const std::string& v, const char* what) {
        if (sqlite3_bind_text(st, idx, v.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK)
            throw_db(db, std::string("bind ") + what);
    }

    void bind_blob(sqlite3* db, sqlite3_stmt* st, int idx,
                   const std::vector<std::uint8_t>& v, const char* what) {
        if (sqlite3_bind_blob(st, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT) != SQLITE_OK)
            throw_db(db, std::string("bind ") + what);
    }

    void step_done(sqlite3* db, sqlite3_stmt* st, const char* what) {
        if (sqlite3_step(st) != SQLITE_DONE)
            throw_db(db, std::string("step ") + what);
    }

    // Null-safe read of TEXT columns
    inline std::string read_text_nullable(sqlite3_stmt* st, int col) {
        const unsigned char* p = sqlite3_column_text(st, col);
        return p ? reinterpret_cast<const char*>(p) : std::string{};
    }

    inline std::vector<std::uint8_t> read_blob(sqlite3_stmt* st, int col) {
        const void* ptr = sqlite3_column_blob(st, col);
        int nbytes = sqlite3_column_bytes(st, col);
        std::vector<std::uint8_t> out;
        if (ptr && nbytes > 0) {
            const auto* b = static_cast<const std::uint8_t*>(ptr);
            out.assign(b, b + nbytes);
        }
        return out;
    }

    // DELETE ... WHERE user_id = ?; returns rows removed
    int delete_by_user(sqlite3* db, const char* sql, const std::string& userId, const char* what) {
        auto stmt = prepare(db, sql, what);
        bind_text(db, stmt.get(), 1, userId, "user_id");
        step_done(db, stmt.get(), what);
        return sqlite3_changes(db);
    }

    std::optional<ResetTokenRecord> select_token(sqlite3* db, const std::string& userId) {
        auto stmt = prepare(db,
            "SELECT token_hash, expires_at FROM reset_tokens WHERE user_id = ?;",
            "getResetToken");
        bind_text(db, stmt.get(), 1, userId, "user_id");

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            ResetTokenRecord r;
            r.user_id    = userId;
            r.token_hash = read_blob(stmt.get(), 0);
            r.expires_at = read_text_nullable(stmt.get(), 1);
            return r;
        } else if (rc == SQLITE_DONE) {
            return std::nullopt;
        }
        throw_db(db, "step getResetToken");
    }

    void write_kdf_salt(sqlite3* db, const std::vector<std::uint8_t>& kdfSalt) {
        if (kdfSalt.empty()) {
            throw std::invalid_argument("storeKdfSalt: kdfSalt must not be empty");
        }
        auto stmt = prepare(db,
            "INSERT INTO app_settings (id, kdf_salt) VALUES (1, ?) "
            "ON CONFLICT(id) DO UPDATE SET kdf_salt=excluded.kdf_salt;",
            "storeKdfSalt");
        bind_blob(db, stmt.get(), 1, kdfSalt, "kdf_salt");
        step_done(db, stmt.get(), "storeKdfSalt");
    }

    void write_verifier(sqlite3* db, const PassphraseVerifier& verifier) {
        auto stmt = prepare(db,
            "INSERT INTO vault_verifier (id, salt, hash) VALUES (1, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET salt=excluded.salt, hash=excluded.hash;",
            "storeVerifier");
        bind_blob(db, stmt.get(), 1, verifier.salt, "salt");
        bind_blob(db, stmt.get(), 2, verifier.hash, "hash");
        step_done(db, stmt.get(), "storeVerifier");
    }
}

// ---- Persistent-connection ctor/dtor ----
DatabaseManager::DatabaseManager(const std::string& dbPath)
    : m_dbPath(dbPath), m_db(nullptr)
{
    int rc = sqlite3_open_v2(
        m_dbPath.c_str(),
        &m_db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK || !m_db) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "unknown";
        if (m_db) sqlite3_close(m_db);
        m_db = nullptr;
        throw StorageError("sqlite3_open_v2 failed: " + msg);
    }

    // Wait on another process' write lock instead of failing at once
    if (sqlite3_busy_timeout(m_db, 5000) != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(m_db);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StorageError("sqlite3_busy_timeout failed: " + msg);
    }

    exec("PRAGMA foreign_keys = ON;");
}

DatabaseManager::~DatabaseManager() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

// Run raw SQL (no parameters) on the same connection
void DatabaseManager::exec(const std::string& sql) const {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown";
        sqlite3_free(errMsg);
        throw StorageError("sqlite3_exec failed: " + msg);
    }
}

void DatabaseManager::inTransaction(const std::function<void()>& body) {
    exec("BEGIN IMMEDIATE;");
    try {
        body();
        exec("COMMIT;");
    } catch (...) {
        // Report the original failure; if ROLLBACK itself fails SQLite has
        // already ended the transaction.
        sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

// Create tables & index if missing
void DatabaseManager::init() {
    static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS vault_verifier (
  id   INTEGER PRIMARY KEY CHECK (id = 1),
  salt BLOB NOT NULL,
  hash BLOB NOT NULL
);

CREATE TABLE IF NOT EXISTS app_settings (
  id       INTEGER PRIMARY KEY CHECK (id = 1),
  kdf_salt BLOB NOT NULL
);

CREATE TABLE IF NOT EXISTS user_credentials (
  user_id            TEXT PRIMARY KEY,
  encrypted_username BLOB NOT NULL,
  username_iv        BLOB NOT NULL,
  encrypted_password BLOB NOT NULL,
  password_iv        BLOB NOT NULL,
  hint               TEXT DEFAULT '',
  biometric_enabled  INTEGER NOT NULL DEFAULT 0,
  updated_at         TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS reset_tokens (
  user_id    TEXT PRIMARY KEY
             REFERENCES user_credentials(user_id) ON DELETE CASCADE,
  token_hash BLOB NOT NULL,
  expires_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS user_biometrics (
  user_id       TEXT PRIMARY KEY,
  face_encoding BLOB NOT NULL,
  enrolled_at   TEXT NOT NULL
);
)SQL";

    std::lock_guard<std::mutex> lock(m_mutex);
    exec(kSchema);
}

// --------- Credentials ---------

void DatabaseManager::upsertCredential(const CredentialRecord& rec) {
    const char* upsertSql = R"SQL(
        INSERT INTO user_credentials(user_id, encrypted_username, username_iv,
                                     encrypted_password, password_iv, hint,
                                     biometric_enabled, updated_at)
        VALUES(?1, ?2, ?3, ?4, ?5, ?6,
               EXISTS(SELECT 1 FROM user_biometrics WHERE user_id = ?1), ?7)
        ON CONFLICT(user_id) DO UPDATE SET
            encrypted_username = excluded.encrypted_username,
            username_iv        = excluded.username_iv,
            encrypted_password = excluded.encrypted_password,
            password_iv        = excluded.password_iv,
            hint               = excluded.hint,
            updated_at         = excluded.updated_at;
    )SQL";

    std::lock_guard<std::mutex> lock(m_mutex);
    inTransaction([&] {
        auto stmt = prepare(m_db, upsertSql, "upsertCredential");
        bind_text(m_db, stmt.get(), 1, rec.user_id,      "user_id");
        bind_blob(m_db, stmt.get(), 2, rec.enc_username, "encrypted_username");
        bind_blob(m_db, stmt.get(), 3, rec.username_iv,  "username_iv");
        bind_blob(m_db, stmt.get(), 4, rec.enc_password, "encrypted_password");
        bind_blob(m_db, stmt.get(), 5, rec.password_iv,  "password_iv");
        bind_text(m_db, stmt.get(), 6, rec.hint,         "hint");
        bind_text(m_db, stmt.get(), 7, now_utc_iso8601(), "updated_at");
        step_done(m_db, stmt.get(), "upsertCredential");

        // a rewritten credential invalidates any pending reset
        delete_by_user(m_db, "DELETE FROM reset_tokens WHERE user_id = ?;",
                       rec.user_id, "upsertCredential(reset_tokens)");
    });
}

std::optional<CredentialRecord> DatabaseManager::getCredential(const std::string& userId) const {
    const char* sql = R"SQL(
        SELECT encrypted_username, username_iv, encrypted_password, password_iv,
               hint, biometric_enabled, updated_at
        FROM user_credentials WHERE user_id = ?;
    )SQL";

    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = prepare(m_db, sql, "getCredential");
    bind_text(m_db, stmt.get(), 1, userId, "user_id");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        CredentialRecord c;
        c.user_id           = userId;
        c.enc_username      = read_blob(stmt.get(), 0);
        c.username_iv       = read_blob(stmt.get(), 1);
        c.enc_password      = read_blob(stmt.get(), 2);
        c.password_iv       = read_blob(stmt.get(), 3);
        c.hint              = read_text_nullable(stmt.get(), 4);
        c.biometric_enabled = sqlite3_column_int(stmt.get(), 5) != 0;
        c.updated_at        = read_text_nullable(stmt.get(), 6);
        return c;
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    throw_db(m_db, "step getCredential");
}

bool DatabaseManager::deleteUser(const std::string& userId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    int removed = 0;
    inTransaction([&] {
        delete_by_user(m_db, "DELETE FROM reset_tokens WHERE user_id = ?;",
                       userId, "deleteUser(reset_tokens)");
        delete_by_user(m_db, "DELETE FROM user_biometrics WHERE user_id = ?;",
                       userId, "deleteUser(user_biometrics)");
        removed = delete_by_user(m_db, "DELETE FROM user_credentials WHERE user_id = ?;",
                                 userId, "deleteUser(user_credentials)");
    });
    return removed > 0;
}

// --------- Reset tokens ---------

bool DatabaseManager::upsertResetToken(const ResetTokenRecord& rec) {
    // The existence check rides in the same statement, so a concurrent
    // deleteUser cannot slip in between check and insert.
    const char* sql =
        "INSERT INTO reset_tokens (user_id, token_hash, expires_at) "
        "SELECT ?1, ?2, ?3 WHERE EXISTS (SELECT 1 FROM user_credentials WHERE user_id = ?1) "
        "ON CONFLICT(user_id) DO UPDATE SET token_hash=excluded.token_hash, "
        "expires_at=excluded.expires_at;";

    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = prepare(m_db, sql, "upsertResetToken");
    bind_text(m_db, stmt.get(), 1, rec.user_id,    "user_id");
    bind_blob(m_db, stmt.get(), 2, rec.token_hash, "token_hash");
    bind_text(m_db, stmt.get(), 3, rec.expires_at, "expires_at");
    step_done(m_db, stmt.get(), "upsertResetToken");
    return sqlite3_changes(m_db) > 0;
}

std::optional<ResetTokenRecord> DatabaseManager::getResetToken(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return select_token(m_db, userId);
}

bool DatabaseManager::deleteResetToken(const std::string& userId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return delete_by_user(m_db, "DELETE FROM reset_tokens WHERE user_id = ?;",
                          userId, "deleteResetToken") > 0;
}

bool DatabaseManager::consumeResetToken(
    const std::string& userId,
    const std::function<bool(const ResetTokenRecord&)>& accept)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    bool accepted = false;
    inTransaction([&] {
        auto row = select_token(m_db, userId);
        if (!row || !accept(*row)) return;
        delete_by_user(m_db, "DELETE FROM reset_tokens WHERE user_id = ?;",
                       userId, "consumeResetToken");
        accepted = true;
    });
    return accepted;
}

// --------- Biometric profiles ---------

void DatabaseManager::upsertBiometric(const BiometricRecord& rec) {
    const char* sql =
        "INSERT INTO user_biometrics (user_id, face_encoding, enrolled_at) VALUES (?, ?, ?) "
        "ON CONFLICT(user_id) DO UPDATE SET face_encoding=excluded.face_encoding, "
        "enrolled_at=excluded.enrolled_at;";

    std::lock_guard<std::mutex> lock(m_mutex);
    inTransaction([&] {
        auto stmt = prepare(m_db, sql, "upsertBiometric");
        bind_text(m_db, stmt.get(), 1, rec.user_id,  "user_id");
        bind_blob(m_db, stmt.get(), 2, rec.encoding, "face_encoding");
        bind_text(m_db, stmt.get(), 3, rec.enrolled_at.empty() ? now_utc_iso8601() : rec.enrolled_at,
                  "enrolled_at");
        step_done(m_db, stmt.get(), "upsertBiometric");

        auto flag = prepare(m_db,
            "UPDATE user_credentials SET biometric_enabled = 1 WHERE user_id = ?;",
            "upsertBiometric(flag)");
        bind_text(m_db, flag.get(), 1, rec.user_id, "user_id");
        step_done(m_db, flag.get(), "upsertBiometric(flag)");
    });
}

std::vector<BiometricRecord> DatabaseManager::getAllBiometrics() const {
    const char* sql =
        "SELECT user_id, face_encoding, enrolled_at FROM user_biometrics ORDER BY user_id;";

    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = prepare(m_db, sql, "getAllBiometrics");

    std::vector<BiometricRecord> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        BiometricRecord r;
        r.user_id     = read_text_nullable(stmt.get(), 0);
        r.encoding    = read_blob(stmt.get(), 1);
        r.enrolled_at = read_text_nullable(stmt.get(), 2);
        out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) {
        throw_db(m_db, "step getAllBiometrics");
    }
    return out;
}

bool DatabaseManager::deleteBiometric(const std::string& userId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    int removed = 0;
    inTransaction([&] {
        removed = delete_by_user(m_db, "DELETE FROM user_biometrics WHERE user_id = ?;",
                                 userId, "deleteBiometric");
        auto flag = prepare(m_db,
            "UPDATE user_credentials SET biometric_enabled = 0 WHERE user_id = ?;",
            "deleteBiometric(flag)");
        bind_text(m_db, flag.get(), 1, userId, "user_id");
        step_done(m_db, flag.get(), "deleteBiometric(flag)");
    });
    return removed > 0;
}

// ---- App settings (KDF salt at id=1)

void DatabaseManager::storeKdfSalt(const std::vector<std::uint8_t>& kdfSalt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    write_kdf_salt(m_db, kdfSalt);
}

std::optional<std::vector<std::uint8_t>> DatabaseManager::loadKdfSalt() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = prepare(m_db, "SELECT kdf_salt FROM app_settings WHERE id = 1;", "loadKdfSalt");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return read_blob(stmt.get(), 0);
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    throw_db(m_db, "step loadKdfSalt");
}

// ---- Passphrase verifier (id=1)

void DatabaseManager::storeVerifier(const PassphraseVerifier& verifier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    write_verifier(m_db, verifier);
}

void DatabaseManager::storeKeyMaterial(const std::vector<std::uint8_t>& kdfSalt,
                                       const PassphraseVerifier& verifier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    inTransaction([&] {
        write_verifier(m_db, verifier);
        write_kdf_salt(m_db, kdfSalt);
    });
}

std::optional<PassphraseVerifier> DatabaseManager::loadVerifier() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = prepare(m_db, "SELECT salt, hash FROM vault_verifier WHERE id = 1;", "loadVerifier");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        PassphraseVerifier v;
        v.salt = read_blob(stmt.get(), 0);
        v.hash = read_blob(stmt.get(), 1);
        return v;
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    throw_db(m_db, "step loadVerifier");
}
