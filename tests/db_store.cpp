// tests/db_store.cpp
#include <catch2/catch_all.hpp>
#include "DatabaseManager.hpp"
#include "test_support.hpp"

namespace {
    CredentialRecord makeRecord(const std::string& userId, std::uint8_t fill, const std::string& hint) {
        CredentialRecord r;
        r.user_id      = userId;
        r.enc_username = std::vector<std::uint8_t>(20, fill);
        r.username_iv  = std::vector<std::uint8_t>(12, fill);
        r.enc_password = std::vector<std::uint8_t>(24, fill);
        r.password_iv  = std::vector<std::uint8_t>(12, fill);
        r.hint         = hint;
        return r;
    }

    ResetTokenRecord makeToken(const std::string& userId, std::uint8_t fill) {
        return ResetTokenRecord{ userId, std::vector<std::uint8_t>(32, fill), "2030-01-01T00:00:00Z" };
    }
}

TEST_CASE("DB: credential upsert keeps exactly one row per user", "[db][cred]") {
    TempDbFile tmp("tmp_test_cred.sqlite");
    DatabaseManager db(tmp.path);
    db.init();

    REQUIRE_FALSE(db.getCredential("u1").has_value());

    db.upsertCredential(makeRecord("u1", 0x01, "first"));
    auto first = db.getCredential("u1");
    REQUIRE(first.has_value());
    REQUIRE(first->hint == "first");
    REQUIRE(first->enc_password == std::vector<std::uint8_t>(24, 0x01));
    REQUIRE_FALSE(first->biometric_enabled);
    REQUIRE_FALSE(first->updated_at.empty());

    db.upsertCredential(makeRecord("u1", 0x02, "second"));
    auto second = db.getCredential("u1");
    REQUIRE(second->hint == "second");
    REQUIRE(second->enc_username == std::vector<std::uint8_t>(20, 0x02));

    REQUIRE(db.deleteUser("u1"));
    REQUIRE_FALSE(db.getCredential("u1").has_value());
    REQUIRE_FALSE(db.deleteUser("u1"));
}

TEST_CASE("DB: reset tokens live in their own table", "[db][token]") {
    TempDbFile tmp("tmp_test_tokens.sqlite");
    DatabaseManager db(tmp.path);
    db.init();

    db.upsertCredential(makeRecord("u1", 0x01, "my hint"));

    SECTION("Token upsert leaves the hint alone and replaces the previous token") {
        REQUIRE(db.upsertResetToken(makeToken("u1", 0xAA)));
        REQUIRE(db.upsertResetToken(makeToken("u1", 0xBB)));

        REQUIRE(db.getCredential("u1")->hint == "my hint");
        auto tok = db.getResetToken("u1");
        REQUIRE(tok.has_value());
        REQUIRE(tok->token_hash == std::vector<std::uint8_t>(32, 0xBB));
        REQUIRE(tok->expires_at == "2030-01-01T00:00:00Z");
    }

    SECTION("Credential upsert drops the pending token") {
        REQUIRE(db.upsertResetToken(makeToken("u1", 0xAA)));
        db.upsertCredential(makeRecord("u1", 0x03, "new hint"));
        REQUIRE_FALSE(db.getResetToken("u1").has_value());
    }

    SECTION("A token needs an existing credential") {
        REQUIRE_FALSE(db.upsertResetToken(makeToken("ghost", 0xAA)));
        REQUIRE_FALSE(db.getResetToken("ghost").has_value());

        REQUIRE(db.deleteUser("u1"));
        REQUIRE_FALSE(db.upsertResetToken(makeToken("u1", 0xAA)));
        REQUIRE_FALSE(db.getResetToken("u1").has_value());
    }

    SECTION("consumeResetToken deletes only when accepted") {
        REQUIRE(db.upsertResetToken(makeToken("u1", 0xAA)));

        REQUIRE_FALSE(db.consumeResetToken("u1", [](const ResetTokenRecord&) { return false; }));
        REQUIRE(db.getResetToken("u1").has_value());

        REQUIRE(db.consumeResetToken("u1", [](const ResetTokenRecord& r) {
            return r.token_hash.front() == 0xAA;
        }));
        REQUIRE_FALSE(db.getResetToken("u1").has_value());
        REQUIRE_FALSE(db.consumeResetToken("u1", [](const ResetTokenRecord&) { return true; }));
    }

    SECTION("deleteResetToken") {
        REQUIRE_FALSE(db.deleteResetToken("u1"));
        REQUIRE(db.upsertResetToken(makeToken("u1", 0xAA)));
        REQUIRE(db.deleteResetToken("u1"));
    }
}

TEST_CASE("DB: biometric profiles and the biometric_enabled flag", "[db][bio]") {
    TempDbFile tmp("tmp_test_bio.sqlite");
    DatabaseManager db(tmp.path);
    db.init();

    db.upsertCredential(makeRecord("u2", 0x01, ""));
    db.upsertBiometric(BiometricRecord{ "u2", std::vector<std::uint8_t>(16, 0x02), "" });
    db.upsertBiometric(BiometricRecord{ "u1", std::vector<std::uint8_t>(16, 0x01), "" });

    auto all = db.getAllBiometrics();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].user_id == "u1");   // ordered by user_id
    REQUIRE(all[1].user_id == "u2");
    REQUIRE_FALSE(all[0].enrolled_at.empty());

    REQUIRE(db.getCredential("u2")->biometric_enabled);

    // re-storing the credential keeps the flag
    db.upsertCredential(makeRecord("u2", 0x05, "hint"));
    REQUIRE(db.getCredential("u2")->biometric_enabled);

    // a credential created after enrollment starts enabled
    db.upsertCredential(makeRecord("u1", 0x06, ""));
    REQUIRE(db.getCredential("u1")->biometric_enabled);

    // re-enrollment overwrites
    db.upsertBiometric(BiometricRecord{ "u2", std::vector<std::uint8_t>(16, 0x09), "" });
    all = db.getAllBiometrics();
    REQUIRE(all.size() == 2);
    REQUIRE(all[1].encoding == std::vector<std::uint8_t>(16, 0x09));

    REQUIRE(db.deleteBiometric("u2"));
    REQUIRE_FALSE(db.getCredential("u2")->biometric_enabled);
    REQUIRE_FALSE(db.deleteBiometric("u2"));

    // deleteUser removes the profile too
    REQUIRE(db.deleteUser("u1"));
    REQUIRE(db.getAllBiometrics().empty());
}

TEST_CASE("DB: data survives reopening the file", "[db]") {
    TempDbFile tmp("tmp_test_reopen.sqlite");
    {
        DatabaseManager db(tmp.path);
        db.init();
        db.upsertCredential(makeRecord("u1", 0x01, "kept"));
    }
    DatabaseManager db(tmp.path);
    db.init();
    auto rec = db.getCredential("u1");
    REQUIRE(rec.has_value());
    REQUIRE(rec->hint == "kept");
}
