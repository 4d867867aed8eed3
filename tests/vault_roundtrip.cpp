#include <catch2/catch_all.hpp>

#include "CredentialVault.hpp"
#include "DatabaseManager.hpp"
#include "EncryptionManager.hpp"
#include "test_support.hpp"

TEST_CASE("Vault: store then retrieve", "[vault]") {
    TempDbFile tmp("tmp_vault.sqlite");
    DatabaseManager db(tmp.path);
    db.init();
    EncryptionManager enc(EncryptionManager::generateKey());
    CredentialVault vault(db, enc);

    REQUIRE(vault.store("u1", "alice", "P@ss1") == VaultStatus::Ok);

    SECTION("Round trip with defaults") {
        auto res = vault.retrieve("u1");
        REQUIRE(res.ok());
        REQUIRE(res.credential->username == "alice");
        REQUIRE(res.credential->password == "P@ss1");
        REQUIRE(res.credential->hint.empty());
        REQUIRE_FALSE(res.credential->biometric_enabled);
    }

    SECTION("Ciphertext at rest is not the plaintext") {
        auto row = db.getCredential("u1");
        REQUIRE(row.has_value());
        REQUIRE(row->enc_username != toBytes("alice"));
        REQUIRE(row->enc_password.size() == std::string("P@ss1").size() + 16);
        REQUIRE(row->username_iv != row->password_iv);
    }

    SECTION("Unknown user is NotFound") {
        auto res = vault.retrieve("ghost");
        REQUIRE(res.status == VaultStatus::NotFound);
        REQUIRE_FALSE(res.credential.has_value());
    }

    SECTION("Second store wins") {
        REQUIRE(vault.store("u1", "alice2", "n3w-🐙-secret", "favourite colour") == VaultStatus::Ok);
        auto res = vault.retrieve("u1");
        REQUIRE(res.ok());
        REQUIRE(res.credential->username == "alice2");
        REQUIRE(res.credential->password == "n3w-🐙-secret");
        REQUIRE(res.credential->hint == "favourite colour");
    }

    SECTION("remove deletes the user") {
        REQUIRE(vault.exists("u1"));
        REQUIRE(vault.remove("u1") == VaultStatus::Ok);
        REQUIRE_FALSE(vault.exists("u1"));
        REQUIRE(vault.retrieve("u1").status == VaultStatus::NotFound);
        REQUIRE(vault.remove("u1") == VaultStatus::NotFound);
    }
}

TEST_CASE("Vault: empty required fields are rejected", "[vault]") {
    TempDbFile tmp("tmp_vault_validation.sqlite");
    DatabaseManager db(tmp.path);
    db.init();
    EncryptionManager enc(EncryptionManager::generateKey());
    CredentialVault vault(db, enc);

    REQUIRE(vault.store("", "alice", "pw") == VaultStatus::ValidationError);
    REQUIRE(vault.store("u1", "", "pw") == VaultStatus::ValidationError);
    REQUIRE(vault.store("u1", "alice", "") == VaultStatus::ValidationError);
    REQUIRE_FALSE(vault.exists("u1"));
}

TEST_CASE("Vault: undecryptable rows surface as DecryptionError", "[vault][crypto]") {
    TempDbFile tmp("tmp_vault_tamper.sqlite");
    DatabaseManager db(tmp.path);
    db.init();
    EncryptionManager enc(EncryptionManager::generateKey());
    CredentialVault vault(db, enc);

    REQUIRE(vault.store("u1", "alice", "P@ss1", "hint") == VaultStatus::Ok);
    REQUIRE(vault.store("u2", "bob", "hunter2") == VaultStatus::Ok);

    SECTION("Flipped ciphertext byte") {
        auto row = *db.getCredential("u1");
        row.enc_password[0] ^= 0x01;
        db.upsertCredential(row);
        REQUIRE(vault.retrieve("u1").status == VaultStatus::DecryptionError);
    }

    SECTION("Ciphertext moved to another user") {
        auto alice = *db.getCredential("u1");
        alice.user_id = "u2";
        db.upsertCredential(alice);
        REQUIRE(vault.retrieve("u2").status == VaultStatus::DecryptionError);
    }

    SECTION("Username and password blobs swapped") {
        auto row = *db.getCredential("u1");
        std::swap(row.enc_username, row.enc_password);
        std::swap(row.username_iv, row.password_iv);
        db.upsertCredential(row);
        REQUIRE(vault.retrieve("u1").status == VaultStatus::DecryptionError);
    }

    SECTION("Truncated IV") {
        auto row = *db.getCredential("u1");
        row.username_iv.resize(4);
        db.upsertCredential(row);
        REQUIRE(vault.retrieve("u1").status == VaultStatus::DecryptionError);
    }

    SECTION("Another key") {
        EncryptionManager other(EncryptionManager::generateKey());
        CredentialVault otherVault(db, other);
        auto res = otherVault.retrieve("u1");
        REQUIRE(res.status == VaultStatus::DecryptionError);
        REQUIRE_FALSE(res.credential.has_value());
    }
}
