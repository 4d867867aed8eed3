// src/main.cpp
#include "BiometricMatcher.hpp"
#include "CredentialVault.hpp"
#include "DatabaseManager.hpp"
#include "EncryptionManager.hpp"
#include "FaceEncoder.hpp"
#include "KeyManager.hpp"
#include "ResetTokenManager.hpp"
#include "VaultConfig.hpp"
#include "console_io.hpp"
#include "logging.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

// ----- Small helpers -----

static void scrub(std::string& s) {
    std::fill(s.begin(), s.end(), '\0');
}

static void ensure_parent_dir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
}

static std::optional<ImageData> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return ImageData(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void warn_status(const char* what, const std::string& userId, VaultStatus st) {
    switch (st) {
        case VaultStatus::ValidationError:
            std::cout << what << ": user id, username and password are required.\n"; break;
        case VaultStatus::NotFound:
            std::cout << what << ": no record for '" << userId << "'.\n"; break;
        case VaultStatus::DecryptionError:
            std::cout << what << ": stored data for '" << userId
                      << "' could not be decrypted (wrong key or tampered).\n"; break;
        case VaultStatus::NoFaceDetected:
            std::cout << what << ": no face detected.\n"; break;
        case VaultStatus::ExtractionError:
            std::cout << what << ": face encoding could not be read.\n"; break;
        case VaultStatus::NoMatch:
            std::cout << what << ": no matching face.\n"; break;
        case VaultStatus::Ok:
            break;
    }
}

// ----- Menu actions -----

static void action_store(CredentialVault& vault) {
    std::string userId   = prompt_line("User id: ");
    std::string username = prompt_line("Username: ");
    std::string password = prompt_hidden("Password: ");
    std::string hint     = prompt_line("Hint (optional): ");

    VaultStatus st = vault.store(userId, username, password, hint);
    scrub(password);
    if (st == VaultStatus::Ok) std::cout << "Credentials stored for '" << userId << "'.\n";
    else warn_status("Store failed", userId, st);
}

static void action_retrieve(const CredentialVault& vault) {
    std::string userId = prompt_line("User id: ");
    auto res = vault.retrieve(userId);
    if (!res.ok()) { warn_status("Retrieve failed", userId, res.status); return; }

    std::cout << "-----\n";
    std::cout << "Username : " << res.credential->username << "\n";
    std::cout << "Password : " << res.credential->password << "\n";
    std::cout << "Hint     : " << res.credential->hint     << "\n";
    std::cout << "Biometric: " << (res.credential->biometric_enabled ? "enabled" : "disabled") << "\n";
    std::cout << "-----\n";
    scrub(res.credential->password);
}

static void action_issue_token(ResetTokenManager& tokens) {
    std::string userId = prompt_line("User id: ");
    auto res = tokens.issue(userId);
    if (!res.ok()) { warn_status("Reset failed", userId, res.status); return; }

    std::cout << "Token  : " << res.reset->token << "\n";
    std::cout << "Expires: " << to_utc_iso8601(res.reset->expiry) << "\n";
    std::cout << "Use it to reset the password.\n";
}

static void action_verify_token(const ResetTokenManager& tokens) {
    std::string userId = prompt_line("User id: ");
    std::string token  = prompt_hidden("Token: ");
    bool ok = tokens.verify(userId, token);
    scrub(token);
    std::cout << (ok ? "Token is valid.\n" : "Token is invalid or expired.\n");
}

static void action_reset_password(CredentialVault& vault, ResetTokenManager& tokens) {
    std::string userId = prompt_line("User id: ");

    // decrypt first: a record we cannot read must not consume the token
    auto current = vault.retrieve(userId);
    if (!current.ok()) { warn_status("Reset failed", userId, current.status); return; }

    std::string token = prompt_hidden("Token: ");
    std::string new1  = prompt_hidden("New password: ");
    std::string new2  = prompt_hidden("Confirm new password: ");

    if (new1.empty() || new1 != new2) {
        std::cout << "Passwords empty or mismatched. Aborted.\n";
    } else if (!tokens.redeem(userId, token)) {
        std::cout << "Token is invalid or expired.\n";
    } else {
        VaultStatus st = vault.store(userId, current.credential->username, new1,
                                     current.credential->hint);
        if (st == VaultStatus::Ok) std::cout << "Password reset.\n";
        else warn_status("Reset failed", userId, st);
    }

    scrub(token);
    scrub(new1);
    scrub(new2);
    scrub(current.credential->password);
}

static void action_enroll(BiometricMatcher& matcher) {
    std::string userId = prompt_line("User id: ");
    std::string path   = prompt_line("Encoding file: ");
    auto image = read_file(path);
    if (!image) { std::cout << "Cannot read '" << path << "'.\n"; return; }

    VaultStatus st = matcher.enroll(userId, *image);
    if (st == VaultStatus::Ok) std::cout << "Face enrolled for '" << userId << "'.\n";
    else warn_status("Enroll failed", userId, st);
}

static void action_authenticate(const BiometricMatcher& matcher) {
    std::string path = prompt_line("Encoding file: ");
    auto image = read_file(path);
    if (!image) { std::cout << "Cannot read '" << path << "'.\n"; return; }

    auto res = matcher.authenticate(*image);
    if (res.ok()) std::cout << "Authenticated as '" << *res.userId << "'.\n";
    else warn_status("Authentication failed", "", res.status);
}

static void action_unenroll(BiometricMatcher& matcher) {
    std::string userId = prompt_line("User id: ");
    VaultStatus st = matcher.unenroll(userId);
    if (st == VaultStatus::Ok) std::cout << "Face profile removed.\n";
    else warn_status("Unenroll failed", userId, st);
}

static void action_remove(CredentialVault& vault) {
    std::string userId = prompt_line("User id to delete: ");
    if (prompt_line("Type 'YES' to confirm deletion: ") != "YES") {
        std::cout << "Aborted.\n";
        return;
    }
    VaultStatus st = vault.remove(userId);
    if (st == VaultStatus::Ok) std::cout << "Deleted '" << userId << "'.\n";
    else warn_status("Delete failed", userId, st);
}

// First run sets the passphrase; later runs must present it.
static std::optional<EncryptionManager> unlock_vault(KeyManager& keys) {
    if (!keys.isInitialized()) {
        std::cout << "No vault passphrase found (first run).\n";
        std::string pw1 = prompt_hidden("Enter new vault passphrase: ");
        std::string pw2 = prompt_hidden("Confirm vault passphrase: ");
        if (pw1.empty() || pw1 != pw2) {
            scrub(pw1);
            scrub(pw2);
            std::cerr << "Invalid passphrase.\n";
            return std::nullopt;
        }
        auto enc = keys.initialize(pw1);
        scrub(pw1);
        scrub(pw2);
        return enc;
    }

    std::string pw = prompt_hidden("Enter vault passphrase: ");
    auto enc = keys.unlock(pw);
    scrub(pw);
    if (!enc) std::cerr << "Unlock failed.\n";
    return enc;
}

// ----- Main -----

int main(int argc, char** argv) {
    VaultConfig cfg;
    try {
        cfg = loadConfig(std::vector<std::string>(argv + 1, argv + argc),
                         [](const char* name) { return std::getenv(name); });
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n" << configUsage(argv[0]);
        return 1;
    }
    if (cfg.showHelp) {
        std::cout << configUsage(argv[0]);
        return 0;
    }

    try {
        ensure_parent_dir(cfg.logPath);
        ensure_parent_dir(cfg.dbPath);
        Log::init(cfg.logPath, cfg.logLevel);
        spdlog::info("SecureLedger starting (db='{}')", cfg.dbPath);

        DatabaseManager db(cfg.dbPath);
        db.init();

        KeyManager keys(db);
        auto enc = unlock_vault(keys);
        if (!enc) return 2;

        CredentialVault vault(db, *enc);
        ResetTokenManager tokens(db);
        PrecomputedEncoder encoder;
        BiometricMatcher matcher(db, encoder, cfg.matchThreshold, cfg.encodingDim);

        for (;;) {
            std::cout << "\n=== SecureLedger ===\n"
                         "1) Store credentials\n"
                         "2) Retrieve credentials\n"
                         "3) Forgot password (issue reset token)\n"
                         "4) Verify reset token\n"
                         "5) Reset password with token\n"
                         "6) Enroll face\n"
                         "7) Log in with face\n"
                         "8) Remove face profile\n"
                         "9) Delete user\n"
                         "q) Quit\n";
            std::string choice = prompt_line("> ");
            if (!std::cin) break;

            try {
                if (choice == "1") action_store(vault);
                else if (choice == "2") action_retrieve(vault);
                else if (choice == "3") action_issue_token(tokens);
                else if (choice == "4") action_verify_token(tokens);
                else if (choice == "5") action_reset_password(vault, tokens);
                else if (choice == "6") action_enroll(matcher);
                else if (choice == "7") action_authenticate(matcher);
                else if (choice == "8") action_unenroll(matcher);
                else if (choice == "9") action_remove(vault);
                else if (choice == "q" || choice == "Q") break;
                else std::cout << "Unknown option.\n";
            } catch (const StorageError& ex) {
                spdlog::error("Storage failure: {}", ex.what());
                std::cout << "Storage error: " << ex.what() << "\n";
            }
        }

        spdlog::info("SecureLedger exiting");
        return 0;
    } catch (const std::exception& ex) {
        spdlog::critical("Fatal: {}", ex.what());
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
