#include <catch2/catch_all.hpp>

#include "BiometricMatcher.hpp"
#include "CredentialVault.hpp"
#include "DatabaseManager.hpp"
#include "EncryptionManager.hpp"
#include "test_support.hpp"

#include <cmath>
#include <map>
#include <stdexcept>

namespace {
    // Stand-in detector: the "image" bytes name a canned result.
    class ScriptedEncoder : public FaceEncoder {
    public:
        std::map<std::string, std::vector<FaceEncoding>> faces;

        std::vector<FaceEncoding> encode(const ImageData& image) const override {
            std::string key(image.begin(), image.end());
            if (key == "corrupt") throw std::runtime_error("cannot decode image");
            auto it = faces.find(key);
            return it == faces.end() ? std::vector<FaceEncoding>{} : it->second;
        }
    };

    // 4-dimensional encodings keep the fixtures readable
    constexpr std::size_t DIM = 4;

    FaceEncoding face(double a, double b, double c, double d) {
        return FaceEncoding{ a, b, c, d };
    }
}

TEST_CASE("Biometrics: enroll and authenticate", "[bio]") {
    TempDbFile tmp("tmp_bio.sqlite");
    DatabaseManager db(tmp.path);
    db.init();

    ScriptedEncoder encoder;
    encoder.faces["alice.jpg"] = { face(0.10, 0.20, 0.30, 0.40) };
    encoder.faces["bob.jpg"]   = { face(0.90, 0.80, 0.70, 0.60) };
    encoder.faces["alice-again.jpg"] = { face(0.12, 0.21, 0.29, 0.41) };
    encoder.faces["stranger.jpg"]    = { face(5.0, -5.0, 5.0, -5.0) };
    encoder.faces["group.jpg"]       = { face(0.90, 0.80, 0.70, 0.60), face(0.10, 0.20, 0.30, 0.40) };
    encoder.faces["wrong-dim.jpg"]   = { FaceEncoding{ 0.1, 0.2 } };

    BiometricMatcher matcher(db, encoder, 0.6, DIM);

    SECTION("No face: NoFaceDetected and nothing stored") {
        REQUIRE(matcher.enroll("u1", toBytes("")) == VaultStatus::NoFaceDetected);
        REQUIRE(db.getAllBiometrics().empty());
        REQUIRE(matcher.authenticate(toBytes("")).status == VaultStatus::NoFaceDetected);
    }

    SECTION("Extractor failure is ExtractionError, not NoFaceDetected") {
        REQUIRE(matcher.enroll("u1", toBytes("corrupt")) == VaultStatus::ExtractionError);
        REQUIRE(matcher.authenticate(toBytes("corrupt")).status == VaultStatus::ExtractionError);
        REQUIRE(matcher.enroll("u1", toBytes("wrong-dim.jpg")) == VaultStatus::ExtractionError);
        REQUIRE(db.getAllBiometrics().empty());
    }

    SECTION("Empty user id is rejected") {
        REQUIRE(matcher.enroll("", toBytes("alice.jpg")) == VaultStatus::ValidationError);
    }

    SECTION("Nearest profile under the threshold wins") {
        REQUIRE(matcher.enroll("alice", toBytes("alice.jpg")) == VaultStatus::Ok);
        REQUIRE(matcher.enroll("bob", toBytes("bob.jpg")) == VaultStatus::Ok);

        auto res = matcher.authenticate(toBytes("alice-again.jpg"));
        REQUIRE(res.ok());
        REQUIRE(*res.userId == "alice");
        REQUIRE(res.distance < 0.6);
        REQUIRE(res.distance == Catch::Approx(std::sqrt(0.0004 + 0.0001 + 0.0001 + 0.0001)));

        REQUIRE(*matcher.authenticate(toBytes("bob.jpg")).userId == "bob");
    }

    SECTION("Far from every profile: NoMatch") {
        REQUIRE(matcher.enroll("alice", toBytes("alice.jpg")) == VaultStatus::Ok);
        auto res = matcher.authenticate(toBytes("stranger.jpg"));
        REQUIRE(res.status == VaultStatus::NoMatch);
        REQUIRE_FALSE(res.userId.has_value());
    }

    SECTION("No profiles at all: NoMatch") {
        REQUIRE(matcher.authenticate(toBytes("alice.jpg")).status == VaultStatus::NoMatch);
    }

    SECTION("Several faces: first in detector order is enrolled") {
        REQUIRE(matcher.enroll("u1", toBytes("group.jpg")) == VaultStatus::Ok);
        REQUIRE(*matcher.authenticate(toBytes("bob.jpg")).userId == "u1");
        REQUIRE(matcher.authenticate(toBytes("alice.jpg")).status == VaultStatus::NoMatch);
    }

    SECTION("Re-enrollment overwrites the profile") {
        REQUIRE(matcher.enroll("u1", toBytes("alice.jpg")) == VaultStatus::Ok);
        REQUIRE(matcher.enroll("u1", toBytes("bob.jpg")) == VaultStatus::Ok);
        REQUIRE(db.getAllBiometrics().size() == 1);
        REQUIRE(matcher.authenticate(toBytes("alice.jpg")).status == VaultStatus::NoMatch);
    }

    SECTION("Ties go to the lowest user id") {
        REQUIRE(matcher.enroll("zed", toBytes("alice.jpg")) == VaultStatus::Ok);
        REQUIRE(matcher.enroll("amy", toBytes("alice.jpg")) == VaultStatus::Ok);
        REQUIRE(*matcher.authenticate(toBytes("alice.jpg")).userId == "amy");
    }

    SECTION("Malformed stored profiles are skipped") {
        db.upsertBiometric(BiometricRecord{ "broken", std::vector<std::uint8_t>(5, 0x00), "" });
        db.upsertBiometric(BiometricRecord{ "short", std::vector<std::uint8_t>(2 * sizeof(double), 0x00), "" });
        REQUIRE(matcher.enroll("alice", toBytes("alice.jpg")) == VaultStatus::Ok);
        REQUIRE(*matcher.authenticate(toBytes("alice.jpg")).userId == "alice");
    }

    SECTION("unenroll") {
        REQUIRE(matcher.enroll("alice", toBytes("alice.jpg")) == VaultStatus::Ok);
        REQUIRE(matcher.unenroll("alice") == VaultStatus::Ok);
        REQUIRE(matcher.unenroll("alice") == VaultStatus::NotFound);
        REQUIRE(matcher.authenticate(toBytes("alice.jpg")).status == VaultStatus::NoMatch);
    }
}

TEST_CASE("Biometrics: enrollment flags the credential", "[bio][vault]") {
    TempDbFile tmp("tmp_bio_flag.sqlite");
    DatabaseManager db(tmp.path);
    db.init();
    EncryptionManager enc(EncryptionManager::generateKey());
    CredentialVault vault(db, enc);

    ScriptedEncoder encoder;
    encoder.faces["me.jpg"] = { face(0.1, 0.1, 0.1, 0.1) };
    BiometricMatcher matcher(db, encoder, 0.6, DIM);

    REQUIRE(vault.store("u1", "alice", "P@ss1") == VaultStatus::Ok);
    REQUIRE_FALSE(vault.retrieve("u1").credential->biometric_enabled);

    REQUIRE(matcher.enroll("u1", toBytes("me.jpg")) == VaultStatus::Ok);
    REQUIRE(vault.retrieve("u1").credential->biometric_enabled);

    REQUIRE(matcher.unenroll("u1") == VaultStatus::Ok);
    REQUIRE_FALSE(vault.retrieve("u1").credential->biometric_enabled);
}

TEST_CASE("Biometrics: matcher parameters are validated", "[bio]") {
    TempDbFile tmp("tmp_bio_params.sqlite");
    DatabaseManager db(tmp.path);
    ScriptedEncoder encoder;

    REQUIRE_THROWS_AS(BiometricMatcher(db, encoder, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(BiometricMatcher(db, encoder, -1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(BiometricMatcher(db, encoder, 0.6, 0), std::invalid_argument);

    BiometricMatcher m(db, encoder, 0.5);
    REQUIRE(m.dimension() == BiometricMatcher::DEFAULT_DIMENSION);
    REQUIRE(m.threshold() == 0.5);
}

TEST_CASE("Biometrics: Euclidean distance", "[bio]") {
    REQUIRE(BiometricMatcher::euclideanDistance(face(0, 0, 0, 0), face(3, 4, 0, 0)) == Catch::Approx(5.0));
    REQUIRE(BiometricMatcher::euclideanDistance(face(1, 2, 3, 4), face(1, 2, 3, 4)) == 0.0);
    REQUIRE_THROWS_AS(BiometricMatcher::euclideanDistance(face(1, 2, 3, 4), FaceEncoding{ 1.0 }),
                      std::invalid_argument);
}

TEST_CASE("PrecomputedEncoder: one encoding per line", "[bio]") {
    PrecomputedEncoder encoder;

    auto faces = encoder.encode(toBytes("0.1 0.2 -0.3\n\n  1e-2\t4 5 \n"));
    REQUIRE(faces.size() == 2);
    REQUIRE(faces[0] == FaceEncoding{ 0.1, 0.2, -0.3 });
    REQUIRE(faces[1] == FaceEncoding{ 0.01, 4.0, 5.0 });

    REQUIRE(encoder.encode(toBytes("")).empty());
    REQUIRE(encoder.encode(toBytes("\n   \n")).empty());
    REQUIRE_THROWS_AS(encoder.encode(toBytes("0.1 abc 0.3")), std::runtime_error);
    REQUIRE_THROWS_AS(encoder.encode(toBytes("0.1 nan")), std::runtime_error);
    REQUIRE_THROWS_AS(encoder.encode(toBytes("0.1x")), std::runtime_error);
}
