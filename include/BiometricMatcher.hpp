#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/fwd.h>

#include "FaceEncoder.hpp"
#include "VaultStatus.hpp"

class DatabaseManager;

struct AuthResult {
    VaultStatus status = VaultStatus::NoMatch;
    std::optional<std::string> userId;   // set iff status == Ok
    double distance = 0.0;               // distance of the accepted match

    bool ok() const { return status == VaultStatus::Ok; }
};

// Enrolls and matches face encodings.
//
// Exactly one encoding is taken from each image. When the encoder reports
// several faces, the first in detector order is used. Matching compares the
// probe against every stored vector by Euclidean distance and accepts the
// nearest one strictly below the threshold; ties go to the lowest user_id.
class BiometricMatcher {
public:
    static constexpr std::size_t DEFAULT_DIMENSION = 128;

    // Throws std::invalid_argument for a non-positive threshold or zero dimension.
    BiometricMatcher(DatabaseManager& db,
                     const FaceEncoder& encoder,
                     double threshold,
                     std::size_t dimension = DEFAULT_DIMENSION,
                     std::shared_ptr<spdlog::logger> logger = nullptr);

    // ValidationError, NoFaceDetected, ExtractionError or Ok.
    VaultStatus enroll(const std::string& userId, const ImageData& image);

    // NoFaceDetected, ExtractionError, NoMatch or Ok with the user id.
    AuthResult authenticate(const ImageData& image) const;

    // NotFound if the user had no profile.
    VaultStatus unenroll(const std::string& userId);

    double threshold() const { return m_threshold; }
    std::size_t dimension() const { return m_dimension; }

    static double euclideanDistance(const FaceEncoding& a, const FaceEncoding& b);

private:
    DatabaseManager& m_db;
    const FaceEncoder& m_encoder;
    double m_threshold;
    std::size_t m_dimension;
    std::shared_ptr<spdlog::logger> m_log;

    VaultStatus extractOne(const ImageData& image, const std::string& context,
                           FaceEncoding& out) const;

    static std::vector<std::uint8_t> pack(const FaceEncoding& enc);
    static std::optional<FaceEncoding> unpack(const std::vector<std::uint8_t>& blob);
};
