#include "BiometricMatcher.hpp"
#include "DatabaseManager.hpp"
#include "logging.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>

BiometricMatcher::BiometricMatcher(DatabaseManager& db,
                                   const FaceEncoder& encoder,
                                   double threshold,
                                   std::size_t dimension,
                                   std::shared_ptr<spdlog::logger> logger)
    : m_db(db),
      m_encoder(encoder),
      m_threshold(threshold),
      m_dimension(dimension),
      m_log(Log::orDefault(std::move(logger)))
{
    if (!(threshold > 0.0) || !std::isfinite(threshold)) {
        throw std::invalid_argument("BiometricMatcher: threshold must be a positive number");
    }
    if (dimension == 0) {
        throw std::invalid_argument("BiometricMatcher: dimension must be positive");
    }
}

double BiometricMatcher::euclideanDistance(const FaceEncoding& a, const FaceEncoding& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("euclideanDistance: dimension mismatch");
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const double d = a[i] - b[i];
        sum += d * d;
    }
    return std::sqrt(sum);
}

std::vector<std::uint8_t> BiometricMatcher::pack(const FaceEncoding& enc) {
    std::vector<std::uint8_t> blob(enc.size() * sizeof(double));
    std::memcpy(blob.data(), enc.data(), blob.size());
    return blob;
}

std::optional<FaceEncoding> BiometricMatcher::unpack(const std::vector<std::uint8_t>& blob) {
    if (blob.empty() || blob.size() % sizeof(double) != 0) return std::nullopt;
    FaceEncoding enc(blob.size() / sizeof(double));
    std::memcpy(enc.data(), blob.data(), blob.size());
    return enc;
}

VaultStatus BiometricMatcher::extractOne(const ImageData& image,
                                         const std::string& context,
                                         FaceEncoding& out) const {
    std::vector<FaceEncoding> faces;
    try {
        faces = m_encoder.encode(image);
    } catch (const std::exception& ex) {
        m_log->error("Face extraction failed ({}): {}", context, ex.what());
        return VaultStatus::ExtractionError;
    }

    if (faces.empty()) {
        m_log->error("No face detected in image ({})", context);
        return VaultStatus::NoFaceDetected;
    }
    if (faces.size() > 1) {
        m_log->warn("{} faces detected ({}); using the first", faces.size(), context);
    }

    FaceEncoding& first = faces.front();
    if (first.size() != m_dimension) {
        m_log->error("Encoding has dimension {} ({}), expected {}", first.size(), context, m_dimension);
        return VaultStatus::ExtractionError;
    }
    out = std::move(first);
    return VaultStatus::Ok;
}

VaultStatus BiometricMatcher::enroll(const std::string& userId, const ImageData& image) {
    if (userId.empty()) {
        m_log->warn("enroll rejected: empty user id");
        return VaultStatus::ValidationError;
    }

    FaceEncoding enc;
    VaultStatus st = extractOne(image, "enroll " + userId, enc);
    if (st != VaultStatus::Ok) return st;

    BiometricRecord rec;
    rec.user_id     = userId;
    rec.encoding    = pack(enc);
    rec.enrolled_at = now_utc_iso8601();
    m_db.upsertBiometric(rec);

    m_log->info("Biometric data enrolled for user {}", userId);
    return VaultStatus::Ok;
}

AuthResult BiometricMatcher::authenticate(const ImageData& image) const {
    AuthResult out;

    FaceEncoding probe;
    VaultStatus st = extractOne(image, "authenticate", probe);
    if (st != VaultStatus::Ok) {
        out.status = st;
        return out;
    }

    double best = std::numeric_limits<double>::infinity();
    for (const auto& row : m_db.getAllBiometrics()) {
        auto stored = unpack(row.encoding);
        if (!stored || stored->size() != m_dimension) {
            m_log->warn("Skipping malformed biometric profile for user {}", row.user_id);
            continue;
        }
        double d = euclideanDistance(probe, *stored);
        // strict '<' keeps the earliest user_id on ties
        if (d < m_threshold && d < best) {
            best = d;
            out.userId = row.user_id;
        }
    }

    if (!out.userId) {
        m_log->info("No match found for input image");
        out.status = VaultStatus::NoMatch;
        return out;
    }

    m_log->info("User authenticated: {}", *out.userId);
    out.status   = VaultStatus::Ok;
    out.distance = best;
    return out;
}

VaultStatus BiometricMatcher::unenroll(const std::string& userId) {
    if (!m_db.deleteBiometric(userId)) {
        m_log->info("unenroll: no biometric profile for user {}", userId);
        return VaultStatus::NotFound;
    }
    m_log->info("Biometric data removed for user {}", userId);
    return VaultStatus::Ok;
}
