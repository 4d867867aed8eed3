#pragma once
#include <string>

// Outcome of a vault / token / biometric operation.
// Storage failures are not listed here: DatabaseManager throws StorageError.
enum class VaultStatus {
    Ok,
    ValidationError,   // missing / empty required input
    NotFound,          // no record for the given user_id
    DecryptionError,   // GCM tag failed (wrong key or tampered row)
    NoFaceDetected,
    ExtractionError,   // encoder threw or returned a bad vector
    NoMatch
};

inline const char* to_string(VaultStatus s) {
    switch (s) {
        case VaultStatus::Ok:              return "Ok";
        case VaultStatus::ValidationError: return "ValidationError";
        case VaultStatus::NotFound:        return "NotFound";
        case VaultStatus::DecryptionError: return "DecryptionError";
        case VaultStatus::NoFaceDetected:  return "NoFaceDetected";
        case VaultStatus::ExtractionError: return "ExtractionError";
        case VaultStatus::NoMatch:         return "NoMatch";
    }
    return "Unknown";
}
