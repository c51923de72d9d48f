#ifndef PLAYDECK_CORE_ERROR_CODES_H
#define PLAYDECK_CORE_ERROR_CODES_H

#include <cstdint>
#include <string>
#include <utility>

namespace playdeck {

/**
 * @brief Error codes shared by the catalog and the playback engine.
 *
 * Categories use the upper bits (0xF000 mask):
 * - 0x1xxx: Playback
 * - 0x2xxx: Catalog / descriptor persistence
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Playback (0x1000)
    PLAYBACK_NOT_FOUND = 0x1001,
    PLAYBACK_UNSUPPORTED_FORMAT = 0x1002,
    PLAYBACK_BACKEND_ERROR = 0x1003,
    PLAYBACK_INVALID_STATE = 0x1004,

    // Catalog (0x2000)
    CATALOG_NOT_FOUND = 0x2001,
    CATALOG_ALREADY_EXISTS = 0x2002,
    CATALOG_DESCRIPTOR_CORRUPT = 0x2003,
    CATALOG_PERSISTENCE_ERROR = 0x2004,
    CATALOG_EMPTY_COLLECTION = 0x2005,
    CATALOG_UNSUPPORTED_EXPORT_FORMAT = 0x2006,
    CATALOG_INVALID_NAME = 0x2007,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_ARGUMENT = 0x5002,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Outcome of a fallible operation.
 *
 * Returned instead of throwing across the public boundary of the catalog and
 * the playback engine.
 */
struct OpResult {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const {
        return code == ErrorCode::OK;
    }

    static OpResult success() {
        return OpResult{};
    }
    static OpResult failure(ErrorCode code, std::string message) {
        return OpResult{code, std::move(message)};
    }
};

/**
 * @brief Convert ErrorCode to its enumerator name.
 * @return e.g. "PLAYBACK_INVALID_STATE", or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name ("ok", "playback", "catalog", "validation", "internal").
 */
const char* getErrorCategory(ErrorCode code);

// e.g. "0x1004"
std::string errorCodeToHex(ErrorCode code);

constexpr bool isPlaybackError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isCatalogError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

}  // namespace playdeck

#endif  // PLAYDECK_CORE_ERROR_CODES_H
