#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace playdeck {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Playback
    {ErrorCode::PLAYBACK_NOT_FOUND, "PLAYBACK_NOT_FOUND"},
    {ErrorCode::PLAYBACK_UNSUPPORTED_FORMAT, "PLAYBACK_UNSUPPORTED_FORMAT"},
    {ErrorCode::PLAYBACK_BACKEND_ERROR, "PLAYBACK_BACKEND_ERROR"},
    {ErrorCode::PLAYBACK_INVALID_STATE, "PLAYBACK_INVALID_STATE"},

    // Catalog
    {ErrorCode::CATALOG_NOT_FOUND, "CATALOG_NOT_FOUND"},
    {ErrorCode::CATALOG_ALREADY_EXISTS, "CATALOG_ALREADY_EXISTS"},
    {ErrorCode::CATALOG_DESCRIPTOR_CORRUPT, "CATALOG_DESCRIPTOR_CORRUPT"},
    {ErrorCode::CATALOG_PERSISTENCE_ERROR, "CATALOG_PERSISTENCE_ERROR"},
    {ErrorCode::CATALOG_EMPTY_COLLECTION, "CATALOG_EMPTY_COLLECTION"},
    {ErrorCode::CATALOG_UNSUPPORTED_EXPORT_FORMAT, "CATALOG_UNSUPPORTED_EXPORT_FORMAT"},
    {ErrorCode::CATALOG_INVALID_NAME, "CATALOG_INVALID_NAME"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_INVALID_ARGUMENT, "VALIDATION_INVALID_ARGUMENT"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isPlaybackError(code)) {
        return "playback";
    }
    if (isCatalogError(code)) {
        return "catalog";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

}  // namespace playdeck
