#pragma once

#include <chrono>
#include <string>

namespace playdeck {

// Local time as "YYYY-MM-DDTHH:MM:SS.ffffff" (descriptor timestamps)
std::string formatIso8601(std::chrono::system_clock::time_point tp);

inline std::string nowIso8601() {
    return formatIso8601(std::chrono::system_clock::now());
}

}  // namespace playdeck
