#pragma once

#include <filesystem>
#include <string>

namespace playdeck {

/**
 * @brief Replace @p path with @p content via "<path>.tmp" + rename.
 *
 * The temp file lives in the same directory, so the rename is atomic on POSIX
 * filesystems. On failure the temp file is removed, the original is left
 * untouched and @p error describes the failing step.
 */
bool writeFileAtomically(const std::filesystem::path& path, const std::string& content,
                         std::string& error);

}  // namespace playdeck
