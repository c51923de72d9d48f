#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace playdeck::catalog {

/**
 * @brief Set of playable file extensions (lowercase, with leading dot).
 *
 * Defaults to the formats the playback backend accepts; callers may append
 * configured extras.
 */
class MediaFormats {
   public:
    MediaFormats();
    explicit MediaFormats(const std::vector<std::string>& extraExtensions);

    // Case-insensitive match on the path's extension
    bool isSupported(const std::filesystem::path& path) const;

    const std::vector<std::string>& extensions() const {
        return extensions_;
    }

    static const std::vector<std::string>& defaultExtensions();

   private:
    void add(const std::string& ext);

    std::vector<std::string> extensions_;
};

/**
 * @brief Recursively list supported media files below a collection directory.
 *
 * Returns paths relative to @p dir (generic '/' separators) ordered by
 * lowercase filename, ties broken by lowercase relative path. Unreadable
 * subdirectories are skipped.
 */
std::vector<std::string> scanMediaFiles(const std::filesystem::path& dir,
                                        const MediaFormats& formats);

std::string toLowerAscii(std::string value);

// Filename without directory and extension ("disc1/Intro.mp3" -> "Intro")
std::string fileStem(const std::string& relativePath);

}  // namespace playdeck::catalog
