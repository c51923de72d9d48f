#pragma once

#include <optional>
#include <string>
#include <vector>

namespace playdeck::catalog {

enum class ExportFormat { M3u, Pls };

struct ExportEntry {
    std::string absolutePath;
    std::string title;
};

// "m3u" / "pls" (case-insensitive)
std::optional<ExportFormat> parseExportFormat(const std::string& name);

// File extension without dot
const char* exportFormatExtension(ExportFormat format);

std::string renderM3u(const std::vector<ExportEntry>& entries);
std::string renderPls(const std::vector<ExportEntry>& entries);
std::string renderPlaylist(ExportFormat format, const std::vector<ExportEntry>& entries);

}  // namespace playdeck::catalog
