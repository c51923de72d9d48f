#include "catalog/playlist_export.h"

#include "catalog/media_formats.h"

#include <sstream>

namespace playdeck::catalog {

std::optional<ExportFormat> parseExportFormat(const std::string& name) {
    std::string lower = toLowerAscii(name);
    if (lower == "m3u") {
        return ExportFormat::M3u;
    }
    if (lower == "pls") {
        return ExportFormat::Pls;
    }
    return std::nullopt;
}

const char* exportFormatExtension(ExportFormat format) {
    switch (format) {
    case ExportFormat::Pls:
        return "pls";
    case ExportFormat::M3u:
    default:
        return "m3u";
    }
}

std::string renderM3u(const std::vector<ExportEntry>& entries) {
    std::ostringstream out;
    out << "#EXTM3U\n";
    for (const auto& e : entries) {
        out << "#EXTINF:-1," << e.title << '\n';
        out << e.absolutePath << '\n';
    }
    return out.str();
}

std::string renderPls(const std::vector<ExportEntry>& entries) {
    std::ostringstream out;
    out << "[playlist]\n";
    size_t index = 1;
    for (const auto& e : entries) {
        out << "File" << index << '=' << e.absolutePath << '\n';
        out << "Title" << index << '=' << e.title << '\n';
        out << "Length" << index << "=-1\n";
        ++index;
    }
    out << "NumberOfEntries=" << entries.size() << '\n';
    out << "Version=2\n";
    return out.str();
}

std::string renderPlaylist(ExportFormat format, const std::vector<ExportEntry>& entries) {
    return format == ExportFormat::Pls ? renderPls(entries) : renderM3u(entries);
}

}  // namespace playdeck::catalog
