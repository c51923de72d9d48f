#include "core/atomic_file.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <system_error>

namespace playdeck {

namespace fs = std::filesystem;

bool writeFileAtomically(const fs::path& path, const std::string& content, std::string& error) {
    fs::path tmpPath = path;
    tmpPath += ".tmp";

    std::ofstream ofs(tmpPath, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!ofs) {
        error = "cannot open " + tmpPath.string() + " for writing";
        return false;
    }
    ofs << content;
    ofs.flush();
    bool written = static_cast<bool>(ofs);
    ofs.close();

    std::error_code ec;
    if (!written || ofs.fail()) {
        fs::remove(tmpPath, ec);
        error = "write to " + tmpPath.string() + " failed";
        return false;
    }

    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        error = "cannot rename " + tmpPath.string() + " to " + path.string() + ": " +
                std::strerror(errno);
        fs::remove(tmpPath, ec);
        return false;
    }
    return true;
}

}  // namespace playdeck
