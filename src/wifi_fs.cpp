#include "wifi_fs.hpp"
#include "wifi_errors.hpp"
#include "wifi_logger.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace wifiprov {
namespace fs_util {

namespace {

std::string errnoMessage(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

void writeAll(int fd, const std::string& contents, const std::string& path) {
    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw ConfigWriteError(errnoMessage("Failed to write", path));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

} // namespace

void writeFileAtomically(const std::string& path, const std::string& contents) {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ConfigWriteError("Failed to create directory " +
                                   target.parent_path().string() + ": " + ec.message());
        }
    }

    std::string tempPath = path + ".tmp." + std::to_string(::getpid());
    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw ConfigWriteError(errnoMessage("Failed to create", tempPath));
    }

    try {
        writeAll(fd, contents, tempPath);
        if (::fsync(fd) != 0) {
            throw ConfigWriteError(errnoMessage("Failed to flush", tempPath));
        }
    } catch (const ConfigWriteError&) {
        ::close(fd);
        ::unlink(tempPath.c_str());
        throw;
    }

    if (::close(fd) != 0) {
        ::unlink(tempPath.c_str());
        throw ConfigWriteError(errnoMessage("Failed to close", tempPath));
    }

    if (::rename(tempPath.c_str(), path.c_str()) != 0) {
        std::string message = errnoMessage("Failed to move into place", path);
        ::unlink(tempPath.c_str());
        throw ConfigWriteError(message);
    }

    Logger::getInstance().debug("Wrote ", path, " (", contents.size(), " bytes)");
}

void replaceFileWithBackup(const std::string& path, const std::string& contents) {
    std::string backupPath = path + ".bak";
    bool haveBackup = false;

    std::error_code ec;
    if (fs::exists(path, ec)) {
        fs::copy_file(path, backupPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw ConfigWriteError("Failed to back up " + path + ": " + ec.message());
        }
        haveBackup = true;
    }

    try {
        writeFileAtomically(path, contents);
    } catch (const ConfigWriteError&) {
        if (haveBackup) {
            if (::rename(backupPath.c_str(), path.c_str()) == 0) {
                Logger::getInstance().warning("Restored ", path, " from backup after failed write");
            } else {
                Logger::getInstance().error(errnoMessage("Failed to restore backup of", path));
            }
        }
        throw;
    }

    if (haveBackup) {
        fs::remove(backupPath, ec);
    }
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace fs_util
} // namespace wifiprov
