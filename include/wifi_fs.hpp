#pragma once

#include <string>

namespace wifiprov {
namespace fs_util {

// Writes contents to a temporary file next to path, flushes it to disk and
// renames it over path. Missing parent directories are created.
// Throws ConfigWriteError on failure; path is never left half-written.
void writeFileAtomically(const std::string& path, const std::string& contents);

// Same as writeFileAtomically, but keeps path + ".bak" while writing and
// restores it if the write fails. The backup is removed on success.
void replaceFileWithBackup(const std::string& path, const std::string& contents);

bool fileExists(const std::string& path);

std::string readFile(const std::string& path);

} // namespace fs_util
} // namespace wifiprov
