#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <string>

namespace sps::util {

// Replace `path` by writing a sibling temp file, syncing it, and renaming it
// into place. The writer must emit the full contents and return true.
bool AtomicWriteFile(const std::filesystem::path& path,
                     const std::function<bool(std::ofstream&)>& writer,
                     std::string* error = nullptr);

bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error = nullptr);

// fsync a file or directory by path. No-op on platforms without fsync.
bool SyncPath(const std::filesystem::path& path, std::string* error = nullptr);

}  // namespace sps::util
