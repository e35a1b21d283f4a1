#include "util/atomic_file.hpp"

#include <atomic>
#include <chrono>
#include <system_error>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace sps::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return target.parent_path() /
         (target.filename().string() + ".tmp." + std::to_string(now) + "." +
          std::to_string(nonce));
}

void SetError(std::string* error, std::string message) {
  if (error && error->empty()) {
    *error = std::move(message);
  }
}

}  // namespace

bool SyncPath(const std::filesystem::path& path, std::string* error) {
#ifdef _WIN32
  (void)path;
  (void)error;
  return true;
#else
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    SetError(error, "open for fsync failed: " + path.string());
    return false;
  }
  const bool ok = ::fsync(fd) == 0;
  ::close(fd);
  if (!ok) {
    SetError(error, "fsync failed: " + path.string());
  }
  return ok;
#endif
}

bool AtomicWriteFile(const std::filesystem::path& path,
                     const std::function<bool(std::ofstream&)>& writer,
                     std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      SetError(error, "create_directories failed: " + ec.message());
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  auto discard = [&tmp_path]() {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
  };
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      SetError(error, "failed to open temp file for write");
      return false;
    }
    if (!writer(out)) {
      out.close();
      discard();
      SetError(error, "writer failed");
      return false;
    }
    out.flush();
    if (!out.good()) {
      out.close();
      discard();
      SetError(error, "flush failed");
      return false;
    }
  }
  if (!SyncPath(tmp_path, error)) {
    discard();
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    discard();
    SetError(error, "rename failed: " + ec.message());
    return false;
  }
  if (!parent.empty()) {
    return SyncPath(parent, error);
  }
  return true;
}

bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error) {
  return AtomicWriteFile(
      path,
      [&](std::ofstream& out) -> bool {
        if (!data.empty()) {
          out.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        }
        return out.good();
      },
      error);
}

}  // namespace sps::util
