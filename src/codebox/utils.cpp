#include "utils.h"

#include <stdlib.h>
#include <cstring>
#include <random>

#include <spdlog/spdlog.h>

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

std::optional<fs::path> MakeTempDir(const fs::path& parent) {
  if (!CreateDirs(parent)) return std::nullopt;
  std::string tmpl = (parent / "XXXXXX").string();
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating temp directory under {}: {}", parent.c_str(), strerror(errno));
    return std::nullopt;
  }
  spdlog::debug("Created temp directory {}", tmpl);
  return fs::path(tmpl);
}

ScratchDir::~ScratchDir() {
  if (path_.empty()) return;
  if (!RemoveAll(path_)) spdlog::error("Scratch directory {} is left behind", path_.c_str());
}

std::string RandomHex(size_t len) {
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  static const char kDigits[] = "0123456789abcdef";
  std::uniform_int_distribution<int> dist(0, 15);
  std::string ret(len, '0');
  for (auto& c : ret) c = kDigits[dist(gen)];
  return ret;
}
