#ifndef CODEBOX_UTILS_H_
#define CODEBOX_UTILS_H_

#include <string>
#include <utility>
#include <optional>
#include <filesystem>

#include <codebox/paths.h>

constexpr fs::perms kPerm444 =
    fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);

// mkdtemp under parent (created if missing); empty on failure
std::optional<fs::path> MakeTempDir(const fs::path& parent);

// Removes the directory on destruction
class ScratchDir {
  fs::path path_;
 public:
  explicit ScratchDir(fs::path path) : path_(std::move(path)) {}
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;
  ~ScratchDir();

  const fs::path& Path() const { return path_; }
};

std::string RandomHex(size_t len);

#endif  // CODEBOX_UTILS_H_
