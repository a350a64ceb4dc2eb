#include "fileio.h"

#include <glob.h>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

const char kDataPrefix[] = "data:";
const char kBase64Marker[] = ";base64,";

int Base64Value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+' || c == '-') return 62;
  if (c == '/' || c == '_') return 63;
  return -1;
}

std::optional<std::string> Base64Decode(const std::string& str, size_t start) {
  std::string ret;
  ret.reserve((str.size() - start) / 4 * 3);
  unsigned buf = 0;
  int bits = 0;
  for (size_t i = start; i < str.size(); i++) {
    char c = str[i];
    if (c == '=') break;
    if (c == '\n' || c == '\r') continue;
    int val = Base64Value(c);
    if (val < 0) return std::nullopt;
    buf = (buf << 6) | val;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      ret.push_back((char)((buf >> bits) & 0xff));
    }
  }
  return ret;
}

} // namespace

std::optional<std::string> DecodeContent(const std::string& content) {
  if (content.compare(0, sizeof(kDataPrefix) - 1, kDataPrefix) != 0) return content;
  size_t pos = content.find(kBase64Marker);
  if (pos == std::string::npos || content.find(',') < pos) return content;
  return Base64Decode(content, pos + sizeof(kBase64Marker) - 1);
}

bool IsSafeFileName(const std::string& name) {
  fs::path path(name);
  if (name.empty() || path.is_absolute()) return false;
  for (const auto& part : path) {
    if (part == "..") return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {} ({} bytes)", path.c_str(), content.size());
  if (path.has_parent_path() && !CreateDirs(path.parent_path())) return false;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool CopyFiles(const std::string& pattern, const fs::path& dir, fs::perms perms) {
  glob_t matches{};
  int ret = glob(pattern.c_str(), GLOB_NOSORT, nullptr, &matches);
  if (ret == GLOB_NOMATCH) {
    globfree(&matches);
    return true;
  }
  if (ret != 0) {
    spdlog::warn("Failed expanding pattern {}: glob returned {}", pattern, ret);
    globfree(&matches);
    return false;
  }
  bool ok = true;
  for (size_t i = 0; ok && i < matches.gl_pathc; i++) {
    fs::path from = matches.gl_pathv[i];
    fs::path to = dir / from.filename();
    std::error_code ec;
    // staged files (and copies by an earlier step) take precedence
    if (fs::exists(to, ec)) continue;
    spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
    fs::copy_file(from, to, ec);
    if (!ec) fs::permissions(to, perms, ec);
    if (ec) {
      spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
      ok = false;
    }
  }
  globfree(&matches);
  return ok;
}

bool StageFiles(const fs::path& dir, const Files& files, const std::string& entry) {
  for (const auto& [name, content] : files) {
    const std::string& real_name = name.empty() ? entry : name;
    if (!IsSafeFileName(real_name)) {
      spdlog::warn("Refusing to write file with name '{}'", real_name);
      return false;
    }
    fs::path path = dir / real_name;
    std::error_code ec;
    if (fs::exists(path, ec)) {
      // the entry point is also given by its real name
      spdlog::warn("File {} is given twice", real_name);
      return false;
    }
    auto decoded = DecodeContent(content);
    if (!decoded) {
      spdlog::warn("File {} has malformed base64 content", real_name);
      return false;
    }
    if (!WriteFile(path, *decoded, kPerm444)) return false;
  }
  return true;
}
