#ifndef INCLUDE_CODEBOX_PATHS_H_
#define INCLUDE_CODEBOX_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// scratch directories are created under this directory
extern fs::path kBoxRoot;
// sandbox definitions (config.json, boxes.json, commands/)
extern fs::path kConfigDir;
extern std::string kRuntime;
extern long kKillTimeoutMs;

fs::path DefaultsConfigFile(const fs::path& dir);
fs::path BoxesConfigFile(const fs::path& dir);
fs::path CommandsConfigDir(const fs::path& dir);

#endif  // INCLUDE_CODEBOX_PATHS_H_
