#include <codebox/paths.h>

fs::path kBoxRoot = "/tmp/codebox_box";
fs::path kConfigDir = "/etc/codebox";
std::string kRuntime = "docker";
long kKillTimeoutMs = 5000;

fs::path DefaultsConfigFile(const fs::path& dir) {
  return dir / "config.json";
}
fs::path BoxesConfigFile(const fs::path& dir) {
  return dir / "boxes.json";
}
fs::path CommandsConfigDir(const fs::path& dir) {
  return dir / "commands";
}
