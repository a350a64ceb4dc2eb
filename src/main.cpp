#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codebox/paths.h>
#include <codebox/logger.h>
#include <codebox/config.h>
#include <codebox/engine.h>
#include "server.h"

namespace {

std::string request_file;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string config_dir = ini[""]["config_dir"] | "";
  std::string box_root = ini[""]["box_root"] | "";
  if (config_dir.size()) kConfigDir = config_dir;
  if (box_root.size()) kBoxRoot = box_root;
  kRuntime = ini[""]["runtime"] | kRuntime;
  kKillTimeoutMs = ini[""]["kill_timeout_ms"] | kKillTimeoutMs;
  kListenHost = ini[""]["host"] | kListenHost;
  kListenPort = ini[""]["port"] | kListenPort;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/codebox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--config-dir")
    .help("Directory of config.json, boxes.json and commands/");
  parser.add_argument("--box-root")
    .help("Directory for the temporary directories of executions");
  parser.add_argument("--runtime")
    .help("Container runtime binary (docker or a compatible one)");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("HTTP port to listen on");
  parser.add_argument("-r", "--request")
    .default_value(std::string(""))
    .help("Execute one JSON request from this file (\"-\" for stdin) and print the result");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    if (parser.is_used("--config")) {
      spdlog::error("Failed to parse configuration file {}", config_file.c_str());
      exit(1);
    }
    spdlog::info("No configuration file {}; using defaults", config_file.c_str());
  }
  if (auto val = parser.present("--config-dir")) kConfigDir = val.value();
  if (auto val = parser.present("--box-root")) kBoxRoot = val.value();
  if (auto val = parser.present("--runtime")) kRuntime = val.value();
  if (auto val = parser.present<int>("--port")) kListenPort = val.value();
  request_file = parser.get<std::string>("--request");
}

bool ReadRequest(const std::string& name, std::string& body) {
  if (name == "-") {
    body.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream fin(name);
  if (!fin) return false;
  body.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  ParseArgs(argc, argv);
  Config cfg;
  if (!LoadConfig(kConfigDir, cfg)) return 1;
  EngineOptions opt;

  if (request_file.size()) {
    // the process exits right after the request; do not detach the container kill
    opt.spawn = [](std::function<void()> task) { task(); };
    std::string body;
    if (!ReadRequest(request_file, body)) {
      spdlog::error("Cannot read request {}", request_file);
      return 1;
    }
    int status = 0;
    std::cout << HandleExec(cfg, opt, body, status) << std::endl;
    return status == 200 ? 0 : 1;
  }
  return ServeHTTP(cfg, opt) ? 0 : 1;
}
