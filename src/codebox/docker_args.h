#ifndef CODEBOX_DOCKER_ARGS_H_
#define CODEBOX_DOCKER_ARGS_H_

#include <string>
#include <vector>
#include <utility>

#include <codebox/config.h>
#include <codebox/execution.h>

using Vars = std::vector<std::pair<std::string, std::string>>;

// Arguments of the runtime binary for one step, including the expanded step command.
// dir may be empty, in which case nothing is mounted; box may be null for EXEC steps.
std::vector<std::string> DockerArgs(
    const Box* box, const Step& step, const Request& req, const std::string& dir);

std::vector<std::string> DockerRunArgs(
    const Box& box, const Step& step, const Request& req, const std::string& dir);
std::vector<std::string> DockerExecArgs(const Step& step);
std::vector<std::string> DockerKillArgs(const std::string& id);

// <image>, <image>:<step version> or <image>:<request version>
std::string ImageReference(const Box& box, const Step& step, const Request& req);

// Replace the first occurrence of each variable in every token
std::vector<std::string> ExpandVars(const std::vector<std::string>& command, const Vars& vars);

// Replace the first "%s" in fmt with dir
std::string FormatVolume(const std::string& fmt, const std::string& dir);

#endif  // CODEBOX_DOCKER_ARGS_H_
