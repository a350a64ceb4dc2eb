#ifndef CODEBOX_FILEIO_H_
#define CODEBOX_FILEIO_H_

#include <string>
#include <optional>

#include <codebox/execution.h>
#include "utils.h"

// "data:[<mime>];base64,<payload>" is decoded; anything else is returned as-is.
// Empty on malformed base64.
std::optional<std::string> DecodeContent(const std::string& content);

// Relative, without "..", not empty
bool IsSafeFileName(const std::string& name);

// Creates parent directories inside the target's directory
bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms);

// Copy every match of the glob pattern into dir, keeping the base name
bool CopyFiles(const std::string& pattern, const fs::path& dir, fs::perms perms);

// Write request files into dir; the file with an empty name is written as entry
bool StageFiles(const fs::path& dir, const Files& files, const std::string& entry);

#endif  // CODEBOX_FILEIO_H_
