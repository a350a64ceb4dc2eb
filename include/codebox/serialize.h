#ifndef INCLUDE_CODEBOX_SERIALIZE_H_
#define INCLUDE_CODEBOX_SERIALIZE_H_

#include <string>

#include "execution.h"

// {"sandbox", "command", "version", "files": {name: content}}; files keep their JSON order.
// On failure, returns ARGUMENT error
ExecError ParseRequest(const std::string& body, Request& req);

// {"id", "ok", "duration", "stdout", "stderr", "error": {"kind", "message"}}
std::string DumpExecution(const Execution&);

#endif  // INCLUDE_CODEBOX_SERIALIZE_H_
