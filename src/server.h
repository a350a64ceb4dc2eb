#ifndef SERVER_H_
#define SERVER_H_

#include <string>
#include <codebox/config.h>
#include <codebox/engine.h>

extern std::string kListenHost;
extern int kListenPort;

// Serve POST /v1/exec until the server is stopped; return false if it cannot listen
bool ServeHTTP(const Config& cfg, const EngineOptions& opt);

// Run one JSON request and return the JSON result; status is set like the HTTP status
std::string HandleExec(const Config& cfg, const EngineOptions& opt, const std::string& body, int& status);

#endif  // SERVER_H_
