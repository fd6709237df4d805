#pragma once
#include "http.hpp"
#include <string>
#include <vector>

namespace netstash {

class Interceptor;

// Shared command handlers used by both one-shot mode and the REPL
// (main.cpp). Each returns text for the caller to print.

std::string format_response(const HttpResponse& response);

std::string cmd_get(Interceptor& interceptor, const std::string& url);
std::string cmd_post(Interceptor& interceptor, const std::string& url,
                     const std::string& body);
std::string cmd_status(Interceptor& interceptor);

// Empty name clears every storage.
std::string cmd_clear(Interceptor& interceptor, const std::string& name);
std::string cmd_invalidate(Interceptor& interceptor, const std::string& url);
std::string cmd_warm(Interceptor& interceptor, const std::vector<std::string>& urls);
std::string cmd_preload(Interceptor& interceptor);

// Precache the current generation, then activate it.
std::string cmd_activate(Interceptor& interceptor);
std::string cmd_replay(Interceptor& interceptor);

} // namespace netstash
