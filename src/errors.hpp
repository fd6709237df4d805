#pragma once
#include <stdexcept>
#include <string>

namespace netstash {

// Invalid partition registration or configuration. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Transport-level failure talking to the network. Never surfaced raw to
// the router's caller; strategies turn it into a cached or offline reply.
class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& what) : std::runtime_error(what) {}
};

// NetworkFirst lost its race against the configured timeout.
class TimeoutError : public NetworkError {
public:
    explicit TimeoutError(const std::string& what) : NetworkError(what) {}
};

// Persistent store I/O or corruption.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace netstash
