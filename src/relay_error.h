#pragma once
// relay_error.h — Exception types shared by parsers and startup code.

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace relay {

// Bad user input: malformed addresses, unknown interfaces, missing options.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// "<what>: <strerror(err)>", used for failed syscalls at startup.
inline std::runtime_error sys_error(const std::string& what, int err = errno) {
  return std::runtime_error(what + ": " + std::strerror(err));
}

}  // namespace relay
