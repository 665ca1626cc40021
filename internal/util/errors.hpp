#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace threadnet::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class InvalidFormat : public std::runtime_error {
 public:
  explicit InvalidFormat(const std::string& msg, std::size_t offset = 0) : std::runtime_error(msg), offset_(offset) {
  }

  // Byte offset into the decoded input where parsing stopped.
  std::size_t offset() const {
    return offset_;
  }

 private:
  std::size_t offset_;
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotAllowed : public std::runtime_error {
 public:
  explicit NotAllowed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durable state could not be written or read back. Never masked.
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace threadnet::util
