#pragma once

#include <stdexcept>
#include <string>

namespace voicecode::util {

/*
  Central error types.

  Only genuine misuse and resource limits are surfaced this way. Races that
  belong to normal operation (late acknowledgment, lost claim) never throw.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A second request registered under a key that is still pending.
class DuplicateKey : public std::runtime_error {
 public:
  explicit DuplicateKey(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SizeLimitExceeded : public std::runtime_error {
 public:
  explicit SizeLimitExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FileNotFound : public std::runtime_error {
 public:
  explicit FileNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persistent store rejected a write; in-memory state was not changed.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace voicecode::util
