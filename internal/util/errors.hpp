#pragma once

#include <stdexcept>
#include <string>

namespace deploy::util {

/*
  Central error types.

  Validation failure is NOT an error: it is returned as a result variant.
  Everything here is raised only for malformed calls, illegal state
  transitions, I/O faults and store failures.
*/

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Validate() called on a transaction with no registered files.
class NoFiles : public InvalidState {
 public:
  explicit NoFiles(const std::string& msg) : InvalidState(msg) {
  }
};

class ChecksumMismatch : public std::runtime_error {
 public:
  explicit ChecksumMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeploymentIOError : public std::runtime_error {
 public:
  explicit DeploymentIOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class VerificationError : public std::runtime_error {
 public:
  explicit VerificationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace deploy::util
