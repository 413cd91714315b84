#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/deployment.hpp"

namespace deploy::core {

struct ValidationIssue {
  int64_t     line = 0;
  std::string message;
  std::string rule;
};

struct ValidationReport {
  deploy::model::ValidationStatus status = deploy::model::ValidationStatus::kPass;
  std::vector<ValidationIssue>    errors;
  std::vector<ValidationIssue>    warnings;
};

/*
  Judges a single source file. A FAIL verdict is a result, not an error.
*/
class Validator {
 public:
  virtual ~Validator() = default;

  virtual ValidationReport Validate(const std::filesystem::path& path) = 0;
};

/*
  Puts one source file at its destination.

  Returns false or throws on failure; either aborts the execution. A
  failed Deploy leaves destination as it found it.
*/
class FileDeployer {
 public:
  virtual ~FileDeployer() = default;

  virtual bool Deploy(const std::filesystem::path& source, const std::filesystem::path& destination) = 0;
};

/*
  Undoes one deployment of destination.
*/
class FileRestorer {
 public:
  virtual ~FileRestorer() = default;

  virtual bool Restore(const std::filesystem::path& destination) = 0;
};

} // namespace deploy::core
