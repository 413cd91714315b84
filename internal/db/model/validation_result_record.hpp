#pragma once

#include <cstdint>
#include <string>

#include "internal/model/deployment.hpp"

namespace deploy::db::model {

// One diagnostic reported by the validator for a file (FAIL or WARNING).
struct ValidationResultRecord {
  std::string file_id;
  std::string rule;

  deploy::model::ValidationStatus status = deploy::model::ValidationStatus::kFail;

  int64_t     line_number = 0;
  std::string message;
  std::string timestamp;
};

}
