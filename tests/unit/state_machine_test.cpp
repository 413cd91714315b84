#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/model/deployment.hpp"
#include "internal/model/state_machine.hpp"

namespace {

using deploy::model::CanTransition;
using deploy::model::TransactionStatus;

constexpr TransactionStatus kAll[] = {
    TransactionStatus::kInitialized, TransactionStatus::kValidated, TransactionStatus::kInProgress,
    TransactionStatus::kCompleted,   TransactionStatus::kFailed,    TransactionStatus::kRolledBack,
};

void TestForwardEdges() {
  static_assert(CanTransition(TransactionStatus::kInitialized, TransactionStatus::kValidated));
  static_assert(CanTransition(TransactionStatus::kValidated, TransactionStatus::kInProgress));
  static_assert(CanTransition(TransactionStatus::kInProgress, TransactionStatus::kCompleted));
  static_assert(CanTransition(TransactionStatus::kInProgress, TransactionStatus::kFailed));
  static_assert(CanTransition(TransactionStatus::kCompleted, TransactionStatus::kRolledBack));
  static_assert(CanTransition(TransactionStatus::kFailed, TransactionStatus::kRolledBack));
}

void TestOffGraphEdgesAreRejected() {
  int allowed = 0;
  for (auto from : kAll) {
    for (auto to : kAll) {
      if (from != to && CanTransition(from, to)) ++allowed;
    }
  }
  // exactly the six edges above
  assert(allowed == 6);

  assert(!CanTransition(TransactionStatus::kValidated, TransactionStatus::kInitialized));
  assert(!CanTransition(TransactionStatus::kInitialized, TransactionStatus::kInProgress));
  assert(!CanTransition(TransactionStatus::kRolledBack, TransactionStatus::kInProgress));
  assert(!CanTransition(TransactionStatus::kCompleted, TransactionStatus::kFailed));
}

void TestPredicates() {
  assert(deploy::model::AcceptsFiles(TransactionStatus::kInitialized));
  assert(deploy::model::AcceptsFiles(TransactionStatus::kValidated));
  assert(!deploy::model::AcceptsFiles(TransactionStatus::kInProgress));
  assert(deploy::model::IsRollbackable(TransactionStatus::kCompleted));
  assert(deploy::model::IsRollbackable(TransactionStatus::kFailed));
  assert(!deploy::model::IsRollbackable(TransactionStatus::kRolledBack));
}

void TestNamesRoundTrip() {
  for (auto status : kAll) {
    assert(deploy::model::ParseTransactionStatus(deploy::model::ToString(status)) == status);
  }
  assert(deploy::model::ToString(TransactionStatus::kRolledBack) == "ROLLED_BACK");
  assert(deploy::model::ParseBackupType("CONFIG") == deploy::model::BackupType::kConfig);

  bool threw = false;
  try {
    (void)deploy::model::ParseTransactionStatus("DONE");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestForwardEdges();
  TestOffGraphEdgesAreRejected();
  TestPredicates();
  TestNamesRoundTrip();

  std::cout << "file_deploy_unit_state_machine: pass\n";
  return 0;
}
