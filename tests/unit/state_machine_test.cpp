#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/instance.hpp"
#include "internal/model/state_machine.hpp"

namespace {

using debugpod::model::CanTransition;
using debugpod::model::InstanceStatus;

void TestForwardTransitions() {
  assert(CanTransition(InstanceStatus::kProvisioning, InstanceStatus::kRunning));
  assert(CanTransition(InstanceStatus::kRunning, InstanceStatus::kDraining));
  assert(CanTransition(InstanceStatus::kDraining, InstanceStatus::kTerminated));
  assert(CanTransition(InstanceStatus::kProvisioning, InstanceStatus::kTerminated));
}

void TestBackwardTransitionsAreRejected() {
  assert(!CanTransition(InstanceStatus::kRunning, InstanceStatus::kProvisioning));
  assert(!CanTransition(InstanceStatus::kDraining, InstanceStatus::kRunning));
  assert(!CanTransition(InstanceStatus::kRunning, InstanceStatus::kUnspecified));
}

void TestTerminatedIsFinal() {
  assert(debugpod::model::IsTerminal(InstanceStatus::kTerminated));
  assert(!CanTransition(InstanceStatus::kTerminated, InstanceStatus::kProvisioning));
  assert(!CanTransition(InstanceStatus::kTerminated, InstanceStatus::kRunning));
  assert(CanTransition(InstanceStatus::kTerminated, InstanceStatus::kTerminated));
}

void TestNamesAndBranches() {
  assert(std::string(debugpod::model::ToString(InstanceStatus::kRunning)) == "Running");
  assert(debugpod::model::BranchNameFor("abc123") == "debug/abc123");
}

} // namespace

int main() {
  TestForwardTransitions();
  TestBackwardTransitionsAreRejected();
  TestTerminatedIsFinal();
  TestNamesAndBranches();

  std::cout << "debugpod_unit_state_machine: pass\n";
  return 0;
}
