// Copyright 2020-2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "taskenv/executor.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>  // NOLINT(build/c++11)
#include <utility>
#include <vector>

#include "absl/base/nullability.h"
#include "absl/cleanup/cleanup.h"
#include "absl/log/die_if_null.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"

#include "taskenv/task.h"
#include "taskenv/task_environment.h"

namespace taskenv {

TaskInvocation::TaskInvocation(TaskHandle task, InvocationSeed seed,
                               LegacyTaskHost* absl_nullable const legacy_host)
    : task_(std::move(task)),
      seed_(std::move(seed)),
      legacy_host_(legacy_host),
      history_({InvocationState::kNotStarted}) {}

absl::Status TaskInvocation::Run() {
  const std::string name = task_.task().name();
  {
    absl::MutexLock lock(&mutex_);
    if (started_) {
      return absl::FailedPreconditionError(
          absl::StrFormat("Invocation of task %s has already run", name));
    }
    started_ = true;
  }
  LOG(INFO) << "Starting task " << name << " (" << task_.capability() << ")";
  switch (task_.capability()) {
    case TaskCapability::kInterfaceCapable:
      return this->Finish(this->RunWithEnvironment());
    case TaskCapability::kMarkerCapable:
      // Trusted to not touch process-global state, so there’s no environment
      // to assign.
      this->Transition(InvocationState::kExecuting);
      return this->Finish(task_.task().Execute());
    case TaskCapability::kNotCapable:
      if (legacy_host_ == nullptr) {
        return this->Finish(absl::FailedPreconditionError(absl::StrFormat(
            "Task %s isn’t concurrency capable, and there’s no legacy host",
            name)));
      }
      this->Transition(InvocationState::kExecuting);
      return this->Finish(legacy_host_->Execute(task_.task(), seed_));
  }
  LOG(FATAL) << "Invalid task capability " << task_.capability();
}

absl::Status TaskInvocation::RunWithEnvironment() {
  // Copies the seed, so that nothing the task does leaks into a retry.
  absl::StatusOr<TaskEnvironment> environment =
      TaskEnvironment::Create(seed_.project_directory, seed_.variables);
  if (!environment.ok()) return environment.status();
  MultiThreadableTask& task = *ABSL_DIE_IF_NULL(task_.multi_threadable());
  task.set_task_environment(&*environment);
  const absl::Cleanup detach = [&task] { task.set_task_environment(nullptr); };
  this->Transition(InvocationState::kEnvironmentAssigned);
  this->Transition(InvocationState::kExecuting);
  return task.Execute();
}

absl::StatusOr<std::unique_ptr<TaskInvocation>> TaskInvocation::Retry(
    InvocationSeed seed) const {
  const InvocationState state = this->state();
  if (state != InvocationState::kCompleted &&
      state != InvocationState::kFaulted) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Can’t retry task %s in state %v", task_.task().name(), state));
  }
  return std::make_unique<TaskInvocation>(task_, std::move(seed),
                                          legacy_host_);
}

InvocationState TaskInvocation::state() const {
  absl::MutexLock lock(&mutex_);
  return history_.back();
}

std::vector<InvocationState> TaskInvocation::history() const {
  absl::MutexLock lock(&mutex_);
  return history_;
}

void TaskInvocation::Transition(const InvocationState state) {
  VLOG(1) << "Task " << task_.task().name() << " is now in state " << state;
  absl::MutexLock lock(&mutex_);
  history_.push_back(state);
}

absl::Status TaskInvocation::Finish(absl::Status status) {
  if (status.ok()) {
    this->Transition(InvocationState::kCompleted);
    LOG(INFO) << "Task " << task_.task().name() << " completed";
  } else {
    this->Transition(InvocationState::kFaulted);
    LOG(ERROR) << "Task " << task_.task().name() << " failed: " << status;
  }
  return status;
}

TaskExecutor::TaskExecutor(const unsigned int lanes)
    : lanes_(lanes == 0 ? std::max(std::thread::hardware_concurrency(), 1u)
                        : lanes) {}

std::vector<absl::Status> TaskExecutor::RunAll(
    const absl::Span<TaskInvocation* absl_nonnull const> invocations) const {
  std::vector<absl::Status> results(invocations.size());
  std::atomic<std::size_t> next = 0;
  // Each lane picks the next invocation that no other lane has taken.  Lanes
  // write to distinct elements of results.
  const auto lane = [&invocations, &results, &next] {
    for (std::size_t i = next++; i < invocations.size(); i = next++) {
      results[i] = ABSL_DIE_IF_NULL(invocations[i])->Run();
    }
  };
  const std::size_t count =
      std::min(std::size_t{lanes_}, invocations.size());
  std::vector<std::thread> threads;
  threads.reserve(count);
  {
    // Join the lanes that did start even if starting another one throws.
    const absl::Cleanup join = [&threads] {
      for (std::thread& thread : threads) thread.join();
    };
    for (std::size_t i = 0; i < count; ++i) threads.emplace_back(lane);
  }
  return results;
}

}  // namespace taskenv
