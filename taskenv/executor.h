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

#ifndef TASKENV_EXECUTOR_H_
#define TASKENV_EXECUTOR_H_

#include <memory>
#include <optional>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/base/nullability.h"
#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"

#include "taskenv/absolute_path.h"
#include "taskenv/system.h"
#include "taskenv/task.h"
#include "taskenv/task_environment.h"

namespace taskenv {

// States of a task invocation.  A task runs as
// kNotStarted → kEnvironmentAssigned → kExecuting → kCompleted or kFaulted,
// where tasks without a TaskEnvironment skip kEnvironmentAssigned.  An
// invocation that fails before any task code runs, because its seed has no
// project directory or because there’s no legacy host for a task that needs
// one, goes directly from kNotStarted to kFaulted.
enum class InvocationState {
  kNotStarted,
  kEnvironmentAssigned,
  kExecuting,
  kCompleted,
  kFaulted,
};

template <typename Sink>
void AbslStringify(Sink& sink, const InvocationState state) {
  switch (state) {
    case InvocationState::kNotStarted:
      sink.Append("NotStarted");
      return;
    case InvocationState::kEnvironmentAssigned:
      sink.Append("EnvironmentAssigned");
      return;
    case InvocationState::kExecuting:
      sink.Append("Executing");
      return;
    case InvocationState::kCompleted:
      sink.Append("Completed");
      return;
    case InvocationState::kFaulted:
      sink.Append("Faulted");
      return;
  }
  absl::Format(&sink, "InvocationState(%d)", static_cast<int>(state));
}

// What the engine knows about the context of a task invocation before it
// starts.  The engine resolves a new seed for every attempt.
struct InvocationSeed final {
  AbsolutePath project_directory;
  Environment variables;
};

// Runs tasks that aren’t concurrency capable in a separate process, so that
// their changes to process-global state don’t affect other tasks.
class LegacyTaskHost {
 public:
  virtual ~LegacyTaskHost() = default;

  // Execute task in a process whose working directory and environment are
  // described by seed.
  virtual absl::Status Execute(Task& task, const InvocationSeed& seed) = 0;
};

// A single attempt to run a task.  An invocation can only run once; to retry a
// task, create a new invocation with Retry.
class TaskInvocation final {
 public:
  // If legacy_host is null, tasks that aren’t concurrency capable fail.
  // Otherwise legacy_host must outlive the invocation.
  explicit TaskInvocation(TaskHandle task, InvocationSeed seed,
                          LegacyTaskHost* absl_nullable legacy_host);

  TaskInvocation(const TaskInvocation&) = delete;
  TaskInvocation& operator=(const TaskInvocation&) = delete;

  // Run the task and return its result.  Interface-capable tasks receive a new
  // TaskEnvironment built from the seed, which is detached and destroyed once
  // the task returns.  Return a FailedPrecondition error if the invocation has
  // already run.
  absl::Status Run() ABSL_LOCKS_EXCLUDED(mutex_);

  // Return a new invocation of the same task with a freshly resolved seed.
  // Return a FailedPrecondition error if this invocation hasn’t finished yet.
  absl::StatusOr<std::unique_ptr<TaskInvocation>> Retry(
      InvocationSeed seed) const ABSL_LOCKS_EXCLUDED(mutex_);

  InvocationState state() const ABSL_LOCKS_EXCLUDED(mutex_);

  // All states that the invocation has been in, in order.
  std::vector<InvocationState> history() const ABSL_LOCKS_EXCLUDED(mutex_);

  const TaskHandle& task() const ABSL_ATTRIBUTE_LIFETIME_BOUND { return task_; }

 private:
  void Transition(InvocationState state) ABSL_LOCKS_EXCLUDED(mutex_);
  absl::Status Finish(absl::Status status) ABSL_LOCKS_EXCLUDED(mutex_);

  absl::Status RunWithEnvironment();

  const TaskHandle task_;
  const InvocationSeed seed_;
  LegacyTaskHost* absl_nullable const legacy_host_;

  mutable absl::Mutex mutex_;
  bool started_ ABSL_GUARDED_BY(mutex_) = false;
  std::vector<InvocationState> history_ ABSL_GUARDED_BY(mutex_);
};

// Runs task invocations on parallel worker lanes.
class TaskExecutor final {
 public:
  // If lanes is zero, use one lane per hardware thread.
  explicit TaskExecutor(unsigned int lanes = 0);

  // Run all invocations and wait for them to finish.  The result contains one
  // status per invocation, in the same order.
  std::vector<absl::Status> RunAll(
      absl::Span<TaskInvocation* absl_nonnull const> invocations) const;

  unsigned int lanes() const { return lanes_; }

 private:
  unsigned int lanes_;
};

}  // namespace taskenv

#endif  // TASKENV_EXECUTOR_H_
