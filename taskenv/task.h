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

#ifndef TASKENV_TASK_H_
#define TASKENV_TASK_H_

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/nullability.h"
#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"

#include "taskenv/task_environment.h"

namespace taskenv {

// A unit of build work.  Tasks that derive only from this class assume that
// they own the process: they may change the working directory or environment
// variables, so the engine runs them in a separate process.
class Task {
 public:
  virtual ~Task() = default;

  virtual std::string name() const = 0;

  virtual absl::Status Execute() = 0;
};

// A task that can run concurrently with other tasks in the same process.  The
// engine injects a TaskEnvironment before calling Execute, and the task uses
// it for all working-directory-relative and environment variable operations.
class MultiThreadableTask : public Task {
 public:
  void set_task_environment(TaskEnvironment* absl_nullable environment) {
    environment_ = environment;
  }

  TaskEnvironment* absl_nullable task_environment() const {
    return environment_;
  }

 protected:
  // Only valid while Execute runs.
  TaskEnvironment& environment() const {
    CHECK_NE(environment_, nullptr) << "no task environment for " << name();
    return *environment_;
  }

 private:
  TaskEnvironment* absl_nullable environment_ = nullptr;
};

// Specialize this template to derive from std::true_type to declare that a
// task type never touches process-global state, without deriving from
// MultiThreadableTask:
//
//   template <>
//   struct MultiThreadableMarker<MyTask> : std::true_type {};
//
// Nothing checks this claim at runtime.
template <typename T>
struct MultiThreadableMarker : std::false_type {};

enum class TaskCapability {
  kNotCapable,
  kInterfaceCapable,
  kMarkerCapable,
};

template <typename Sink>
void AbslStringify(Sink& sink, const TaskCapability capability) {
  switch (capability) {
    case TaskCapability::kNotCapable:
      sink.Append("not capable");
      return;
    case TaskCapability::kInterfaceCapable:
      sink.Append("interface capable");
      return;
    case TaskCapability::kMarkerCapable:
      sink.Append("marker capable");
      return;
  }
  absl::Format(&sink, "TaskCapability(%d)", static_cast<int>(capability));
}

// A task together with its capability.  The capability is determined once,
// from the static type of the task.  Copies share the task object.
class TaskHandle final {
 public:
  template <typename T>
  static TaskHandle Create(std::unique_ptr<T> task) {
    static_assert(std::is_base_of_v<Task, T>, "T must be a Task");
    CHECK(task != nullptr);
    MultiThreadableTask* absl_nullable multi = nullptr;
    TaskCapability capability = TaskCapability::kNotCapable;
    if constexpr (std::is_base_of_v<MultiThreadableTask, T>) {
      multi = task.get();
      capability = TaskCapability::kInterfaceCapable;
    } else if constexpr (MultiThreadableMarker<T>::value) {
      capability = TaskCapability::kMarkerCapable;
    }
    return TaskHandle(std::move(task), multi, capability);
  }

  TaskHandle(const TaskHandle&) = default;
  TaskHandle& operator=(const TaskHandle&) = default;
  TaskHandle(TaskHandle&&) = default;
  TaskHandle& operator=(TaskHandle&&) = default;

  TaskCapability capability() const { return capability_; }

  Task& task() const ABSL_ATTRIBUTE_LIFETIME_BOUND { return *task_; }

  // Non-null if and only if the task is interface capable.
  MultiThreadableTask* absl_nullable multi_threadable() const
      ABSL_ATTRIBUTE_LIFETIME_BOUND {
    return multi_;
  }

 private:
  explicit TaskHandle(std::shared_ptr<Task> task,
                      MultiThreadableTask* absl_nullable multi,
                      const TaskCapability capability)
      : task_(std::move(task)), multi_(multi), capability_(capability) {}

  std::shared_ptr<Task> task_;
  MultiThreadableTask* absl_nullable multi_;
  TaskCapability capability_;
};

}  // namespace taskenv

#endif  // TASKENV_TASK_H_
