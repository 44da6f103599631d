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

#ifndef TASKENV_TASK_ENVIRONMENT_H_
#define TASKENV_TASK_ENVIRONMENT_H_

#include <optional>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "taskenv/absolute_path.h"
#include "taskenv/platform.h"
#include "taskenv/system.h"

namespace taskenv {

// The view of process-global state that a single task invocation has: its
// logical working directory and its environment variables.  Operations never
// read or modify the real process state.
//
// Each task invocation owns exactly one instance.  The class is not internally
// synchronized; tasks that start their own threads have to synchronize access
// themselves.
class TaskEnvironment final {
 public:
  // Return an environment with the given logical directory and variables.  The
  // new object owns a private copy of variables.
  static absl::StatusOr<TaskEnvironment> Create(AbsolutePath project_directory,
                                                Environment variables);

  TaskEnvironment(const TaskEnvironment&) = delete;
  TaskEnvironment& operator=(const TaskEnvironment&) = delete;
  TaskEnvironment(TaskEnvironment&&) = default;
  TaskEnvironment& operator=(TaskEnvironment&&) = default;

  const AbsolutePath& project_directory() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    return project_directory_;
  }

  // Change the logical working directory.  Relative paths resolved later use
  // the new directory.
  absl::Status SetProjectDirectory(AbsolutePath directory);

  // Resolve path against the logical directory.  An empty path results in a
  // default-constructed AbsolutePath.  A rooted path is returned unchanged.
  AbsolutePath GetAbsolutePath(NativeStringView path) const;

  std::optional<NativeString> GetEnvironmentVariable(
      NativeStringView name) const;

  // All variables visible to the task, including its own changes.
  const Environment& GetEnvironmentVariables() const
      ABSL_ATTRIBUTE_LIFETIME_BOUND {
    return variables_;
  }

  // Set the variable name to value, or remove it if value is std::nullopt.
  // The change is only visible through this object.
  absl::Status SetEnvironmentVariable(NativeStringView name,
                                      std::optional<NativeStringView> value);

  // Return a process configuration whose working directory is the logical
  // directory and whose environment consists of exactly the variables
  // visible to the task.  The caller still has to fill in the program and its
  // arguments.
  ProcessStartInfo GetProcessStartInfo() const;

 private:
  explicit TaskEnvironment(AbsolutePath project_directory,
                           Environment variables)
      : project_directory_(std::move(project_directory)),
        variables_(std::move(variables)) {}

  AbsolutePath project_directory_;
  Environment variables_;
};

}  // namespace taskenv

#endif  // TASKENV_TASK_ENVIRONMENT_H_
