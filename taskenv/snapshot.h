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

#ifndef TASKENV_SNAPSHOT_H_
#define TASKENV_SNAPSHOT_H_

#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "taskenv/absolute_path.h"
#include "taskenv/task_environment.h"

namespace taskenv {

// Serialize the logical directory and variables of env as JSON.
absl::StatusOr<std::string> SnapshotToJson(const TaskEnvironment& env);

// Create a new TaskEnvironment from JSON written by SnapshotToJson.  Return an
// InvalidArgument error if the JSON is malformed, the directory isn’t
// absolute, or a variable name is invalid.
absl::StatusOr<TaskEnvironment> SnapshotFromJson(std::string_view json);

absl::Status WriteSnapshot(const TaskEnvironment& env,
                           const AbsolutePath& file);
absl::StatusOr<TaskEnvironment> ReadSnapshot(const AbsolutePath& file);

}  // namespace taskenv

#endif  // TASKENV_SNAPSHOT_H_
