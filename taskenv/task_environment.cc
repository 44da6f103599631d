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

#include "taskenv/task_environment.h"

#include <optional>
#include <utility>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "taskenv/absolute_path.h"
#include "taskenv/path.h"
#include "taskenv/platform.h"
#include "taskenv/system.h"

namespace taskenv {

absl::StatusOr<TaskEnvironment> TaskEnvironment::Create(
    AbsolutePath project_directory, Environment variables) {
  if (project_directory.empty()) {
    return absl::InvalidArgumentError("Empty project directory");
  }
  return TaskEnvironment(std::move(project_directory), std::move(variables));
}

absl::Status TaskEnvironment::SetProjectDirectory(AbsolutePath directory) {
  if (directory.empty()) {
    return absl::InvalidArgumentError("Empty project directory");
  }
  project_directory_ = std::move(directory);
  return absl::OkStatus();
}

AbsolutePath TaskEnvironment::GetAbsolutePath(
    const NativeStringView path) const {
  if (path.empty()) return AbsolutePath();
  if (IsPathRooted(path)) {
    return AbsolutePath::Unchecked(NativeString(path), NativeString(path));
  }
  CHECK(!project_directory_.empty()) << "moved-from TaskEnvironment";
  return AbsolutePath::Unchecked(
      CombinePaths(project_directory_.value(), path), NativeString(path));
}

std::optional<NativeString> TaskEnvironment::GetEnvironmentVariable(
    const NativeStringView name) const {
  return variables_.Get(name);
}

absl::Status TaskEnvironment::SetEnvironmentVariable(
    const NativeStringView name, const std::optional<NativeStringView> value) {
  if (value.has_value()) return variables_.Set(name, *value);
  if (name.empty()) {
    return absl::InvalidArgumentError("Empty environment variable name");
  }
  variables_.Remove(name);
  return absl::OkStatus();
}

ProcessStartInfo TaskEnvironment::GetProcessStartInfo() const {
  ProcessStartInfo info;
  info.working_directory = project_directory_;
  info.environment = variables_;
  return info;
}

}  // namespace taskenv
