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

#include "taskenv/snapshot.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "google/protobuf/json/json.h"

#include "taskenv/absolute_path.h"
#include "taskenv/platform.h"
#include "taskenv/snapshot.pb.h"
#include "taskenv/system.h"
#include "taskenv/task_environment.h"

namespace taskenv {

absl::StatusOr<std::string> SnapshotToJson(const TaskEnvironment& env) {
  TaskEnvironmentSnapshot snapshot;
  absl::StatusOr<std::string> directory =
      ToNarrow(env.project_directory().value(), Encoding::kUtf8);
  if (!directory.ok()) return directory.status();
  snapshot.set_project_directory(*std::move(directory));
  auto& variables = *snapshot.mutable_variables();
  for (const auto& [key, value] : env.GetEnvironmentVariables()) {
    absl::StatusOr<std::string> narrow_key = ToNarrow(key, Encoding::kUtf8);
    if (!narrow_key.ok()) return narrow_key.status();
    absl::StatusOr<std::string> narrow_value =
        ToNarrow(value, Encoding::kUtf8);
    if (!narrow_value.ok()) return narrow_value.status();
    variables[*std::move(narrow_key)] = *std::move(narrow_value);
  }
  google::protobuf::json::PrintOptions options;
  options.add_whitespace = true;
  std::string json;
  const absl::Status status =
      google::protobuf::json::MessageToJsonString(snapshot, &json, options);
  if (!status.ok()) return status;
  return json;
}

absl::StatusOr<TaskEnvironment> SnapshotFromJson(const std::string_view json) {
  TaskEnvironmentSnapshot snapshot;
  if (const absl::Status status =
          google::protobuf::json::JsonStringToMessage(json, &snapshot);
      !status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid task environment snapshot: %s",
                        status.message()));
  }
  const absl::StatusOr<NativeString> directory =
      ToNative(snapshot.project_directory(), Encoding::kUtf8);
  if (!directory.ok()) return directory.status();
  absl::StatusOr<AbsolutePath> project_directory =
      AbsolutePath::FromString(*directory);
  if (!project_directory.ok()) return project_directory.status();
  std::vector<std::pair<NativeString, NativeString>> pairs;
  for (const auto& [key, value] : snapshot.variables()) {
    absl::StatusOr<NativeString> native_key = ToNative(key, Encoding::kUtf8);
    if (!native_key.ok()) return native_key.status();
    absl::StatusOr<NativeString> native_value =
        ToNative(value, Encoding::kUtf8);
    if (!native_value.ok()) return native_value.status();
    pairs.emplace_back(*std::move(native_key), *std::move(native_value));
  }
  absl::StatusOr<Environment> variables =
      Environment::Create(pairs.cbegin(), pairs.cend());
  if (!variables.ok()) {
    return absl::InvalidArgumentError(variables.status().message());
  }
  return TaskEnvironment::Create(*std::move(project_directory),
                                 *std::move(variables));
}

absl::Status WriteSnapshot(const TaskEnvironment& env,
                           const AbsolutePath& file) {
  const absl::StatusOr<std::string> json = SnapshotToJson(env);
  if (!json.ok()) return json.status();
  return WriteFile(file, *json);
}

absl::StatusOr<TaskEnvironment> ReadSnapshot(const AbsolutePath& file) {
  const absl::StatusOr<std::string> json = ReadFile(file);
  if (!json.ok()) return json.status();
  return SnapshotFromJson(*json);
}

}  // namespace taskenv
