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

// Runs a program in the working directory and with the environment variables
// recorded in a task environment snapshot.
//
// Usage: taskenv-run --snapshot=FILE [--output=FILE] [--] PROGRAM ARGS...
//
// Relative names for FILE are resolved against the real working directory of
// this process; PROGRAM is resolved against the directory in the snapshot.

#include <cstdlib>
#include <optional>
#include <utility>

#include "absl/base/log_severity.h"
#include "absl/container/fixed_array.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"

#include "taskenv/absolute_path.h"
#include "taskenv/platform.h"
#include "taskenv/snapshot.h"
#include "taskenv/strings.h"
#include "taskenv/system.h"
#include "taskenv/task_environment.h"

namespace taskenv {

static absl::StatusOr<AbsolutePath> ResolveArgument(const NativeStringView arg,
                                                    const NativeStringView flag) {
  if (arg.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Empty argument for %s", Quote(flag)));
  }
  // This is a standalone process, so it can use its real working directory.
  return MakeAbsolute(arg);
}

static absl::StatusOr<int> Main(absl::Span<const NativeStringView> argv) {
  if (argv.empty()) return absl::InvalidArgumentError("Empty argument vector");
  argv.remove_prefix(1);

  std::optional<AbsolutePath> snapshot_file;
  std::optional<AbsolutePath> output_file;
  while (!argv.empty()) {
    NativeStringView arg = argv.front();
    if (arg.empty() || arg.front() != TASKENV_NATIVE_LITERAL('-')) break;
    argv.remove_prefix(1);
    if (arg == TASKENV_NATIVE_LITERAL("--")) break;
    if (ConsumePrefix(arg, TASKENV_NATIVE_LITERAL("--snapshot="))) {
      absl::StatusOr<AbsolutePath> file =
          ResolveArgument(arg, TASKENV_NATIVE_LITERAL("--snapshot"));
      if (!file.ok()) return file.status();
      snapshot_file = *std::move(file);
    } else if (ConsumePrefix(arg, TASKENV_NATIVE_LITERAL("--output="))) {
      absl::StatusOr<AbsolutePath> file =
          ResolveArgument(arg, TASKENV_NATIVE_LITERAL("--output"));
      if (!file.ok()) return file.status();
      output_file = *std::move(file);
    } else {
      return absl::InvalidArgumentError(
          absl::StrFormat("Invalid command-line argument %s", Quote(arg)));
    }
  }
  if (!snapshot_file.has_value()) {
    return absl::InvalidArgumentError("Missing --snapshot flag");
  }
  if (argv.empty()) return absl::InvalidArgumentError("Missing program");

  const absl::StatusOr<TaskEnvironment> env = ReadSnapshot(*snapshot_file);
  if (!env.ok()) return env.status();
  ProcessStartInfo info = env->GetProcessStartInfo();
  info.program = env->GetAbsolutePath(argv.front());
  info.args.assign(argv.begin() + 1, argv.end());
  info.output_file = std::move(output_file);
  return Run(info);
}

}  // namespace taskenv

int TASKENV_MAIN(int argc, taskenv::NativeChar** argv) {
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);
  const absl::FixedArray<taskenv::NativeStringView> args(argv, argv + argc);
  const absl::StatusOr<int> code = taskenv::Main(args);
  if (!code.ok()) {
    LOG(ERROR) << code.status();
    return EXIT_FAILURE;
  }
  return *code;
}
