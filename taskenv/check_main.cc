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

// Reports uses of APIs that touch process-global state in the source files of
// multithreadable tasks.
//
// Usage: taskenv-check [--werror] [--] FILE...
//
// Exits with status 1 if any file uses an API that is never safe, or, with
// --werror, any API that is potentially unsafe.

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

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
#include "taskenv/strings.h"
#include "taskenv/system.h"
#include "taskenv/unsafe_apis.h"

namespace taskenv {

static absl::StatusOr<int> Main(absl::Span<const NativeStringView> argv) {
  if (argv.empty()) return absl::InvalidArgumentError("Empty argument vector");
  argv.remove_prefix(1);

  bool werror = false;
  while (!argv.empty()) {
    const NativeStringView arg = argv.front();
    if (arg.empty() || arg.front() != TASKENV_NATIVE_LITERAL('-')) break;
    argv.remove_prefix(1);
    if (arg == TASKENV_NATIVE_LITERAL("--")) break;
    if (arg == TASKENV_NATIVE_LITERAL("--werror")) {
      werror = true;
    } else {
      return absl::InvalidArgumentError(
          absl::StrFormat("Invalid command-line argument %s", Quote(arg)));
    }
  }
  if (argv.empty()) return absl::InvalidArgumentError("No input files");

  int code = EXIT_SUCCESS;
  for (const NativeStringView arg : argv) {
    const absl::StatusOr<AbsolutePath> file = MakeAbsolute(arg);
    if (!file.ok()) return file.status();
    const absl::StatusOr<std::string> source = ReadFile(*file);
    if (!source.ok()) return source.status();
    const absl::StatusOr<std::string> name = ToNarrow(arg, Encoding::kUtf8);
    if (!name.ok()) return name.status();
    const std::vector<UnsafeApiUse> uses = FindUnsafeApiUses(*source);
    for (const UnsafeApiUse& use : uses) {
      std::cout << absl::StreamFormat("%s:%d:%d: %s\n", *name, use.line,
                                      use.column, FormatDiagnostic(*use.api));
      if (werror || use.api->category == UnsafeApiCategory::kCriticalError) {
        code = EXIT_FAILURE;
      }
    }
  }
  return code;
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
