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

// Helper program for the process tests.
//
// Usage: helper [--cwd] [--env=NAME] [--sleep=DURATION] [--exit=CODE]
//
// --cwd prints the working directory and --env prints the value of an
// environment variable, each followed by a newline.

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "absl/container/fixed_array.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/span.h"

#include "taskenv/absolute_path.h"
#include "taskenv/platform.h"
#include "taskenv/strings.h"
#include "taskenv/system.h"

namespace taskenv {

static absl::Status Print(const NativeStringView string) {
  const absl::StatusOr<std::string> narrow = ToNarrow(string, Encoding::kUtf8);
  if (!narrow.ok()) return narrow.status();
  std::cout << *narrow << '\n' << std::flush;
  return absl::OkStatus();
}

static absl::StatusOr<int> Main(absl::Span<const NativeStringView> argv) {
  if (argv.empty()) return absl::InvalidArgumentError("Empty argument vector");
  argv.remove_prefix(1);

  int code = 0;
  for (const NativeStringView arg : argv) {
    const absl::StatusOr<std::string> narrow = ToNarrow(arg, Encoding::kUtf8);
    if (!narrow.ok()) return narrow.status();
    std::string_view rest = *narrow;
    if (rest == "--cwd") {
      const absl::StatusOr<AbsolutePath> cwd = CurrentDirectory();
      if (!cwd.ok()) return cwd.status();
      const absl::Status status = Print(cwd->value());
      if (!status.ok()) return status;
    } else if (ConsumePrefix(rest, "--env=")) {
      const absl::StatusOr<NativeString> name =
          ToNative(rest, Encoding::kUtf8);
      if (!name.ok()) return name.status();
      const absl::StatusOr<Environment> env = Environment::Current();
      if (!env.ok()) return env.status();
      const absl::Status status = Print(env->Get(*name).value_or(NativeString()));
      if (!status.ok()) return status;
    } else if (ConsumePrefix(rest, "--sleep=")) {
      absl::Duration duration;
      if (!absl::ParseDuration(rest, &duration)) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid duration %s", rest));
      }
      absl::SleepFor(duration);
    } else if (ConsumePrefix(rest, "--exit=")) {
      if (!absl::SimpleAtoi(rest, &code)) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid exit code %s", rest));
      }
    } else {
      return absl::InvalidArgumentError(
          absl::StrFormat("Invalid command-line argument %s", *narrow));
    }
  }
  return code;
}

}  // namespace taskenv

int TASKENV_MAIN(int argc, taskenv::NativeChar** argv) {
  absl::InitializeLog();
  const absl::FixedArray<taskenv::NativeStringView> args(argv, argv + argc);
  const absl::StatusOr<int> code = taskenv::Main(args);
  if (!code.ok()) {
    LOG(ERROR) << code.status();
    return EXIT_FAILURE;
  }
  return *code;
}
