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

#ifndef TASKENV_UNSAFE_APIS_H_
#define TASKENV_UNSAFE_APIS_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/base/nullability.h"
#include "absl/types/span.h"

namespace taskenv {

// Why a library function is unsafe in a task that runs concurrently with
// other tasks in the same process.
enum class UnsafeApiCategory {
  // Affects the whole process and has no safe replacement.
  kCriticalError,
  // Reads or writes process-global state that TaskEnvironment replaces.
  kTaskEnvironmentRequired,
  // Safe only if all path arguments are absolute.
  kFilePathRequiresAbsolute,
  // Needs review case by case.
  kPotentialIssue,
};

struct UnsafeApi final {
  // Qualified name, e.g. "getenv" or "std::filesystem::current_path".  C
  // library functions are listed without the std:: prefix.
  std::string_view symbol;
  UnsafeApiCategory category;
  // What to do instead.
  std::string_view advice;
};

// The diagnostic identifier that analysis tools report for category, e.g.
// "TSK9998".
std::string_view DiagnosticId(UnsafeApiCategory category);

// All known unsafe APIs, grouped by category.
absl::Span<const UnsafeApi> UnsafeApis();

// Look up a symbol.  A leading "::" is ignored, and "std::getenv" finds the
// entry for "getenv".  Return null if the symbol isn’t known to be unsafe.
const UnsafeApi* absl_nullable FindUnsafeApi(std::string_view symbol);

// Return a human-readable diagnostic for a use of api, e.g.
// "TSK9999: Symbol 'exit' is banned in multithreadable tasks: ...".
std::string FormatDiagnostic(const UnsafeApi& api);

struct UnsafeApiUse final {
  const UnsafeApi* absl_nonnull api;
  // One-based position of the symbol in the source text.
  int line;
  int column;
};

// Find uses of unsafe APIs in C++ source code.  This is a lexical scan: it
// skips comments, string and character literals (raw strings included), and
// member accesses, but doesn’t resolve names.
std::vector<UnsafeApiUse> FindUnsafeApiUses(std::string_view source);

}  // namespace taskenv

#endif  // TASKENV_UNSAFE_APIS_H_
