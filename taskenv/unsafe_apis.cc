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

#include "taskenv/unsafe_apis.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/no_destructor.h"
#include "absl/base/nullability.h"
#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/strip.h"
#include "absl/types/span.h"

namespace taskenv {

namespace {

using C = UnsafeApiCategory;

constexpr std::string_view kTerminates =
    "Terminates the entire process; return an error status from the task "
    "instead";
constexpr std::string_view kCurrentDirectory =
    "Use TaskEnvironment::project_directory instead";
constexpr std::string_view kSetCurrentDirectory =
    "Use TaskEnvironment::SetProjectDirectory instead";
constexpr std::string_view kGetVariable =
    "Use TaskEnvironment::GetEnvironmentVariable instead";
constexpr std::string_view kSetVariable =
    "Use TaskEnvironment::SetEnvironmentVariable instead";
constexpr std::string_view kAbsolute =
    "Use TaskEnvironment::GetAbsolutePath instead";
constexpr std::string_view kProcess =
    "Use TaskEnvironment::GetProcessStartInfo and Run instead";
constexpr std::string_view kWrapPath =
    "Wrap path arguments with TaskEnvironment::GetAbsolutePath";
constexpr std::string_view kOutput =
    "May interfere with build output; use logging instead";
constexpr std::string_view kInput = "May block automated builds";
constexpr std::string_view kLoad = "May load conflicting library versions";
constexpr std::string_view kStatic =
    "Uses static internal state; use the reentrant variant instead";

constexpr UnsafeApi kUnsafeApis[] = {
    // Process termination and process-wide settings.
    {"exit", C::kCriticalError, kTerminates},
    {"_exit", C::kCriticalError, kTerminates},
    {"_Exit", C::kCriticalError, kTerminates},
    {"quick_exit", C::kCriticalError, kTerminates},
    {"abort", C::kCriticalError, kTerminates},
    {"std::terminate", C::kCriticalError, kTerminates},
    {"ExitProcess", C::kCriticalError, kTerminates},
    {"TerminateProcess", C::kCriticalError, "Terminates a process"},
    {"kill", C::kCriticalError, "Sends a signal to a process"},
    {"raise", C::kCriticalError, "Sends a signal to the entire process"},
    {"signal", C::kCriticalError, "Changes a process-wide signal disposition"},
    {"sigaction", C::kCriticalError,
     "Changes a process-wide signal disposition"},
    {"setlocale", C::kCriticalError, "Changes the locale of all threads"},
    {"std::locale::global", C::kCriticalError,
     "Changes the locale of all threads"},
    {"umask", C::kCriticalError, "Changes the file mode mask of all threads"},
    {"setrlimit", C::kCriticalError, "Changes process-wide resource limits"},
    {"chroot", C::kCriticalError, "Changes the root directory of all threads"},

    // Working directory.
    {"getcwd", C::kTaskEnvironmentRequired, kCurrentDirectory},
    {"get_current_dir_name", C::kTaskEnvironmentRequired, kCurrentDirectory},
    {"_getcwd", C::kTaskEnvironmentRequired, kCurrentDirectory},
    {"_wgetcwd", C::kTaskEnvironmentRequired, kCurrentDirectory},
    {"GetCurrentDirectoryW", C::kTaskEnvironmentRequired, kCurrentDirectory},
    {"chdir", C::kTaskEnvironmentRequired, kSetCurrentDirectory},
    {"fchdir", C::kTaskEnvironmentRequired, kSetCurrentDirectory},
    {"_chdir", C::kTaskEnvironmentRequired, kSetCurrentDirectory},
    {"_wchdir", C::kTaskEnvironmentRequired, kSetCurrentDirectory},
    {"SetCurrentDirectoryW", C::kTaskEnvironmentRequired,
     kSetCurrentDirectory},
    {"std::filesystem::current_path", C::kTaskEnvironmentRequired,
     kCurrentDirectory},

    // Path resolution against the working directory.
    {"realpath", C::kTaskEnvironmentRequired, kAbsolute},
    {"_fullpath", C::kTaskEnvironmentRequired, kAbsolute},
    {"_wfullpath", C::kTaskEnvironmentRequired, kAbsolute},
    {"GetFullPathNameW", C::kTaskEnvironmentRequired, kAbsolute},
    {"std::filesystem::absolute", C::kTaskEnvironmentRequired, kAbsolute},
    {"std::filesystem::canonical", C::kTaskEnvironmentRequired, kAbsolute},
    {"std::filesystem::weakly_canonical", C::kTaskEnvironmentRequired,
     kAbsolute},

    // Environment variables.
    {"getenv", C::kTaskEnvironmentRequired, kGetVariable},
    {"secure_getenv", C::kTaskEnvironmentRequired, kGetVariable},
    {"_wgetenv", C::kTaskEnvironmentRequired, kGetVariable},
    {"environ", C::kTaskEnvironmentRequired,
     "Use TaskEnvironment::GetEnvironmentVariables instead"},
    {"GetEnvironmentVariableW", C::kTaskEnvironmentRequired, kGetVariable},
    {"setenv", C::kTaskEnvironmentRequired, kSetVariable},
    {"unsetenv", C::kTaskEnvironmentRequired, kSetVariable},
    {"putenv", C::kTaskEnvironmentRequired, kSetVariable},
    {"_putenv", C::kTaskEnvironmentRequired, kSetVariable},
    {"_wputenv", C::kTaskEnvironmentRequired, kSetVariable},
    {"clearenv", C::kTaskEnvironmentRequired, kSetVariable},
    {"SetEnvironmentVariableW", C::kTaskEnvironmentRequired, kSetVariable},

    // Subprocesses, which inherit the working directory and environment.
    {"system", C::kTaskEnvironmentRequired, kProcess},
    {"popen", C::kTaskEnvironmentRequired, kProcess},
    {"fork", C::kTaskEnvironmentRequired, kProcess},
    {"execv", C::kTaskEnvironmentRequired, kProcess},
    {"execvp", C::kTaskEnvironmentRequired, kProcess},
    {"execl", C::kTaskEnvironmentRequired, kProcess},
    {"execlp", C::kTaskEnvironmentRequired, kProcess},
    {"posix_spawn", C::kTaskEnvironmentRequired, kProcess},
    {"posix_spawnp", C::kTaskEnvironmentRequired, kProcess},
    {"CreateProcessW", C::kTaskEnvironmentRequired, kProcess},
    {"_wsystem", C::kTaskEnvironmentRequired, kProcess},

    // File APIs that resolve relative names against the working directory.
    {"fopen", C::kFilePathRequiresAbsolute, kWrapPath},
    {"freopen", C::kFilePathRequiresAbsolute, kWrapPath},
    {"_wfopen", C::kFilePathRequiresAbsolute, kWrapPath},
    {"open", C::kFilePathRequiresAbsolute, kWrapPath},
    {"creat", C::kFilePathRequiresAbsolute, kWrapPath},
    {"stat", C::kFilePathRequiresAbsolute, kWrapPath},
    {"lstat", C::kFilePathRequiresAbsolute, kWrapPath},
    {"access", C::kFilePathRequiresAbsolute, kWrapPath},
    {"mkdir", C::kFilePathRequiresAbsolute, kWrapPath},
    {"rmdir", C::kFilePathRequiresAbsolute, kWrapPath},
    {"unlink", C::kFilePathRequiresAbsolute, kWrapPath},
    {"remove", C::kFilePathRequiresAbsolute, kWrapPath},
    {"rename", C::kFilePathRequiresAbsolute, kWrapPath},
    {"truncate", C::kFilePathRequiresAbsolute, kWrapPath},
    {"chmod", C::kFilePathRequiresAbsolute, kWrapPath},
    {"chown", C::kFilePathRequiresAbsolute, kWrapPath},
    {"opendir", C::kFilePathRequiresAbsolute, kWrapPath},
    {"CreateFileW", C::kFilePathRequiresAbsolute, kWrapPath},
    {"DeleteFileW", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::ifstream", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::ofstream", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::fstream", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::exists", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::status", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::is_directory", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::is_regular_file", C::kFilePathRequiresAbsolute,
     kWrapPath},
    {"std::filesystem::file_size", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::create_directory", C::kFilePathRequiresAbsolute,
     kWrapPath},
    {"std::filesystem::create_directories", C::kFilePathRequiresAbsolute,
     kWrapPath},
    {"std::filesystem::remove", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::remove_all", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::rename", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::copy", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::copy_file", C::kFilePathRequiresAbsolute, kWrapPath},
    {"std::filesystem::directory_iterator", C::kFilePathRequiresAbsolute,
     kWrapPath},
    {"std::filesystem::recursive_directory_iterator",
     C::kFilePathRequiresAbsolute, kWrapPath},

    // Console I/O, dynamic loading, and functions with hidden static state.
    {"std::cout", C::kPotentialIssue, kOutput},
    {"std::cerr", C::kPotentialIssue, kOutput},
    {"std::wcout", C::kPotentialIssue, kOutput},
    {"std::wcerr", C::kPotentialIssue, kOutput},
    {"printf", C::kPotentialIssue, kOutput},
    {"puts", C::kPotentialIssue, kOutput},
    {"std::cin", C::kPotentialIssue, kInput},
    {"scanf", C::kPotentialIssue, kInput},
    {"getchar", C::kPotentialIssue, kInput},
    {"dlopen", C::kPotentialIssue, kLoad},
    {"LoadLibraryW", C::kPotentialIssue, kLoad},
    {"strtok", C::kPotentialIssue, kStatic},
    {"strerror", C::kPotentialIssue, kStatic},
    {"localtime", C::kPotentialIssue, kStatic},
    {"gmtime", C::kPotentialIssue, kStatic},
    {"rand", C::kPotentialIssue, kStatic},
    {"srand", C::kPotentialIssue, "Reseeds a process-wide generator"},
};

using Index = absl::flat_hash_map<std::string_view, const UnsafeApi*>;

const Index& GetIndex() {
  static const absl::NoDestructor<Index> index([] {
    Index result;
    for (const UnsafeApi& api : kUnsafeApis) {
      const auto [it, ok] = result.emplace(api.symbol, &api);
      CHECK(ok) << "duplicate unsafe API " << api.symbol;
    }
    return result;
  }());
  return *index;
}

[[nodiscard]] constexpr bool IsIdentifierStart(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

[[nodiscard]] constexpr bool IsIdentifierChar(const char ch) {
  return IsIdentifierStart(ch) || (ch >= '0' && ch <= '9');
}

// Length of a raw string literal prefix such as R" or u8R" at the start of
// rest, or zero.
[[nodiscard]] std::size_t RawStringPrefix(const std::string_view rest) {
  for (const std::string_view prefix :
       {"R\"", "u8R\"", "uR\"", "UR\"", "LR\""}) {
    if (absl::StartsWith(rest, prefix)) return prefix.length();
  }
  return 0;
}

}  // namespace

std::string_view DiagnosticId(const UnsafeApiCategory category) {
  switch (category) {
    case UnsafeApiCategory::kCriticalError:
      return "TSK9999";
    case UnsafeApiCategory::kTaskEnvironmentRequired:
      return "TSK9998";
    case UnsafeApiCategory::kFilePathRequiresAbsolute:
      return "TSK9997";
    case UnsafeApiCategory::kPotentialIssue:
      return "TSK9996";
  }
  LOG(FATAL) << "invalid category " << static_cast<int>(category);
}

absl::Span<const UnsafeApi> UnsafeApis() { return kUnsafeApis; }

const UnsafeApi* absl_nullable FindUnsafeApi(std::string_view symbol) {
  absl::ConsumePrefix(&symbol, "::");
  const Index& index = GetIndex();
  auto it = index.find(symbol);
  if (it != index.end()) return it->second;
  // C library functions in namespace std.
  if (absl::ConsumePrefix(&symbol, "std::") &&
      !absl::StrContains(symbol, "::")) {
    it = index.find(symbol);
    if (it != index.end()) return it->second;
  }
  return nullptr;
}

std::string FormatDiagnostic(const UnsafeApi& api) {
  const std::string_view id = DiagnosticId(api.category);
  switch (api.category) {
    case UnsafeApiCategory::kCriticalError:
      return absl::StrFormat(
          "%s: Symbol '%s' is banned in multithreadable tasks: %s", id,
          api.symbol, api.advice);
    case UnsafeApiCategory::kTaskEnvironmentRequired:
      return absl::StrFormat(
          "%s: Symbol '%s' requires TaskEnvironment alternative: %s", id,
          api.symbol, api.advice);
    case UnsafeApiCategory::kFilePathRequiresAbsolute:
      return absl::StrFormat("%s: Symbol '%s' requires absolute path: %s", id,
                             api.symbol, api.advice);
    case UnsafeApiCategory::kPotentialIssue:
      return absl::StrFormat(
          "%s: Symbol '%s' may cause threading issues: %s", id, api.symbol,
          api.advice);
  }
  LOG(FATAL) << "invalid category " << static_cast<int>(api.category);
}

std::vector<UnsafeApiUse> FindUnsafeApiUses(const std::string_view source) {
  std::vector<UnsafeApiUse> result;
  const std::size_t n = source.size();
  int line = 1;
  std::size_t line_start = 0;
  // Position of the last character that isn’t whitespace and isn’t part of a
  // comment, or npos.
  std::size_t previous = std::string_view::npos;
  const auto after_member_access = [source, &previous] {
    if (previous == source.npos) return false;
    if (source[previous] == '.') return true;
    return source[previous] == '>' && previous > 0 &&
           source[previous - 1] == '-';
  };
  std::size_t i = 0;
  while (i < n) {
    const char ch = source[i];
    const std::string_view rest = source.substr(i);
    const std::size_t raw_prefix = RawStringPrefix(rest);
    if (ch == '\n') {
      ++line;
      line_start = ++i;
    } else if (absl::StartsWith(rest, "//")) {
      const std::size_t end = source.find('\n', i);
      i = end == source.npos ? n : end;
    } else if (absl::StartsWith(rest, "/*")) {
      const std::size_t close = source.find("*/", i + 2);
      const std::size_t end = close == source.npos ? n : close + 2;
      for (; i < end; ++i) {
        if (source[i] == '\n') {
          ++line;
          line_start = i + 1;
        }
      }
    } else if (ch == '"' || ch == '\'') {
      // Ordinary literals end at the line end unless it is escaped.
      for (++i; i < n && source[i] != ch && source[i] != '\n'; ++i) {
        if (source[i] == '\\' && i + 1 < n) {
          ++i;
          if (source[i] == '\n') {
            ++line;
            line_start = i + 1;
          }
        }
      }
      if (i < n && source[i] == ch) ++i;
      previous = i - 1;
    } else if (raw_prefix > 0) {
      // R"delim(...)delim" ends only at the matching delimiter.
      const std::size_t open = source.find('(', i + raw_prefix);
      std::size_t end = n;
      if (open != source.npos) {
        const std::string closing = absl::StrCat(
            ")", source.substr(i + raw_prefix, open - i - raw_prefix), "\"");
        const std::size_t close = source.find(closing, open + 1);
        if (close != source.npos) end = close + closing.length();
      }
      for (; i < end; ++i) {
        if (source[i] == '\n') {
          ++line;
          line_start = i + 1;
        }
      }
      previous = i - 1;
    } else if (IsIdentifierStart(ch) || absl::StartsWith(rest, "::")) {
      const std::size_t begin = i;
      while (i < n) {
        if (IsIdentifierChar(source[i])) {
          ++i;
        } else if (source.substr(i, 2) == "::") {
          i += 2;
        } else {
          break;
        }
      }
      const std::string_view token = source.substr(begin, i - begin);
      if (!after_member_access()) {
        const UnsafeApi* absl_nullable const api = FindUnsafeApi(token);
        if (api != nullptr) {
          result.push_back(
              {api, line, static_cast<int>(begin - line_start + 1)});
        }
      }
      previous = i - 1;
    } else if (IsIdentifierChar(ch)) {
      // Numbers, including suffixes and digit separators such as 0x1'000u.
      while (i < n && (IsIdentifierChar(source[i]) || source[i] == '.' ||
                       source[i] == '\'')) {
        ++i;
      }
      previous = i - 1;
    } else {
      if (!absl::ascii_isspace(static_cast<unsigned char>(ch))) previous = i;
      ++i;
    }
  }
  return result;
}

}  // namespace taskenv
