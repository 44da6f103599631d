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

#include "taskenv/system.h"

#ifdef _WIN32
#  ifndef UNICODE
#    define UNICODE
#  endif
#  ifndef _UNICODE
#    define _UNICODE
#  endif
#  ifndef STRICT
#    define STRICT
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <fcntl.h>
#  include <spawn.h>
#  include <sys/stat.h>
#  include <sys/types.h>
#  include <sys/wait.h>
#  include <unistd.h>
#endif

#ifdef __APPLE__
#  include <crt_externs.h>  // for _NSGetEnviron
#endif

#include <algorithm>  // IWYU pragma: keep, only on Windows
#include <cstddef>
#include <cstdint>  // IWYU pragma: keep, only on Windows
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <ios>
#include <iostream>
#include <limits>  // IWYU pragma: keep, only on Windows
#include <locale>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/base/attributes.h"
#include "absl/base/nullability.h"
#include "absl/cleanup/cleanup.h"
#include "absl/container/hash_container_defaults.h"
#include "absl/log/check.h"
#include "absl/log/die_if_null.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/time/clock.h"  // IWYU pragma: keep, only on Windows
#include "absl/time/time.h"
#include "absl/types/span.h"

#include "taskenv/absolute_path.h"
#include "taskenv/numeric.h"
#include "taskenv/path.h"
#include "taskenv/platform.h"
#include "taskenv/status.h"
#include "taskenv/strings.h"

namespace taskenv {

absl::StatusOr<std::string> ToNarrow(const NativeStringView string,
                                     [[maybe_unused]] const Encoding encoding) {
  if (string.empty()) return std::string();
#ifdef _WIN32
  if (encoding == Encoding::kAscii) {
    // Windows doesn’t support the ASCII codepage with WC_ERR_INVALID_CHARS.  So
    // we check for non-ASCII first and use UTF-8 in all cases.
    const absl::Status status = CheckAscii(string);
    if (!status.ok()) return status;
  }
  constexpr UINT codepage = CP_UTF8;
  constexpr DWORD flags = WC_ERR_INVALID_CHARS;
  const absl::StatusOr<int> length =
      CastNumber<int>(string.length(), "String length");
  if (!length.ok()) return length.status();
  int result = ::WideCharToMultiByte(codepage, flags, string.data(), *length,
                                     nullptr, 0, nullptr, nullptr);
  if (result == 0) {
    return WindowsStatus(
        "WideCharToMultiByte(%d, %#x, ..., %d, nullptr, 0, nullptr, nullptr)",
        codepage, flags, *length);
  }
  std::string buffer(static_cast<std::size_t>(result), '\0');
  result = ::WideCharToMultiByte(codepage, flags, string.data(), *length,
                                 buffer.data(), result, nullptr, nullptr);
  if (result == 0) {
    return WindowsStatus(
        "WideCharToMultiByte(%d, %#x, ..., %d, ..., %d, nullptr, nullptr)",
        codepage, flags, *length, buffer.size());
  }
  return buffer.substr(0, static_cast<std::size_t>(result));
#else
  return std::string(string);
#endif
}

absl::StatusOr<NativeString> ToNative(
    const std::string_view string, [[maybe_unused]] const Encoding encoding) {
  if (string.empty()) return NativeString();
#ifdef _WIN32
  if (encoding == Encoding::kAscii) {
    const absl::Status status = CheckAscii(string);
    if (!status.ok()) return status;
  }
  constexpr UINT codepage = CP_UTF8;
  constexpr DWORD flags = MB_ERR_INVALID_CHARS;
  const absl::StatusOr<int> length =
      CastNumber<int>(string.length(), "String length");
  if (!length.ok()) return length.status();
  // A UTF-8 string never has fewer bytes than its UTF-16 code units.
  NativeString buffer(string.length(), L'\0');
  const int result = ::MultiByteToWideChar(codepage, flags, string.data(),
                                           *length, buffer.data(), *length);
  if (result == 0) {
    return WindowsStatus("MultiByteToWideChar(%d, %#x, ..., %d, ..., %d)",
                         codepage, flags, *length, *length);
  }
  return buffer.substr(0, static_cast<std::size_t>(result));
#else
  return NativeString(string);
#endif
}

absl::StatusOr<AbsolutePath> CurrentDirectory() {
#ifdef _WIN32
  DWORD size = ::GetCurrentDirectoryW(0, nullptr);
  if (size == 0) return WindowsStatus("GetCurrentDirectoryW(0, nullptr)");
  std::wstring buffer(size, L'\0');
  const DWORD result = ::GetCurrentDirectoryW(size, buffer.data());
  if (result == 0) return WindowsStatus("GetCurrentDirectoryW(%d, ...)", size);
  if (result >= size) {
    return absl::OutOfRangeError(absl::StrFormat(
        "Working directory grew to %d characters while reading it", result));
  }
  buffer.resize(result);
  return AbsolutePath::FromString(buffer);
#else
  // Assume that we always run on an OS that allocates a buffer when passed a
  // null pointer.
  char* const absl_nullable ptr = getcwd(nullptr, 0);
  if (ptr == nullptr) return ErrnoStatus("getcwd(nullptr, 0)");
  const absl::Cleanup cleanup = [ptr] { std::free(ptr); };
  // See the Linux man page for getcwd(3) why this can happen.
  if (*ptr != '/') {
    return absl::NotFoundError(absl::StrFormat(
        "Current working directory %s is unreachable", Quote(ptr)));
  }
  return AbsolutePath::FromString(ptr);
#endif
}

absl::StatusOr<AbsolutePath> MakeAbsolute(const NativeStringView name) {
  if (IsPathFullyQualified(name)) return AbsolutePath::FromString(name);
  if constexpr (kWindows) {
    // GetFullPathNameW knows about the current directories of all drives.
    return AbsolutePath::FromString(GetFullPath(name));
  }
  const absl::StatusOr<AbsolutePath> cwd = CurrentDirectory();
  if (!cwd.ok()) return cwd.status();
  return AbsolutePath::Combine(name, *cwd);
}

absl::StatusOr<std::string> ReadFile(const AbsolutePath& file) {
  std::ifstream stream(file.string(), std::ios::in | std::ios::binary);
  if (!stream.is_open() || !stream.good()) {
    return absl::NotFoundError(
        absl::StrFormat("Cannot open file %v for reading", file));
  }
  stream.imbue(std::locale::classic());
  std::ostringstream buffer;
  buffer.imbue(std::locale::classic());
  buffer << stream.rdbuf();
  if (!buffer.good() || stream.bad()) {
    return absl::DataLossError(absl::StrFormat("Cannot read file %v", file));
  }
  return buffer.str();
}

absl::Status WriteFile(const AbsolutePath& file,
                       const std::string_view contents) {
  std::ofstream stream(file.string(),
                       std::ios::out | std::ios::trunc | std::ios::binary);
  if (!stream.is_open() || !stream.good()) {
    return absl::UnknownError(
        absl::StrFormat("Cannot open file %v for writing", file));
  }
  stream.imbue(std::locale::classic());
  const absl::StatusOr<std::streamsize> count =
      CastNumber<std::streamsize>(contents.size(), "Content size");
  if (!count.ok()) return count.status();
  stream.write(contents.data(), *count);
  stream.flush();
  if (!stream.good()) {
    return absl::DataLossError(
        absl::StrFormat("Cannot write %d bytes to file %v", *count, file));
  }
  return absl::OkStatus();
}

namespace {

class EnvironmentBlock final {
 private:
  using Pointer =
      std::conditional_t<kWindows, wchar_t*, const char* const absl_nullable*>;

 public:
  static absl::StatusOr<EnvironmentBlock> Current() {
#if defined _WIN32
    const absl_nullable LPWCH envp = ::GetEnvironmentStringsW();
    if (envp == nullptr) {
      // The documentation doesn’t say that GetLastError is meaningful here.
      return absl::ResourceExhaustedError("GetEnvironmentStringsW failed");
    }
    return EnvironmentBlock(envp);
#elif defined __APPLE__
    // See environ(7) why this is necessary.
    return EnvironmentBlock(*_NSGetEnviron());
#else
    return EnvironmentBlock(environ);
#endif
  }

  EnvironmentBlock(const EnvironmentBlock&) = delete;
  EnvironmentBlock& operator=(const EnvironmentBlock&) = delete;

  EnvironmentBlock(EnvironmentBlock&& other)
      : start_(std::exchange(other.start_, nullptr)),
        next_(std::exchange(other.next_, nullptr)) {}

  EnvironmentBlock& operator=(EnvironmentBlock&& other) = delete;

  ~EnvironmentBlock() noexcept {
    if (start_ == nullptr) return;
#ifdef _WIN32
    if (!::FreeEnvironmentStringsW(start_)) {
      LOG(ERROR) << WindowsStatus("FreeEnvironmentStringsW");
    }
#endif
  }

  [[nodiscard]] bool Next(NativeStringView& element) {
    CHECK_NE(next_, nullptr);
#ifdef _WIN32
    element = next_;
    next_ += element.length() + 1;
    return !element.empty();
#else
    if (*next_ == nullptr) return false;
    element = *next_;
    ++next_;
    return true;
#endif
  }

 private:
  explicit EnvironmentBlock(const absl_nonnull Pointer ptr)
      : start_(ABSL_DIE_IF_NULL(ptr)), next_(ptr) {}

  absl_nullable Pointer start_;
  absl_nullable Pointer next_;
};

}  // namespace

absl::StatusOr<Environment> Environment::Current() {
  absl::StatusOr<EnvironmentBlock> block = EnvironmentBlock::Current();
  if (!block.ok()) return block.status();
  Map map;
  // Names of the “per-drive current directory” variables on Windows start with
  // an equals sign, cf.
  // https://devblogs.microsoft.com/oldnewthing/20100506-00/?p=14133.  We skip
  // them.
  NativeStringView var;
  while (block->Next(var)) {
    if (kWindows && var.front() == TASKENV_NATIVE_LITERAL('=')) continue;
    const std::size_t i = var.find(TASKENV_NATIVE_LITERAL('='));
    if (i == 0 || i == var.npos) {
      return absl::FailedPreconditionError(
          absl::StrFormat("Invalid environment block entry %s", Quote(var)));
    }
    const NativeStringView key = var.substr(0, i);
    const auto [it, ok] = map.emplace(key, var.substr(i + 1));
    if (!ok) {
      return absl::AlreadyExistsError(
          absl::StrFormat("Duplicate environment variable %s", Quote(key)));
    }
  }
  return Environment(std::move(map));
}

std::optional<NativeString> Environment::Get(
    const NativeStringView name) const {
  const auto it = map_.find(name);
  if (it == map_.end()) return std::nullopt;
  return it->second;
}

absl::Status Environment::Set(const NativeStringView name,
                              const NativeStringView value) {
  const absl::Status status = Check(name, value);
  if (!status.ok()) return status;
  const auto it = map_.find(name);
  if (it == map_.end()) {
    map_.emplace(name, value);
  } else {
    it->second = NativeString(value);
  }
  return absl::OkStatus();
}

std::vector<NativeString> Environment::ToStrings() const {
  std::vector<NativeString> result;
  result.reserve(map_.size());
  for (const auto& [key, value] : map_) {
    result.push_back(key + TASKENV_NATIVE_LITERAL('=') + value);
  }
  absl::c_sort(result);
  return result;
}

absl::Status Environment::Check(const NativeStringView name,
                                const NativeStringView value) {
  if (name.empty()) {
    return absl::InvalidArgumentError("Empty environment variable name");
  }
  if (ContainsNull(name)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Environment variable name %s contains null character", Quote(name)));
  }
  if (name.find(TASKENV_NATIVE_LITERAL('=')) != name.npos) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Environment variable name %s contains equals sign", Quote(name)));
  }
  if (ContainsNull(value)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Value of environment variable %s contains null "
                        "character",
                        Quote(name)));
  }
  return absl::OkStatus();
}

// Environment variable names are case-insensitive only on Windows, even though
// the macOS file system is case-insensitive as well.
static NativeString CanonicalizeEnvironmentVariable(
    const NativeStringView name) {
  if constexpr (kWindows) {
    return FoldCase(name);
  } else {
    return NativeString(name);
  }
}

std::size_t Environment::Hash::operator()(const NativeStringView string) const {
  const absl::DefaultHashContainerHash<NativeString> base;
  return base(CanonicalizeEnvironmentVariable(string));
}

bool Environment::Equal::operator()(const NativeStringView a,
                                    const NativeStringView b) const {
  if constexpr (!kWindows) return a == b;
  return CanonicalizeEnvironmentVariable(a) ==
         CanonicalizeEnvironmentVariable(b);
}

#ifdef _WIN32
// https://docs.microsoft.com/en-us/cpp/cpp/main-function-command-line-args?view=msvc-170#parsing-c-command-line-arguments
// and
// https://docs.microsoft.com/en-us/windows/win32/api/shellapi/nf-shellapi-commandlinetoargvw.
static absl::StatusOr<std::wstring> BuildCommandLine(
    const absl::Span<const std::wstring> args) {
  std::wstring result;
  bool first = true;
  for (const std::wstring& arg : args) {
    if (ContainsNull(arg)) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Argument %s contains null character", Quote(arg)));
    }
    if (!std::exchange(first, false)) result.push_back(L' ');
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == arg.npos) {
      result.append(arg);
      continue;
    }
    result.push_back(L'"');
    const auto end = arg.end();
    for (auto it = arg.begin(); it != end; ++it) {
      const auto begin = it;
      it = std::find_if(it, end, [](wchar_t c) { return c != L'\\'; });
      result.append(begin, it);
      // Backslashes followed by a quotation mark need to be doubled.
      if (it == end || *it == L'"') result.append(begin, it);
      if (it == end) break;
      if (*it == L'"') result.push_back(L'\\');
      result.push_back(*it);
    }
    result.push_back(L'"');
  }
  return result;
}

// Build an environment block that CreateProcessW can use.  See
// https://docs.microsoft.com/en-us/windows/win32/api/processthreadsapi/nf-processthreadsapi-createprocessw.
static std::wstring BuildEnvironmentBlock(
    const absl::Span<const std::wstring> vars) {
  std::wstring result;
  for (const std::wstring& var : vars) {
    CHECK(!ContainsNull(var)) << Quote(var) << " contains null character";
    result.append(var);
    result.push_back(L'\0');
  }
  result.push_back(L'\0');
  return result;
}
#else
static std::vector<char* absl_nullable> Pointers(
    std::vector<std::string>& strings ABSL_ATTRIBUTE_LIFETIME_BOUND) {
  std::vector<char* absl_nullable> ptrs;
  for (std::string& s : strings) {
    CHECK(!ContainsNull(s)) << Quote(s) << " contains null character";
    ptrs.push_back(s.data());
  }
  ptrs.push_back(nullptr);
  return ptrs;
}
#endif

static void FlushEverything() {
  std::cout.flush();
  std::wcout.flush();
  std::cerr.flush();
  std::wcerr.flush();
  if (std::fflush(nullptr) != 0) LOG(ERROR) << ErrnoStatus("fflush(nullptr)");
}

absl::StatusOr<int> Run(const ProcessStartInfo& info) {
  if (info.program.empty()) {
    return absl::InvalidArgumentError("No program to run");
  }
  if (ContainsNull(info.program.value())) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Program %s contains null character", Quote(info.program.value())));
  }
  if (ContainsNull(info.working_directory.value())) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Working directory %s contains null character",
                        Quote(info.working_directory.value())));
  }
  if (info.output_file.has_value() &&
      ContainsNull(info.output_file->value())) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Output file %s contains null character",
                        Quote(info.output_file->value())));
  }
  for (const NativeString& arg : info.args) {
    if (ContainsNull(arg)) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Argument %s contains null character", Quote(arg)));
    }
  }
  std::vector<NativeString> args = {info.program.value()};
  args.insert(args.end(), info.args.cbegin(), info.args.cend());
  std::vector<NativeString> env = info.environment.ToStrings();
  const bool has_deadline = info.deadline < absl::InfiniteFuture();
  const std::optional<AbsolutePath>& output = info.output_file;
  const AbsolutePath& directory = info.working_directory;
  VLOG(1) << "Running " << info.program << " in directory " << directory;
  FlushEverything();
  const absl::Cleanup flush = FlushEverything;
#ifdef _WIN32
  absl::StatusOr<std::wstring> command_line = BuildCommandLine(args);
  if (!command_line.ok()) return command_line.status();
  const BOOL inherit_handles = output.has_value() ? TRUE : FALSE;
  const DWORD flags = CREATE_UNICODE_ENVIRONMENT |
                      (has_deadline ? CREATE_NEW_PROCESS_GROUP : 0);
  std::wstring envp = BuildEnvironmentBlock(env);
  const absl_nullable LPCWSTR dirp =
      directory.empty() ? nullptr : directory.pointer();
  STARTUPINFOW startup_info = {};
  startup_info.cb = sizeof startup_info;
  startup_info.dwFlags = output.has_value() ? STARTF_USESTDHANDLES : 0;
  if (output.has_value()) {
    startup_info.hStdInput = ::GetStdHandle(STD_INPUT_HANDLE);
    if (startup_info.hStdInput == INVALID_HANDLE_VALUE) {
      return WindowsStatus("GetStdHandle(%d)", STD_INPUT_HANDLE);
    }
    constexpr DWORD access = GENERIC_WRITE;
    constexpr DWORD share = FILE_SHARE_READ;
    SECURITY_ATTRIBUTES security = {};
    security.nLength = sizeof security;
    security.bInheritHandle = TRUE;
    constexpr DWORD disposition = CREATE_ALWAYS;
    constexpr DWORD attributes = FILE_ATTRIBUTE_NORMAL;
    startup_info.hStdOutput =
        ::CreateFileW(output->pointer(), access, share, &security, disposition,
                      attributes, nullptr);
    if (startup_info.hStdOutput == INVALID_HANDLE_VALUE) {
      return WindowsStatus("CreateFileW(%s, %#x, %#x, ..., %d, %#x, nullptr)",
                           Quote(output->value()), access, share, disposition,
                           attributes);
    }
    startup_info.hStdError = startup_info.hStdOutput;
  }
  const absl::Cleanup close_output = [&startup_info] {
    if (startup_info.dwFlags & STARTF_USESTDHANDLES) {
      if (!::CloseHandle(startup_info.hStdOutput)) {
        LOG(ERROR) << WindowsStatus("CloseHandle");
      }
    }
  };
  PROCESS_INFORMATION process_info;
  if (!::CreateProcessW(info.program.pointer(), command_line->data(), nullptr,
                        nullptr, inherit_handles, flags, envp.data(), dirp,
                        &startup_info, &process_info)) {
    return WindowsStatus(
        "CreateProcessW(%s, %s, nullptr, nullptr, %d, %#x, ..., %s)",
        Quote(info.program.value()), Quote(*command_line), inherit_handles,
        flags, Quote(directory.value()));
  }
  if (!::CloseHandle(process_info.hThread)) {
    LOG(ERROR) << WindowsStatus("CloseHandle");
  }
  const absl::Cleanup close_handle = [&process_info] {
    if (!::CloseHandle(process_info.hProcess)) {
      LOG(ERROR) << WindowsStatus("CloseHandle");
    }
  };
  const DWORD timeout_ms =
      has_deadline
          ? static_cast<DWORD>(std::clamp(
                absl::ToInt64Milliseconds(info.deadline - absl::Now()),
                std::int64_t{0}, std::int64_t{MAXDWORD - 1}))
          : INFINITE;
  switch (::WaitForSingleObject(process_info.hProcess, timeout_ms)) {
    case WAIT_OBJECT_0:
      break;
    case WAIT_TIMEOUT:
      LOG(WARNING) << "Process timed out, sending CTRL + BREAK";
      if (!::GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT,
                                      process_info.dwProcessId)) {
        LOG(ERROR) << WindowsStatus("GenerateConsoleCtrlEvent(%d, %d)",
                                    CTRL_BREAK_EVENT, process_info.dwProcessId);
      }
      return absl::DeadlineExceededError(absl::StrFormat(
          "Deadline %v exceeded waiting for process", info.deadline));
    default:
      return WindowsStatus("WaitForSingleObject(..., %d)", timeout_ms);
  }
  DWORD code;
  if (!::GetExitCodeProcess(process_info.hProcess, &code)) {
    return WindowsStatus("GetExitCodeProcess");
  }
  // Undo the conversion of negative exit codes to large DWORD values, assuming
  // two’s complement representation.
  static_assert(sizeof(int) == sizeof(DWORD));
  static_assert(std::numeric_limits<int>::digits == 31);
  const int code_int = static_cast<int>(code);
  CHECK((code == 0) == (code_int == 0));
  return code_int;
#else
  if (has_deadline) {
    return absl::UnimplementedError(
        absl::StrFormat("Finite deadline %v unsupported", info.deadline));
  }
  posix_spawn_file_actions_t actions;
  if (posix_spawn_file_actions_init(&actions) != 0) {
    return ErrnoStatus("posix_spawn_file_actions_init");
  }
  const absl::Cleanup cleanup = [&actions] {
    if (posix_spawn_file_actions_destroy(&actions) != 0) {
      LOG(ERROR) << ErrnoStatus("posix_spawn_file_actions_destroy");
    }
  };
  if (output.has_value()) {
    constexpr int oflag = O_WRONLY | O_CREAT | O_TRUNC | O_NOCTTY;
    constexpr mode_t mode = S_IRUSR | S_IWUSR;
    if (posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO,
                                         output->pointer(), oflag,
                                         mode) != 0) {
      return ErrnoStatus(
          "posix_spawn_file_actions_addopen(..., %d, %s, %#x, %#04o)",
          STDOUT_FILENO, Quote(output->value()), oflag, mode);
    }
    if (posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO,
                                         STDERR_FILENO) != 0) {
      return ErrnoStatus("posix_spawn_file_actions_adddup2(..., %d, %d)",
                         STDOUT_FILENO, STDERR_FILENO);
    }
  }
  if (!directory.empty()) {
    // TODO: Switch to posix_spawn_file_actions_addchdir once that’s widely
    // available.
#  pragma GCC diagnostic push
#  pragma GCC diagnostic ignored "-Wdeprecated-declarations"
    const int result =
        posix_spawn_file_actions_addchdir_np(&actions, directory.pointer());
#  pragma GCC diagnostic pop
    if (result != 0) {
      return ErrorStatus(std::error_code(result, std::system_category()),
                         "posix_spawn_file_actions_addchdir_np(..., %s)",
                         Quote(directory.value()));
    }
  }
  const std::vector<char* absl_nullable> argv = Pointers(args);
  const std::vector<char* absl_nullable> envp = Pointers(env);
  pid_t pid;
  const int error = posix_spawn(&pid, info.program.pointer(), &actions,
                                nullptr, argv.data(), envp.data());
  if (error != 0) {
    return ErrorStatus(std::error_code(error, std::system_category()),
                       "posix_spawn(..., %s)", Quote(info.program.value()));
  }
  int wstatus;
  const pid_t status = waitpid(pid, &wstatus, 0);
  if (status != pid) return ErrnoStatus("waitpid(%d, ..., 0)", pid);
  return WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : 0xFF;
#endif
}

}  // namespace taskenv
