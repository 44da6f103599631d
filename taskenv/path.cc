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

#include "taskenv/path.h"

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
#endif

#include <cstddef>
#include <string>
#include <string_view>

#include "absl/log/check.h"
#include "absl/strings/ascii.h"

#include "taskenv/platform.h"
#include "taskenv/status.h"
#include "taskenv/strings.h"

namespace taskenv {

[[nodiscard]] static bool IsDriveLetter(const NativeChar ch) {
  return ch >= 0 && ch <= 0x7F &&
         absl::ascii_isalpha(static_cast<unsigned char>(ch));
}

bool IsPathRooted(const NativeStringView path) {
  if (path.empty()) return false;
  if (IsDirectorySeparator(path.front())) return true;
  if constexpr (kWindows) {
    return path.length() >= 2 && IsDriveLetter(path[0]) &&
           path[1] == TASKENV_NATIVE_LITERAL(':');
  }
  return false;
}

bool IsPathFullyQualified(const NativeStringView path) {
  if constexpr (kWindows) {
    if (path.length() < 2) return false;
    if (IsDirectorySeparator(path[0])) {
      // UNC names and device names.
      return path[1] == TASKENV_NATIVE_LITERAL('?') ||
             IsDirectorySeparator(path[1]);
    }
    return path.length() >= 3 && IsDriveLetter(path[0]) &&
           path[1] == TASKENV_NATIVE_LITERAL(':') &&
           IsDirectorySeparator(path[2]);
  } else {
    return !path.empty() && path.front() == kSeparator;
  }
}

NativeString CombinePaths(const NativeStringView base,
                          const NativeStringView path) {
  if (path.empty()) return NativeString(base);
  if (base.empty() || IsPathRooted(path)) return NativeString(path);
  NativeString result(base);
  if (!IsDirectorySeparator(base.back()) &&
      !IsDirectorySeparator(path.front())) {
    result.push_back(kSeparator);
  }
  result.append(path);
  return result;
}

ScanResult ScanPath(const NativeStringView path) {
  ScanResult result;
  const std::size_t length = path.length();
  bool previous_was_separator = false;
  for (std::size_t i = 0; i < length; ++i) {
    const bool is_separator = IsDirectorySeparator(path[i]);
    if (is_separator) {
      if (path[i] == kAltSeparator) result.has_alt_separator = true;
      // The first two characters may both be separators in UNC names.
      if (previous_was_separator && i > 1) {
        result.has_relative_segment_or_consecutive_separators = true;
        return result;
      }
      const std::size_t dot = i + 1;
      if (dot < length && path[dot] == TASKENV_NATIVE_LITERAL('.')) {
        const std::size_t after_dot = dot + 1;
        if (after_dot == length || IsDirectorySeparator(path[after_dot])) {
          result.has_relative_segment_or_consecutive_separators = true;
          return result;
        }
        if (path[after_dot] == TASKENV_NATIVE_LITERAL('.')) {
          const std::size_t after_dots = after_dot + 1;
          if (after_dots == length || IsDirectorySeparator(path[after_dots])) {
            result.has_relative_segment_or_consecutive_separators = true;
            return result;
          }
        }
      }
    }
    previous_was_separator = is_separator;
  }
  return result;
}

bool NeedsNormalization(const NativeStringView path) {
  const ScanResult scan = ScanPath(path);
  // On POSIX systems the alternate separator is the separator.
  return scan.has_relative_segment_or_consecutive_separators ||
         (kSeparator != kAltSeparator && scan.has_alt_separator);
}

#ifdef _WIN32
NativeString GetFullPath(const NativeStringView path) {
  if (path.empty()) return {};
  // Extended-length names are passed to the file system unchanged.
  if (path.substr(0, 4) == L"\\\\?\\") return NativeString(path);
  // GetFullPathNameW would stop at the first null character.
  if (ContainsNull(path)) return NativeString(path);
  const std::wstring string(path);
  DWORD size = ::GetFullPathNameW(string.c_str(), 0, nullptr, nullptr);
  CHECK_GT(size, 0) << WindowsStatus("GetFullPathNameW(%s, 0, nullptr, nullptr)",
                                     Quote(string));
  std::wstring buffer(size, L'\0');
  const DWORD result =
      ::GetFullPathNameW(string.c_str(), size, buffer.data(), nullptr);
  CHECK_GT(result, 0) << WindowsStatus("GetFullPathNameW(%s, %d, ..., nullptr)",
                                       Quote(string), size);
  CHECK_LT(result, size) << "buffer of size " << size << " too small";
  buffer.resize(result);
  return buffer;
}
#else
// Remove "//", "/./", and "/../" by copying every character that isn’t part of
// such a sequence.  A parent segment removes the preceding element, but never
// the root.
static NativeString RemoveRelativeSegments(const NativeStringView path,
                                           const std::size_t root_length) {
  std::size_t skip = root_length;
  // Treat the separator that ends the root like the others, so that a first
  // element "." or ".." is recognized.
  if (skip > 0 && IsDirectorySeparator(path[skip - 1])) --skip;
  const std::size_t length = path.length();
  NativeString result(path.substr(0, skip));
  for (std::size_t i = skip; i < length; ++i) {
    const NativeChar ch = path[i];
    if (IsDirectorySeparator(ch) && i + 1 < length) {
      if (IsDirectorySeparator(path[i + 1])) continue;
      if ((i + 2 == length || IsDirectorySeparator(path[i + 2])) &&
          path[i + 1] == '.') {
        ++i;
        continue;
      }
      if (i + 2 < length &&
          (i + 3 == length || IsDirectorySeparator(path[i + 3])) &&
          path[i + 1] == '.' && path[i + 2] == '.') {
        std::size_t s = result.length();
        bool found = false;
        while (s > skip) {
          --s;
          if (IsDirectorySeparator(result[s])) {
            // Keep the root separator if the parent segment comes last.
            result.resize(i + 3 >= length && s == skip ? s + 1 : s);
            found = true;
            break;
          }
        }
        if (!found) result.resize(skip);
        i += 2;
        continue;
      }
    }
    result.push_back(ch);
  }
  // We might have removed the separator that ends the root.
  if (skip != root_length && result.length() < root_length) {
    result.push_back(path[root_length - 1]);
  }
  return result;
}

NativeString GetFullPath(const NativeStringView path) {
  if (path.empty()) return {};
  const std::size_t root_length = IsPathRooted(path) ? 1 : 0;
  NativeString result = RemoveRelativeSegments(path, root_length);
  if (result.empty()) result.push_back(kSeparator);
  return result;
}
#endif

}  // namespace taskenv
