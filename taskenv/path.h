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

#ifndef TASKENV_PATH_H_
#define TASKENV_PATH_H_

#include "taskenv/platform.h"

// Textual path grammar.  Nothing in here touches the file system or the
// working directory of the process.

namespace taskenv {

[[nodiscard]] constexpr bool IsDirectorySeparator(const NativeChar ch) {
  return ch == kSeparator || ch == kAltSeparator;
}

// Whether the path doesn’t depend on the current directory in the relative
// sense.  On Windows, this includes root-relative names such as \foo and
// drive-relative names such as C:foo, which still depend on the current drive
// or the current directory of a drive.
[[nodiscard]] bool IsPathRooted(NativeStringView path);

// Whether the path identifies a location without reference to any current
// directory or drive.  On Windows, these are drive-absolute names (C:\foo),
// UNC names (\\server\share), and device names (\\?\C:\foo, \\.\pipe).  On
// POSIX systems, these are names starting with a slash.
[[nodiscard]] bool IsPathFullyQualified(NativeStringView path);

// Combine two paths textually.  If path is rooted, return it unchanged.  If
// either argument is empty, return the other one.  Otherwise, join them with
// exactly one separator unless there is already a separator at the seam.
// This never fails, even if path contains characters that the file system
// wouldn’t accept.
NativeString CombinePaths(NativeStringView base, NativeStringView path);

struct ScanResult final {
  // The path contains a "." or ".." segment or two consecutive separators
  // outside the first two characters.
  bool has_relative_segment_or_consecutive_separators = false;

  // The path contains the alternate separator "/".  It is only relevant on
  // Windows, where it has to be normalized to a backslash.
  bool has_alt_separator = false;
};

// Scan the path once, without allocating.  Names that merely start with dots,
// such as .git or ..., don’t count as relative segments.
[[nodiscard]] ScanResult ScanPath(NativeStringView path);

// Whether GetFullPath would return something different from the path.  This
// is the case if ScanPath found a relative segment or consecutive separators,
// or on Windows if it found an alternate separator.
[[nodiscard]] bool NeedsNormalization(NativeStringView path);

// Resolve relative segments and normalize separators of a rooted path, the
// same way the system path library does for full paths.  On Windows, this
// calls GetFullPathNameW.  On POSIX systems, the algorithm is purely lexical
// and doesn’t resolve symbolic links.  The result is always rooted if the
// argument is.
NativeString GetFullPath(NativeStringView path);

}  // namespace taskenv

#endif  // TASKENV_PATH_H_
