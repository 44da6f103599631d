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

#ifndef TASKENV_STRINGS_H_
#define TASKENV_STRINGS_H_

#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/strip.h"

#include "taskenv/platform.h"

namespace taskenv {

[[nodiscard]] inline constexpr bool ConsumePrefix(
    std::string_view& string, const std::string_view prefix) {
  return absl::ConsumePrefix(&string, prefix);
}

[[nodiscard]] inline constexpr bool ConsumePrefix(
    std::wstring_view& string, const std::wstring_view prefix) {
  const std::wstring_view::size_type n = prefix.length();
  if (string.substr(0, n) != prefix) return false;
  string.remove_prefix(n);
  return true;
}

std::string Quote(std::string_view string);
std::string Quote(std::wstring_view string);

absl::Status CheckAscii(std::string_view string);
absl::Status CheckAscii(std::wstring_view string);

[[nodiscard]] inline bool ContainsNull(const std::string_view string) {
  return string.find('\0') != string.npos;
}

[[nodiscard]] inline bool ContainsNull(const std::wstring_view string) {
  return string.find(L'\0') != string.npos;
}

// Return the string with letters mapped to upper case, so that two strings
// that differ only in case map to the same result.  On Windows this uses the
// invariant locale, like the ordinal case-insensitive comparisons of the
// system.  Elsewhere only ASCII letters are mapped.
NativeString FoldCase(NativeStringView string);

}  // namespace taskenv

#endif  // TASKENV_STRINGS_H_
