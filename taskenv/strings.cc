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

#include "taskenv/strings.h"

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

#include <iomanip>
#include <ios>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include "absl/algorithm/container.h"
#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

#include "taskenv/numeric.h"
#include "taskenv/platform.h"
#include "taskenv/status.h"

namespace taskenv {

namespace {

template <typename Char>
std::string DoQuote(const std::basic_string_view<Char> string) {
  std::basic_ostringstream<Char> stream;
  stream.exceptions(std::ios::badbit | std::ios::failbit | std::ios::eofbit);
  stream.imbue(std::locale::classic());
  stream << std::quoted(string) << std::flush;
  return absl::StrFormat("%s", stream.str());
}

inline constexpr unsigned int kMaxAscii{0x7F};

template <typename Char>
absl::Status DoCheckAscii(const std::basic_string_view<Char> string) {
  using Traits = typename std::basic_string_view<Char>::traits_type;
  const auto it = absl::c_find_if(string, [](const Char ch) {
    return Traits::lt(ch, Char{0}) || Traits::lt(Char{kMaxAscii}, ch);
  });
  if (it != string.end()) {
    const auto val = static_cast<std::make_unsigned_t<Char>>(*it);
    return absl::InvalidArgumentError(
        absl::StrCat("non-ASCII character U+", absl::Hex(val, absl::kZeroPad4),
                     " in string"));
  }
  return absl::OkStatus();
}

}  // namespace

std::string Quote(const std::string_view string) { return DoQuote(string); }
std::string Quote(const std::wstring_view string) { return DoQuote(string); }

absl::Status CheckAscii(const std::string_view string) {
  return DoCheckAscii(string);
}

absl::Status CheckAscii(const std::wstring_view string) {
  return DoCheckAscii(string);
}

NativeString FoldCase(const NativeStringView string) {
  if (string.empty()) return {};
#ifdef _WIN32
  constexpr LCID locale = LOCALE_INVARIANT;
  constexpr DWORD flags = LCMAP_UPPERCASE;
  const absl::StatusOr<int> length_or =
      CastNumber<int>(string.length(), "String length");
  CHECK_OK(length_or);
  const int length = *length_or;
  int result = ::LCMapStringW(locale, flags, string.data(), length, nullptr, 0);
  CHECK_GT(result, 0) << WindowsStatus(
      "LCMapStringW(%d, %#x, ..., %d, nullptr, 0)", locale, flags, length);
  std::wstring buffer(result, L'\0');
  result = ::LCMapStringW(locale, flags, string.data(), length, buffer.data(),
                          result);
  CHECK_GT(result, 0) << WindowsStatus(
      "LCMapStringW(%d, %#x, ..., %d, ..., %d)", locale, flags, length,
      buffer.size());
  return buffer.substr(0, result);
#else
  return absl::AsciiStrToUpper(string);
#endif
}

}  // namespace taskenv
