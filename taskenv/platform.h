// Copyright 2021, 2023-2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TASKENV_PLATFORM_H_
#define TASKENV_PLATFORM_H_

#if !defined __cplusplus || __cplusplus < 201703L
#  error this file requires at least C++17
#endif

#include <string>
#include <string_view>
#include <type_traits>

namespace taskenv {

constexpr inline bool kWindows =
#ifdef _WIN32
    true
#else
    false
#endif
    ;

// Linux file systems are case-sensitive.  The default file systems on Windows
// and macOS are not.
constexpr inline bool kCaseSensitiveFileSystem =
#if defined _WIN32 || defined __APPLE__
    false
#else
    true
#endif
    ;

#ifdef _WIN32
#  define TASKENV_NATIVE_LITERAL(literal) L##literal
#  define TASKENV_MAIN wmain
#else
#  define TASKENV_NATIVE_LITERAL(literal) literal
#  define TASKENV_MAIN main
#endif

using NativeChar = std::conditional_t<kWindows, wchar_t, char>;
using NativeString = std::basic_string<NativeChar>;
using NativeStringView = std::basic_string_view<NativeChar>;

inline constexpr NativeChar kSeparator = kWindows
                                             ? TASKENV_NATIVE_LITERAL('\\')
                                             : TASKENV_NATIVE_LITERAL('/');

// On POSIX systems this is the same as kSeparator.
inline constexpr NativeChar kAltSeparator = TASKENV_NATIVE_LITERAL('/');

}  // namespace taskenv

#endif  // TASKENV_PLATFORM_H_
