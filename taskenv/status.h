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

#ifndef TASKENV_STATUS_H_
#define TASKENV_STATUS_H_

#include <string_view>
#include <system_error>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"

namespace taskenv {

// Convert an error code to a status.  The message names the failing function
// call.  Errors in the generic category keep their canonical status code.
absl::Status MakeErrorStatus(const std::error_code& code,
                             std::string_view call);

template <typename... Ts>
absl::Status ErrorStatus(const std::error_code& code,
                         const absl::FormatSpec<Ts...>& format,
                         const Ts&... args) {
  return MakeErrorStatus(code, absl::StrFormat(format, args...));
}

[[nodiscard]] std::error_code ErrnoError();

template <typename... Ts>
absl::Status ErrnoStatus(const absl::FormatSpec<Ts...>& format,
                         const Ts&... args) {
  const std::error_code code = ErrnoError();
  return ErrorStatus(code, format, args...);
}

#ifdef _WIN32
[[nodiscard]] std::error_code WindowsError();

template <typename... Ts>
absl::Status WindowsStatus(const absl::FormatSpec<Ts...>& format,
                           const Ts&... args) {
  const std::error_code code = WindowsError();
  return ErrorStatus(code, format, args...);
}
#endif

}  // namespace taskenv

#endif  // TASKENV_STATUS_H_
