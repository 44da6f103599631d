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

#ifndef TASKENV_NUMERIC_H_
#define TASKENV_NUMERIC_H_

#include <limits>
#include <string_view>
#include <type_traits>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

namespace taskenv {

// Whether R can represent n.  Compares without the usual arithmetic
// conversions, so that -1 is never in range for an unsigned type.
template <typename R, typename T>
[[nodiscard]] constexpr bool InRange(const T n) {
  static_assert(std::is_integral_v<R>);
  static_assert(std::is_integral_v<T>);
  using RL = std::numeric_limits<R>;
  using TL = std::numeric_limits<T>;
  if constexpr (RL::is_signed == TL::is_signed) {
    return n >= RL::min() && n <= RL::max();
  }
  if constexpr (RL::is_signed && !TL::is_signed) {
    return n <= std::make_unsigned_t<R>{RL::max()};
  }
  if constexpr (!RL::is_signed && TL::is_signed) {
    return n >= 0 && static_cast<std::make_unsigned_t<T>>(n) <= RL::max();
  }
}

// Narrows sizes and system codes at API boundaries.  The error message names
// the value and what it describes, for example "String length 3000000000 out
// of range".
template <typename To, typename From>
absl::StatusOr<To> CastNumber(const From n, const std::string_view what) {
  if (!InRange<To>(n)) {
    return absl::OutOfRangeError(absl::StrFormat(
        "%s %d out of range [%d, %d]", what, n,
        std::numeric_limits<To>::min(), std::numeric_limits<To>::max()));
  }
  return static_cast<To>(n);
}

}  // namespace taskenv

#endif  // TASKENV_NUMERIC_H_
