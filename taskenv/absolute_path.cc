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

#include "taskenv/absolute_path.h"

#include <memory>
#include <ostream>
#include <utility>

#include "absl/base/no_destructor.h"
#include "absl/base/nullability.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

#include "taskenv/path.h"
#include "taskenv/platform.h"
#include "taskenv/strings.h"

namespace taskenv {

absl::StatusOr<AbsolutePath> AbsolutePath::FromString(
    const NativeStringView path) {
  if (path.empty()) return absl::InvalidArgumentError("Empty path");
  if (ContainsNull(path)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Path %s contains null character", Quote(path)));
  }
  if (!IsPathFullyQualified(path)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Path %s is not fully qualified", Quote(path)));
  }
  return Unchecked(NativeString(path), NativeString(path));
}

absl::StatusOr<AbsolutePath> AbsolutePath::Combine(const NativeStringView path,
                                                   const AbsolutePath& base) {
  if (path.empty()) return absl::InvalidArgumentError("Empty path");
  if (base.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Cannot resolve %s against empty base", Quote(path)));
  }
  return Unchecked(CombinePaths(base.value(), path), NativeString(path));
}

AbsolutePath AbsolutePath::Unchecked(NativeString value,
                                     NativeString original) {
  NativeString folded;
  if constexpr (!kCaseSensitiveFileSystem) folded = FoldCase(value);
  return AbsolutePath(std::make_shared<Rep>(
      Rep{std::move(value), std::move(original), std::move(folded)}));
}

static const NativeString& EmptyString() {
  static const absl::NoDestructor<NativeString> empty;
  return *empty;
}

const NativeString& AbsolutePath::value() const {
  return rep_ == nullptr ? EmptyString() : rep_->value;
}

const NativeString& AbsolutePath::original_value() const {
  return rep_ == nullptr ? EmptyString() : rep_->original;
}

const NativeString& AbsolutePath::key() const {
  if (rep_ == nullptr) return EmptyString();
  return kCaseSensitiveFileSystem ? rep_->value : rep_->folded;
}

AbsolutePath AbsolutePath::GetCanonicalForm() const {
  if (rep_ == nullptr || !NeedsNormalization(rep_->value)) return *this;
  // The system normalization keeps the path rooted, so there’s no need to
  // check again.
  return Unchecked(GetFullPath(rep_->value), rep_->original);
}

bool operator==(const AbsolutePath& a, const AbsolutePath& b) {
  if (a.empty() || b.empty()) return a.empty() == b.empty();
  if (a.rep_ == b.rep_) return true;
  return a.key() == b.key();
}

void PrintTo(const AbsolutePath& path,
             std::ostream* const absl_nonnull stream) {
  *stream << absl::StreamFormat("%s", path.value());
}

}  // namespace taskenv
