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

#ifndef TASKENV_ABSOLUTE_PATH_H_
#define TASKENV_ABSOLUTE_PATH_H_

#include <memory>
#include <ostream>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/nullability.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

#include "taskenv/platform.h"

namespace taskenv {

// An immutable, fully qualified file name.
//
// Tasks that run concurrently in the same process must not resolve relative
// file names against the working directory of the process, because that
// directory belongs to nobody in particular.  An AbsolutePath is either
// validated to be fully qualified or produced by combining a relative name
// with a known base directory, so that passing it to a file API never consults
// the working directory.
//
// The value isn’t normalized; call GetCanonicalForm for that.  Equality and
// hashing follow the case sensitivity of the file system: ordinal on Linux,
// ordinal ignoring case on Windows and macOS.  On macOS only ASCII letters are
// folded (see FoldCase), so names that differ only in the case of non-ASCII
// letters, such as "/é" and "/É", compare unequal there even though the file
// system treats them as the same file.
//
// A default-constructed AbsolutePath is empty.  It signals a missing path and
// only compares equal to other empty instances.
//
// Copies share one immutable representation, so AbsolutePath objects can be
// copied and passed between threads freely.
class AbsolutePath final {
 public:
  // Return an AbsolutePath for an already fully qualified file name.  Return
  // an InvalidArgument error if path is empty, contains a null character, or
  // isn’t fully qualified.
  static absl::StatusOr<AbsolutePath> FromString(NativeStringView path);

  // Resolve path against base.  If path is rooted, use it unchanged.
  // Otherwise, combine it textually with base; this doesn’t fail for unusual
  // characters.  The original value of the result is path.  Return an
  // InvalidArgument error if path or base is empty.
  static absl::StatusOr<AbsolutePath> Combine(NativeStringView path,
                                              const AbsolutePath& base);

  AbsolutePath() = default;
  AbsolutePath(const AbsolutePath&) = default;
  AbsolutePath& operator=(const AbsolutePath&) = default;
  AbsolutePath(AbsolutePath&&) = default;
  AbsolutePath& operator=(AbsolutePath&&) = default;

  [[nodiscard]] bool empty() const { return rep_ == nullptr; }

  // The resolved file name.  Empty for a default-constructed instance.
  const NativeString& value() const ABSL_ATTRIBUTE_LIFETIME_BOUND;

  // The string the caller originally passed, before combining it with a base
  // directory.  Only meant for diagnostics.
  const NativeString& original_value() const ABSL_ATTRIBUTE_LIFETIME_BOUND;

  // Same as value.  For passing the file name to APIs that take strings.
  const NativeString& string() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    return this->value();
  }

  const NativeChar* absl_nonnull pointer() const ABSL_ATTRIBUTE_LIFETIME_BOUND {
    return this->value().c_str();
  }

  // Return the path with "." and ".." segments resolved and separators
  // normalized, exactly as the system would do it for a full path.  If the
  // path is already canonical, return a copy that shares the representation
  // of this object, so that &result.value() == &this->value().  Keeps the
  // original value.
  AbsolutePath GetCanonicalForm() const;

  friend bool operator==(const AbsolutePath& a, const AbsolutePath& b);

  friend bool operator!=(const AbsolutePath& a, const AbsolutePath& b) {
    return !(a == b);
  }

  template <typename H>
  friend H AbslHashValue(H h, const AbsolutePath& path) {
    return H::combine(std::move(h), path.key());
  }

  // https://abseil.io/docs/cpp/guides/abslstringify#basic-usage
  template <typename Sink>
  friend void AbslStringify(Sink& sink, const AbsolutePath& path) {
    absl::Format(&sink, "%s", path.value());
  }

 private:
  struct Rep final {
    NativeString value;
    NativeString original;
    // Case-folded value on case-insensitive file systems, empty otherwise.
    NativeString folded;
  };

  // Doesn’t check whether value is rooted.  For results of the system
  // normalization and for names that TaskEnvironment has already checked.
  static AbsolutePath Unchecked(NativeString value, NativeString original);

  explicit AbsolutePath(std::shared_ptr<const Rep> rep)
      : rep_(std::move(rep)) {}

  // The string that equality and hashing are based on.
  const NativeString& key() const ABSL_ATTRIBUTE_LIFETIME_BOUND;

  friend class TaskEnvironment;

  std::shared_ptr<const Rep> rep_;
};

void PrintTo(const AbsolutePath& path, std::ostream* absl_nonnull stream);

}  // namespace taskenv

#endif  // TASKENV_ABSOLUTE_PATH_H_
