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

#ifndef TASKENV_SYSTEM_H_
#define TASKENV_SYSTEM_H_

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/time/time.h"

#include "taskenv/absolute_path.h"
#include "taskenv/platform.h"
#include "taskenv/strings.h"

namespace taskenv {

enum class Encoding { kAscii, kUtf8 };

// Convert a native string to a std::string.  On Windows, interpret the string
// as UTF-16, and convert it to a byte string using the specified encoding.  On
// POSIX systems, ignore the encoding and return the string unchanged.
absl::StatusOr<std::string> ToNarrow(NativeStringView string,
                                     Encoding encoding);

// Convert a narrow string to a native string.  On Windows, interpret the string
// using the given encoding, and convert to UTF-16.  On POSIX systems, ignore
// the encoding and return the string unchanged.
absl::StatusOr<NativeString> ToNative(std::string_view string,
                                      Encoding encoding);

// Return the real working directory of the process.  Tasks must not call
// this; it’s for the engine when it resolves invocation seeds, and for
// standalone tools.
absl::StatusOr<AbsolutePath> CurrentDirectory();

// Resolve name against the real working directory of the process, with the
// same restrictions as CurrentDirectory.
absl::StatusOr<AbsolutePath> MakeAbsolute(NativeStringView name);

absl::StatusOr<std::string> ReadFile(const AbsolutePath& file);
absl::Status WriteFile(const AbsolutePath& file, std::string_view contents);

// A set of environment variables.  Variable names are case-insensitive on
// Windows and case-sensitive elsewhere.
class Environment final {
 private:
  struct Hash {
    using is_transparent = void;
    std::size_t operator()(NativeStringView string) const;
  };

  struct Equal {
    using is_transparent = void;
    bool operator()(NativeStringView a, NativeStringView b) const;
  };

  using Map = absl::flat_hash_map<NativeString, NativeString, Hash, Equal>;

 public:
  // Return a snapshot of the environment block of the current process.  Later
  // changes to the process environment don’t affect the snapshot.
  static absl::StatusOr<Environment> Current();

  template <typename I>
  static absl::StatusOr<Environment> Create(I begin, const I end) {
    Map map;
    for (; begin != end; ++begin) {
      const auto& [key, value] = *begin;
      const absl::Status status = Check(key, value);
      if (!status.ok()) return status;
      const auto [it, ok] = map.emplace(key, value);
      if (!ok) {
        return absl::AlreadyExistsError(
            absl::StrFormat("Duplicate environment variable %s", Quote(key)));
      }
    }
    return Environment(std::move(map));
  }

  using value_type = Map::value_type;
  using reference = Map::reference;
  using const_reference = Map::const_reference;
  using iterator = Map::iterator;
  using const_iterator = Map::const_iterator;
  using difference_type = Map::difference_type;
  using size_type = Map::size_type;

  Environment() = default;
  Environment(const Environment&) = default;
  Environment& operator=(const Environment&) = default;
  Environment(Environment&&) = default;
  Environment& operator=(Environment&&) = default;

  const_iterator begin() const { return map_.begin(); }
  const_iterator end() const { return map_.end(); }
  const_iterator cbegin() const { return map_.cbegin(); }
  const_iterator cend() const { return map_.cend(); }
  friend bool operator==(const Environment& a, const Environment& b) {
    return a.map_ == b.map_;
  }
  friend bool operator!=(const Environment& a, const Environment& b) {
    return a.map_ != b.map_;
  }
  void swap(Environment& other) { map_.swap(other.map_); }
  size_type size() const { return map_.size(); }
  bool empty() const { return map_.empty(); }

  [[nodiscard]] bool Contains(NativeStringView name) const {
    return map_.contains(name);
  }

  std::optional<NativeString> Get(NativeStringView name) const;

  // Set or replace a variable.  Return an InvalidArgument error if the name is
  // empty or contains an equals sign or a null character, or if the value
  // contains a null character.
  absl::Status Set(NativeStringView name, NativeStringView value);

  void Remove(NativeStringView name) { map_.erase(name); }

  // Return NAME=VALUE strings, sorted so that subprocesses see a hermetic
  // environment block.
  std::vector<NativeString> ToStrings() const;

 private:
  explicit Environment(Map map) : map_(std::move(map)) {}

  static absl::Status Check(NativeStringView name, NativeStringView value);

  Map map_;
};

// Everything needed to start a subprocess.
struct ProcessStartInfo final {
  AbsolutePath program;

  // Arguments without the program name.
  std::vector<NativeString> args;

  // If not empty, run the subprocess in this directory.
  AbsolutePath working_directory;

  // The complete environment of the subprocess.  Nothing is inherited from the
  // current process.
  Environment environment;

  // If set, redirect standard output and error to this file.
  std::optional<AbsolutePath> output_file;

  absl::Time deadline = absl::InfiniteFuture();
};

// Start the subprocess described by info and wait for it to finish.  Return
// its exit code.
absl::StatusOr<int> Run(const ProcessStartInfo& info);

}  // namespace taskenv

#endif  // TASKENV_SYSTEM_H_
