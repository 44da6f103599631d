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

#include "absl/strings/str_format.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "taskenv/platform.h"

namespace taskenv {
namespace {

using ::testing::TestWithParam;
using ::testing::Values;

struct GrammarParam final {
  NativeStringView path;
  bool rooted;
  bool fully_qualified;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const GrammarParam& param) {
    absl::Format(&sink, "Path %s should be %s and %s", param.path,
                 param.rooted ? "rooted" : "not rooted",
                 param.fully_qualified ? "fully qualified"
                                       : "not fully qualified");
  }
};

class GrammarTest : public TestWithParam<GrammarParam> {};

TEST_P(GrammarTest, ClassifiesPath) {
  const GrammarParam& param = this->GetParam();
  EXPECT_EQ(IsPathRooted(param.path), param.rooted);
  EXPECT_EQ(IsPathFullyQualified(param.path), param.fully_qualified);
}

// See
// https://googleprojectzero.blogspot.com/2016/02/the-definitive-guide-on-win32-to-nt.html
// for the kinds of file names on Windows.
INSTANTIATE_TEST_SUITE_P(
    VariousPaths, GrammarTest,
    Values(GrammarParam{TASKENV_NATIVE_LITERAL(""), false, false},
           GrammarParam{TASKENV_NATIVE_LITERAL("foo"), false, false},
           GrammarParam{TASKENV_NATIVE_LITERAL("foo/bar"), false, false},
           GrammarParam{TASKENV_NATIVE_LITERAL("."), false, false},
           GrammarParam{TASKENV_NATIVE_LITERAL("/"), true, !kWindows},
           GrammarParam{TASKENV_NATIVE_LITERAL("/foo"), true, !kWindows},
           GrammarParam{TASKENV_NATIVE_LITERAL("//server/share"), true, true},
           GrammarParam{TASKENV_NATIVE_LITERAL("C:\\foo"), kWindows,
                        kWindows},
           GrammarParam{TASKENV_NATIVE_LITERAL("C:/foo"), kWindows, kWindows},
           GrammarParam{TASKENV_NATIVE_LITERAL("C:\\"), kWindows, kWindows},
           // Drive relative
           GrammarParam{TASKENV_NATIVE_LITERAL("C:foo"), kWindows, false},
           GrammarParam{TASKENV_NATIVE_LITERAL("C:"), kWindows, false},
           // Root relative
           GrammarParam{TASKENV_NATIVE_LITERAL("\\foo"), kWindows, false},
           // UNC
           GrammarParam{TASKENV_NATIVE_LITERAL("\\\\server\\share\\foo"),
                        kWindows, kWindows},
           // Devices
           GrammarParam{TASKENV_NATIVE_LITERAL("\\\\?\\C:\\foo"), kWindows,
                        kWindows},
           GrammarParam{TASKENV_NATIVE_LITERAL("\\\\.\\pipe\\foo"), kWindows,
                        kWindows},
           GrammarParam{TASKENV_NATIVE_LITERAL("1:\\foo"), false, false}));

TEST(CombinePathsTest, JoinsWithSeparator) {
  if constexpr (kWindows) {
    EXPECT_EQ(CombinePaths(TASKENV_NATIVE_LITERAL("C:\\work\\proj"), TASKENV_NATIVE_LITERAL("out\\a.dll")),
              TASKENV_NATIVE_LITERAL("C:\\work\\proj\\out\\a.dll"));
    EXPECT_EQ(CombinePaths(TASKENV_NATIVE_LITERAL("C:\\work\\proj"), TASKENV_NATIVE_LITERAL("out/a.dll")),
              TASKENV_NATIVE_LITERAL("C:\\work\\proj\\out/a.dll"));
  } else {
    EXPECT_EQ(CombinePaths("/work/proj", "out/a.dll"), "/work/proj/out/a.dll");
  }
}

TEST(CombinePathsTest, DoesNotDoubleSeparators) {
  EXPECT_EQ(CombinePaths(TASKENV_NATIVE_LITERAL("/work/"),
                         TASKENV_NATIVE_LITERAL("out")),
            TASKENV_NATIVE_LITERAL("/work/out"));
}

TEST(CombinePathsTest, KeepsRootedPath) {
  EXPECT_EQ(CombinePaths(TASKENV_NATIVE_LITERAL("/work"),
                         TASKENV_NATIVE_LITERAL("/abs/a.dll")),
            TASKENV_NATIVE_LITERAL("/abs/a.dll"));
  if constexpr (kWindows) {
    EXPECT_EQ(CombinePaths(TASKENV_NATIVE_LITERAL("C:\\work"), TASKENV_NATIVE_LITERAL("D:foo")), TASKENV_NATIVE_LITERAL("D:foo"));
    EXPECT_EQ(CombinePaths(TASKENV_NATIVE_LITERAL("C:\\work"), TASKENV_NATIVE_LITERAL("\\foo")), TASKENV_NATIVE_LITERAL("\\foo"));
  }
}

TEST(CombinePathsTest, AcceptsEmptyArguments) {
  EXPECT_EQ(CombinePaths(TASKENV_NATIVE_LITERAL(""),
                         TASKENV_NATIVE_LITERAL("foo")),
            TASKENV_NATIVE_LITERAL("foo"));
  EXPECT_EQ(CombinePaths(TASKENV_NATIVE_LITERAL("/work"),
                         TASKENV_NATIVE_LITERAL("")),
            TASKENV_NATIVE_LITERAL("/work"));
}

TEST(CombinePathsTest, AcceptsUnusualCharacters) {
  EXPECT_EQ(CombinePaths(TASKENV_NATIVE_LITERAL("/work"),
                         TASKENV_NATIVE_LITERAL("a|b<c>\"d*?")),
            TASKENV_NATIVE_LITERAL("/work/a|b<c>\"d*?"));
}

// Paths that use only forward slashes behave the same on all systems, except
// that forward slashes need normalization on Windows.
class SlashPathTest : public TestWithParam<NativeStringView> {};

TEST_P(SlashPathTest, DoesNotTrigger) {
  const NativeStringView path = this->GetParam();
  const ScanResult scan = ScanPath(path);
  EXPECT_FALSE(scan.has_relative_segment_or_consecutive_separators);
  EXPECT_TRUE(scan.has_alt_separator);
  EXPECT_EQ(NeedsNormalization(path), kWindows);
}

INSTANTIATE_TEST_SUITE_P(
    DotNames, SlashPathTest,
    Values(TASKENV_NATIVE_LITERAL("/.git"), TASKENV_NATIVE_LITERAL("/.hidden"),
           TASKENV_NATIVE_LITERAL("/..."), TASKENV_NATIVE_LITERAL("/...."),
           TASKENV_NATIVE_LITERAL("/foo/.gitignore"),
           TASKENV_NATIVE_LITERAL("/foo/.nuget/packages"),
           TASKENV_NATIVE_LITERAL("/home/.config/"),
           TASKENV_NATIVE_LITERAL("/foo/..bar"),
           TASKENV_NATIVE_LITERAL("/foo/bar.."),
           TASKENV_NATIVE_LITERAL("/foo/bar."), TASKENV_NATIVE_LITERAL("/"),
           TASKENV_NATIVE_LITERAL("/foo/bar/"),
           // The first two characters are exempt because of UNC names.
           TASKENV_NATIVE_LITERAL("//server/share")));

class RelativeSlashPathTest : public TestWithParam<NativeStringView> {};

TEST_P(RelativeSlashPathTest, Triggers) {
  const NativeStringView path = this->GetParam();
  EXPECT_TRUE(ScanPath(path).has_relative_segment_or_consecutive_separators);
  EXPECT_TRUE(NeedsNormalization(path));
}

INSTANTIATE_TEST_SUITE_P(
    RelativeSegments, RelativeSlashPathTest,
    Values(TASKENV_NATIVE_LITERAL("/foo/."), TASKENV_NATIVE_LITERAL("/foo/.."),
           TASKENV_NATIVE_LITERAL("/foo/./bar"),
           TASKENV_NATIVE_LITERAL("/foo/../bar"),
           TASKENV_NATIVE_LITERAL("/./foo"), TASKENV_NATIVE_LITERAL("/."),
           TASKENV_NATIVE_LITERAL("/.."), TASKENV_NATIVE_LITERAL("/foo//bar"),
           TASKENV_NATIVE_LITERAL("/foo/bar//"),
           TASKENV_NATIVE_LITERAL("//server/share//foo")));

struct BackslashParam final {
  NativeStringView path;
  bool triggers_on_windows;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const BackslashParam& param) {
    absl::Format(&sink, "Path %s should %snormalize on Windows", param.path,
                 param.triggers_on_windows ? "" : "not ");
  }
};

class BackslashPathTest : public TestWithParam<BackslashParam> {};

TEST_P(BackslashPathTest, TriggersOnlyOnWindows) {
  const BackslashParam& param = this->GetParam();
  const ScanResult scan = ScanPath(param.path);
  EXPECT_FALSE(scan.has_alt_separator);
  EXPECT_EQ(NeedsNormalization(param.path),
            kWindows && param.triggers_on_windows);
}

INSTANTIATE_TEST_SUITE_P(
    WindowsPaths, BackslashPathTest,
    Values(BackslashParam{TASKENV_NATIVE_LITERAL("C:\\.git"), false},
           BackslashParam{TASKENV_NATIVE_LITERAL("C:\\foo\\.nuget"), false},
           BackslashParam{TASKENV_NATIVE_LITERAL("C:\\foo\\..."), false},
           BackslashParam{TASKENV_NATIVE_LITERAL("\\\\server\\share\\foo"),
                          false},
           BackslashParam{TASKENV_NATIVE_LITERAL("C:\\foo\\."), true},
           BackslashParam{TASKENV_NATIVE_LITERAL("C:\\foo\\.."), true},
           BackslashParam{TASKENV_NATIVE_LITERAL("C:\\foo\\.\\bar"), true},
           BackslashParam{TASKENV_NATIVE_LITERAL("C:\\foo\\..\\bar"), true},
           BackslashParam{TASKENV_NATIVE_LITERAL("C:\\foo\\\\bar"), true},
           BackslashParam{TASKENV_NATIVE_LITERAL("\\\\server\\share\\\\foo"),
                          true}));

TEST(ScanPathTest, DetectsMixedSeparators) {
  const ScanResult scan = ScanPath(TASKENV_NATIVE_LITERAL("C:\\foo/bar"));
  EXPECT_TRUE(scan.has_alt_separator);
  EXPECT_FALSE(scan.has_relative_segment_or_consecutive_separators);
  EXPECT_EQ(NeedsNormalization(TASKENV_NATIVE_LITERAL("C:\\foo/bar")),
            kWindows);
}

struct FullPathParam final {
  NativeStringView path;
  NativeStringView want;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const FullPathParam& param) {
    absl::Format(&sink, "Full path of %s should be %s", param.path, param.want);
  }
};

class PosixFullPathTest : public TestWithParam<FullPathParam> {};

TEST_P(PosixFullPathTest, ResolvesLexically) {
  if constexpr (!kWindows) {
    const FullPathParam& param = this->GetParam();
    EXPECT_EQ(GetFullPath(param.path), param.want);
  }
}

INSTANTIATE_TEST_SUITE_P(
    RelativeSegments, PosixFullPathTest,
    Values(FullPathParam{TASKENV_NATIVE_LITERAL("/foo/bar/."),
                         TASKENV_NATIVE_LITERAL("/foo/bar")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/foo/bar/.."),
                         TASKENV_NATIVE_LITERAL("/foo")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/foo/bar/../"),
                         TASKENV_NATIVE_LITERAL("/foo/")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/foo/.."),
                         TASKENV_NATIVE_LITERAL("/")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/.."),
                         TASKENV_NATIVE_LITERAL("/")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/."),
                         TASKENV_NATIVE_LITERAL("/")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/foo/../../bar"),
                         TASKENV_NATIVE_LITERAL("/bar")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/foo/./bar/../baz"),
                         TASKENV_NATIVE_LITERAL("/foo/baz")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/foo//bar"),
                         TASKENV_NATIVE_LITERAL("/foo/bar")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/foo/bar//"),
                         TASKENV_NATIVE_LITERAL("/foo/bar/")},
           FullPathParam{TASKENV_NATIVE_LITERAL("//foo"),
                         TASKENV_NATIVE_LITERAL("/foo")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/foo/.git/./x"),
                         TASKENV_NATIVE_LITERAL("/foo/.git/x")},
           FullPathParam{TASKENV_NATIVE_LITERAL("/foo/.../.."),
                         TASKENV_NATIVE_LITERAL("/foo")}));

class WindowsFullPathTest : public TestWithParam<FullPathParam> {};

TEST_P(WindowsFullPathTest, MatchesGetFullPathName) {
  if constexpr (kWindows) {
    const FullPathParam& param = this->GetParam();
    EXPECT_EQ(GetFullPath(param.path), param.want);
  }
}

INSTANTIATE_TEST_SUITE_P(
    RelativeSegments, WindowsFullPathTest,
    Values(FullPathParam{TASKENV_NATIVE_LITERAL("C:\\foo\\.\\bar"),
                         TASKENV_NATIVE_LITERAL("C:\\foo\\bar")},
           FullPathParam{TASKENV_NATIVE_LITERAL("C:\\foo\\..\\bar"),
                         TASKENV_NATIVE_LITERAL("C:\\bar")},
           FullPathParam{TASKENV_NATIVE_LITERAL("C:/foo/bar"),
                         TASKENV_NATIVE_LITERAL("C:\\foo\\bar")},
           FullPathParam{TASKENV_NATIVE_LITERAL("C:\\foo\\\\bar"),
                         TASKENV_NATIVE_LITERAL("C:\\foo\\bar")},
           FullPathParam{TASKENV_NATIVE_LITERAL("C:\\.."),
                         TASKENV_NATIVE_LITERAL("C:\\")},
           FullPathParam{TASKENV_NATIVE_LITERAL("\\\\server\\share\\a\\..\\b"),
                         TASKENV_NATIVE_LITERAL("\\\\server\\share\\b")},
           FullPathParam{TASKENV_NATIVE_LITERAL("\\\\?\\C:\\foo\\..\\bar"),
                         TASKENV_NATIVE_LITERAL("\\\\?\\C:\\foo\\..\\bar")}));

}  // namespace
}  // namespace taskenv
