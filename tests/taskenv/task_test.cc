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

#include "taskenv/task.h"

#include <memory>
#include <string>
#include <type_traits>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "gtest/gtest.h"

namespace taskenv {
namespace {

class LegacyTask : public Task {
 public:
  std::string name() const override { return "legacy"; }
  absl::Status Execute() override { return absl::OkStatus(); }
};

class CapableTask : public MultiThreadableTask {
 public:
  std::string name() const override { return "capable"; }
  absl::Status Execute() override {
    // Fails hard if the engine didn’t assign an environment.
    static_cast<void>(this->environment());
    return absl::OkStatus();
  }
};

class MarkedTask : public Task {
 public:
  std::string name() const override { return "marked"; }
  absl::Status Execute() override { return absl::OkStatus(); }
};

class MarkedCapableTask : public CapableTask {};

}  // namespace

template <>
struct MultiThreadableMarker<MarkedTask> : std::true_type {};

template <>
struct MultiThreadableMarker<MarkedCapableTask> : std::true_type {};

namespace {

TEST(TaskHandleTest, ClassifiesLegacyTask) {
  const TaskHandle handle = TaskHandle::Create(std::make_unique<LegacyTask>());
  EXPECT_EQ(handle.capability(), TaskCapability::kNotCapable);
  EXPECT_EQ(handle.multi_threadable(), nullptr);
  EXPECT_EQ(handle.task().name(), "legacy");
}

TEST(TaskHandleTest, ClassifiesInterfaceCapableTask) {
  const TaskHandle handle = TaskHandle::Create(std::make_unique<CapableTask>());
  EXPECT_EQ(handle.capability(), TaskCapability::kInterfaceCapable);
  EXPECT_EQ(handle.multi_threadable(), &handle.task());
}

TEST(TaskHandleTest, ClassifiesMarkerCapableTask) {
  const TaskHandle handle = TaskHandle::Create(std::make_unique<MarkedTask>());
  EXPECT_EQ(handle.capability(), TaskCapability::kMarkerCapable);
  EXPECT_EQ(handle.multi_threadable(), nullptr);
}

TEST(TaskHandleTest, PrefersInterfaceOverMarker) {
  const TaskHandle handle =
      TaskHandle::Create(std::make_unique<MarkedCapableTask>());
  EXPECT_EQ(handle.capability(), TaskCapability::kInterfaceCapable);
  EXPECT_NE(handle.multi_threadable(), nullptr);
}

TEST(TaskHandleTest, UsesStaticType) {
  // A capable task passed as a plain Task pointer loses its capability, just
  // like a task type that the engine can’t inspect.
  const TaskHandle handle =
      TaskHandle::Create(std::unique_ptr<Task>(std::make_unique<CapableTask>()));
  EXPECT_EQ(handle.capability(), TaskCapability::kNotCapable);
}

TEST(TaskHandleTest, CopiesShareTask) {
  const TaskHandle a = TaskHandle::Create(std::make_unique<CapableTask>());
  const TaskHandle b = a;
  EXPECT_EQ(&a.task(), &b.task());
  EXPECT_EQ(b.capability(), TaskCapability::kInterfaceCapable);
}

TEST(TaskHandleTest, CapabilityIsFormattable) {
  EXPECT_EQ(absl::StrFormat("%v", TaskCapability::kNotCapable), "not capable");
  EXPECT_EQ(absl::StrFormat("%v", TaskCapability::kInterfaceCapable),
            "interface capable");
  EXPECT_EQ(absl::StrFormat("%v", TaskCapability::kMarkerCapable),
            "marker capable");
}

TEST(MultiThreadableTaskTest, EnvironmentIsUnsetByDefault) {
  CapableTask task;
  EXPECT_EQ(task.task_environment(), nullptr);
}

TEST(MultiThreadableTaskDeathTest, ExecuteWithoutEnvironmentDies) {
  CapableTask task;
  EXPECT_DEATH(static_cast<void>(task.Execute()), "no task environment");
}

}  // namespace
}  // namespace taskenv
