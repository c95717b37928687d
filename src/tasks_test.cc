// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT

#include "tasks.hh"

#include <string>
#include <vector>

#include "gtest.hh"
#include "test_base.hh"

using namespace tote;
using testing::ElementsAre;

struct RecordingTask : Task {
  std::vector<std::string>& log;
  std::string name;
  RecordingTask(std::vector<std::string>& log, std::string name)
      : log(log), name(std::move(name)) {}
  std::string Format() override { return "RecordingTask(" + name + ")"; }
  void OnExecute() override { log.push_back(name); }
};

TEST(TasksTest, RunsInOrder) {
  TaskQueue queue;
  std::vector<std::string> log;
  queue.Schedule(std::make_unique<RecordingTask>(log, "a"));
  queue.Defer("b", [&] { log.push_back("b"); });
  queue.Schedule(std::make_unique<RecordingTask>(log, "c"));
  EXPECT_EQ(queue.Size(), 3);
  EXPECT_TRUE(log.empty());

  queue.RunPending();
  EXPECT_THAT(log, ElementsAre("a", "b", "c"));
  EXPECT_TRUE(queue.Empty());
}

TEST(TasksTest, TasksScheduledWhileRunningRunInTheSamePass) {
  TaskQueue queue;
  std::vector<std::string> log;
  queue.Defer("outer", [&] {
    log.push_back("outer");
    queue.Defer("inner", [&] { log.push_back("inner"); });
    queue.RunPending();  // re-entrant call is ignored
    log.push_back("outer end");
  });
  queue.Defer("second", [&] { log.push_back("second"); });

  queue.RunPending();
  EXPECT_THAT(log, ElementsAre("outer", "outer end", "second", "inner"));
}

TEST(TasksTest, OnlyTheOutermostGuardDrains) {
  TaskQueue queue;
  std::vector<std::string> log;
  {
    DispatchGuard outer(queue);
    queue.Defer("a", [&] { log.push_back("a"); });
    {
      DispatchGuard inner(queue);
      queue.Defer("b", [&] { log.push_back("b"); });
      EXPECT_EQ(queue.dispatch_depth, 2);
    }
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(queue.Size(), 2);
  }
  EXPECT_THAT(log, ElementsAre("a", "b"));
  EXPECT_EQ(queue.dispatch_depth, 0);
}

TEST(TasksTest, NullTasksAreDropped) {
  TaskQueue queue;
  queue.Schedule(nullptr);
  EXPECT_TRUE(queue.Empty());
}

TEST(TasksTest, FormatNamesTheTask) {
  FunctionTask task("FinishDragging", [] {});
  EXPECT_EQ(task.Format(), "FunctionTask(FinishDragging)");
}

TEST(TasksTest, DestroyingWithPendingTasksIsAnError) {
  LogCapture log;
  {
    TaskQueue queue;
    queue.Defer("forgotten", [] {});
  }
  ASSERT_EQ(log.errors.size(), 1);
  EXPECT_THAT(log.errors[0], testing::HasSubstr("FunctionTask(forgotten)"));
}
