// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <deque>
#include <memory>
#include <string>

#include "fn.hh"

namespace tote {

// Unit of work that runs after the current event dispatch pass.
struct Task {
  virtual ~Task() = default;
  virtual std::string Format();
  virtual void OnExecute() = 0;
};

struct FunctionTask : Task {
  std::string name;
  Fn<void()> function;
  FunctionTask(std::string name, Fn<void()> function)
      : name(std::move(name)), function(std::move(function)) {}
  std::string Format() override;
  void OnExecute() override;
};

// FIFO queue of deferred tasks.
//
// Event handlers must not mutate state that is still being read by the dispatch pass which invoked
// them. Instead they schedule a task here. The queue is drained once the outermost DispatchGuard
// goes out of scope (or when RunPending is called explicitly).
struct TaskQueue {
  TaskQueue() = default;
  TaskQueue(const TaskQueue&) = delete;
  ~TaskQueue();

  // Steals ownership of the task.
  void Schedule(std::unique_ptr<Task>&&);

  void Defer(std::string name, Fn<void()> function);

  // Runs tasks until the queue is empty. Tasks scheduled by running tasks are executed in the same
  // call. Calls made from within a running task return immediately.
  void RunPending();

  size_t Size() const { return queue.size(); }
  bool Empty() const { return queue.empty(); }

  // Number of DispatchGuards currently alive.
  int dispatch_depth = 0;

 private:
  std::deque<std::unique_ptr<Task>> queue;
  bool running = false;
};

// Marks the extent of a single event dispatch pass.
//
// Guards may nest (an event handler may synthesize another event). Only the outermost guard drains
// the queue.
struct DispatchGuard {
  TaskQueue& queue;
  DispatchGuard(TaskQueue& queue);
  ~DispatchGuard();
  DispatchGuard(const DispatchGuard&) = delete;
};

}  // namespace tote
