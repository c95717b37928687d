// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "tasks.hh"

#include <tracy/Tracy.hpp>

#include "format.hh"
#include "log.hh"

namespace tote {

std::string Task::Format() { return "Task()"; }

std::string FunctionTask::Format() { return f("FunctionTask({})", name); }

void FunctionTask::OnExecute() {
  ZoneScopedN("FunctionTask");
  if (function) {
    function();
  }
}

TaskQueue::~TaskQueue() {
  if (!queue.empty()) {
    ERROR << "TaskQueue destroyed with " << queue.size() << " pending task(s). First one is "
          << queue.front()->Format() << ".";
  }
}

void TaskQueue::Schedule(std::unique_ptr<Task>&& task) {
  if (task == nullptr) {
    return;
  }
  queue.push_back(std::move(task));
}

void TaskQueue::Defer(std::string name, Fn<void()> function) {
  Schedule(std::make_unique<FunctionTask>(std::move(name), std::move(function)));
}

void TaskQueue::RunPending() {
  if (running) {
    return;
  }
  ZoneScopedN("RunPending");
  running = true;
  while (!queue.empty()) {
    std::unique_ptr<Task> task = std::move(queue.front());
    queue.pop_front();
    task->OnExecute();
  }
  running = false;
}

DispatchGuard::DispatchGuard(TaskQueue& queue) : queue(queue) { ++queue.dispatch_depth; }

DispatchGuard::~DispatchGuard() {
  if (--queue.dispatch_depth == 0) {
    queue.RunPending();
  }
}

}  // namespace tote
