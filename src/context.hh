// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include "drag_and_drop.hh"
#include "tasks.hh"

namespace tote::ui {

// State shared by all windows of an application.
//
// Created by the host application before its first window and destroyed after the last one. Every
// RootWidget keeps a reference to it, so nothing here is global.
struct Context {
  TaskQueue tasks;
  DragAndDrop drag_and_drop;

  Context() : drag_and_drop(tasks) {}
  Context(const Context&) = delete;

  // Pending tasks still get a chance to run while the drag state is alive.
  ~Context() { tasks.RunPending(); }
};

}  // namespace tote::ui
