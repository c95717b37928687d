// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "draggable.hh"

#include "context.hh"
#include "pointer.hh"
#include "root_widget.hh"

namespace tote::ui {

DragAction::DragAction(Pointer& pointer, WeakPtr<Widget> source, DragFn on_drag)
    : Action(pointer), source(std::move(source)), on_drag(std::move(on_drag)) {}

void DragAction::Update() {
  if (pointer.pointer_position == pointer.previous_position) {
    return;
  }
  auto widget = source.Lock();
  if (widget == nullptr || !on_drag) {
    return;
  }
  RootWidget& root = pointer.root_widget;
  DragEvent event{
      .window_id = root.window_id,
      .position = pointer.pointer_position,
      .prev_position = pointer.previous_position,
      .region = TransformBetween(*widget, root).mapRect(widget->Shape().getBounds()),
  };
  on_drag(root.context.drag_and_drop, event);
}

}  // namespace tote::ui
