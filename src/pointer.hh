// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <memory>
#include <string>

#include "action.hh"
#include "math.hh"
#include "ptr.hh"
#include "vec.hh"
#include "widget.hh"

namespace tote::ui {

struct RootWidget;

// A pointing device (mouse, pen, touch) within a single window.
//
// The platform layer feeds events through `Move`, `ButtonDown` & `ButtonUp`. Each of them is a
// separate dispatch pass: tasks deferred by the event handlers run right before they return.
struct Pointer {
  Pointer(RootWidget&, Vec2 position);
  ~Pointer();
  Pointer(const Pointer&) = delete;

  void Move(Vec2 position);
  void ButtonDown(PointerButton);
  void ButtonUp(PointerButton);

  // Recompute the list of widgets under the pointer and send them PointerOver / PointerLeave.
  void UpdatePath();

  Vec2 PositionWithin(const Widget&) const;

  // Returns the action started by the given button (or null).
  Action* ActionFor(PointerButton button) const;

  void EndAllActions();

  std::string ToStr() const;

  RootWidget& root_widget;

  Vec2 pointer_position;   // window coordinates
  Vec2 previous_position;  // `pointer_position` before the last Move

  Vec2 button_down_position[static_cast<int>(PointerButton::Count)];

  std::unique_ptr<Action> actions[static_cast<int>(PointerButton::Count)];

  // Front-most hoverable widget under the pointer.
  Ptr<Widget> hover;

  // Hoverable widgets under the pointer, from the RootWidget down to `hover`.
  Vec<WeakPtr<Widget>> path;
};

}  // namespace tote::ui
