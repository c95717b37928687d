// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

namespace tote::ui {

struct Pointer;

// Action represents a gesture that the user performs by pressing a pointer button and then moving
// the pointer around before releasing it.
struct Action {
  Pointer& pointer;

  // Each action is bound to a pointer, which is used to keep track of its position.
  Action(Pointer& pointer);

  // Action is destroyed when the pointer button is released.
  virtual ~Action();

  // Update is called when the pointer moves (although spurious calls are also possible). This
  // function may be called hundreds of times per second.
  virtual void Update() = 0;
};

}  // namespace tote::ui
