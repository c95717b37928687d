// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "action.hh"

namespace tote::ui {

Action::Action(Pointer& pointer) : pointer(pointer) {}

Action::~Action() {}

}  // namespace tote::ui
