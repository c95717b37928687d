// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include "build_variant.hh"
#include "widget.hh"

namespace tote::ui {

// Button that starts drags on draggable widgets and whose release ends them.
static constexpr PointerButton kDragButton = PointerButton::Left;

// Print every drag state transition (start, cancel, finish, clear).
static constexpr bool kLogDragTransitions = build_variant::Debug;

}  // namespace tote::ui
