// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkCanvas.h>
#include <include/core/SkPath.h>

#include <memory>

#include "math.hh"
#include "ptr.hh"
#include "vec.hh"
#include "widget.hh"

namespace tote::ui {

struct Context;
struct Pointer;

// Top-level widget of a window.
//
// Besides the regular children it hosts the drag layer - the overlay that follows the pointer
// during a drag (or the invisible capture element of a canceled drag). The drag layer is produced
// by `DragAndDrop::Render` and refreshed whenever the RootWidget is asked to redraw.
struct RootWidget final : Widget {
  RootWidget(Context&, WindowId, Vec2 size);
  ~RootWidget();

  Context& context;
  const WindowId window_id;
  Vec2 size;  // pixels

  // Child widgets, stored in front-to-back order.
  Vec<Ptr<Widget>> children;

  // Drawn on top of all children. Null when there is no drag in this window.
  Ptr<Widget> drag_layer;

  Vec<Pointer*> pointers;

  std::string_view Name() const override { return "RootWidget"; }

  // Adds the widget in front of the existing children.
  void AddChild(Ptr<Widget>);
  void RemoveChild(Widget&);

  // Re-renders the drag layer from the current drag state.
  void RefreshDragLayer();

  // Refreshes the drag layer if anything asked for a redraw, then draws the whole window.
  void RenderFrame(SkCanvas&);

  SkPath Shape() const override { return SkPath::Rect(SkRect::MakeWH(size.width, size.height)); }
  void FillChildren(Vec<Widget*>& out_children) override;

  std::unique_ptr<Pointer> MakePointer(Vec2 position);
};

// Creates the RootWidget for a new window and registers it as a drag container, so that its drag
// layer follows the drag state.
Ptr<RootWidget> MakeRootWidget(Context&, WindowId, Vec2 size);

}  // namespace tote::ui
