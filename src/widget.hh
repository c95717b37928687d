// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkCanvas.h>
#include <include/core/SkMatrix.h>
#include <include/core/SkPath.h>

#include <cstdint>
#include <memory>
#include <string_view>

#include "action.hh"
#include "math.hh"
#include "ptr.hh"
#include "vec.hh"

namespace tote::ui {

struct Widget;
struct RootWidget;
struct Pointer;

// Identifies a top-level window (and its RootWidget).
using WindowId = uint64_t;

enum class PointerButton { Unknown, Left, Middle, Right, Count };

// Transform from the RootWidget (window) coordinates to the local coordinates of the widget.
SkMatrix TransformDown(const Widget& to);
// Transform from the local coordinates of the widget to the RootWidget (window) coordinates.
SkMatrix TransformUp(const Widget& from);
// Transform from the local coordinates of `from` to the local coordinates of `to`.
SkMatrix TransformBetween(const Widget& from, const Widget& to);

// Interface for widgets that react to the pointer being released over them, for example to accept
// a dragged payload.
struct DropTarget {
  virtual ~DropTarget() = default;

  // Drag sessions are cleared in a deferred task, so `DragAndDrop::CurrentlyDragged` still returns
  // the dragged payload while this runs.
  //
  // Return true to consume the release. Otherwise it's offered to the parent widgets.
  virtual bool Drop(Pointer&, PointerButton) = 0;
};

// Interface for widgets that receive pointer releases no matter where the pointer is.
struct ReleaseCapture {
  virtual ~ReleaseCapture() = default;

  // `inside` tells whether the pointer was within the widget's Shape.
  // Return false to hide the release from the widgets below.
  virtual bool PointerRelease(Pointer&, PointerButton, bool inside) = 0;
};

// Widgets are things that can be drawn to the SkCanvas and receive pointer events.
//
// Widgets are reference counted and should be created with MakePtr. Parents own their children
// (through Ptr). The `parent` field is a plain back-reference.
struct Widget : ReferenceCounted<Widget> {
  explicit Widget(Widget* parent = nullptr);
  Widget(const Widget&) = delete;
  virtual ~Widget();

  Widget* parent;
  SkMatrix local_to_parent = SkMatrix::I();

  // Set when this widget (or one of its descendants) should be redrawn in the next frame.
  // Cleared by RootWidget::RenderFrame.
  mutable bool needs_draw = false;

  // Ask for this widget to be redrawn. Marks its ancestors as well.
  //
  // This is also how drag containers are notified about changes of the drag state.
  virtual void WakeAnimation() const;

  // The name for widgets of this type. Used for debugging.
  virtual std::string_view Name() const;

  // Returns null when the widget isn't attached to a window.
  RootWidget* FindRootWidget() const;

  virtual void PointerOver(Pointer&) {}
  virtual void PointerLeave(Pointer&) {}

  // Widgets that return false are skipped (together with their children) by the pointer
  // hit-testing. They don't receive hover events and don't hide the widgets below them.
  virtual bool Hoverable() const { return true; }

  virtual void Draw(SkCanvas& canvas) const { DrawChildren(canvas); }
  virtual SkPath Shape() const = 0;

  // Called when a pointer button is pressed over this widget (or one of its children which didn't
  // return an action).
  virtual std::unique_ptr<Action> FindAction(Pointer&, PointerButton) { return nullptr; }

  virtual DropTarget* AsDropTarget() { return nullptr; }
  virtual ReleaseCapture* AsReleaseCapture() { return nullptr; }

  void DrawChildren(SkCanvas&) const;

  // Used to obtain references to the child widgets in a generic fashion.
  // Widgets are stored in front-to-back order.
  virtual void FillChildren(Vec<Widget*>& children) {}

  Vec<Widget*> Children() const {
    Vec<Widget*> children;
    const_cast<Widget*>(this)->FillChildren(children);
    return children;
  }
};

}  // namespace tote::ui
