// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>

#include <memory>
#include <type_traits>

#include "action.hh"
#include "drag_and_drop.hh"
#include "fn.hh"
#include "gui_constants.hh"
#include "payload.hh"
#include "ptr.hh"
#include "widget.hh"

namespace tote::ui {

// Turns the pointer movement into drag events of the source widget.
//
// Lives from the press of the drag button until its release.
struct DragAction : Action {
  using DragFn = Fn<void(DragAndDrop&, const DragEvent&)>;

  WeakPtr<Widget> source;
  DragFn on_drag;

  DragAction(Pointer&, WeakPtr<Widget> source, DragFn on_drag);

  void Update() override;
};

// Makes the wrapped widget draggable. Pressing the drag button over it & moving the pointer starts
// a drag of `payload`.
template <typename T>
struct DraggableWidget : Widget {
  Ptr<Widget> child;
  Ptr<Payload<T>> payload;
  Ptr<DragRenderer<T>> renderer;
  PointerButton button = kDragButton;

  DraggableWidget(Ptr<Widget> child_arg, Ptr<Payload<T>> payload, Ptr<DragRenderer<T>> renderer)
      : child(std::move(child_arg)), payload(std::move(payload)), renderer(std::move(renderer)) {
    if (child) {
      child->parent = this;
    }
  }

  ~DraggableWidget() {
    if (child) {
      child->parent = nullptr;
    }
  }

  SkPath Shape() const override {
    if (child == nullptr) {
      return SkPath();
    }
    return child->Shape().makeTransform(child->local_to_parent);
  }

  void FillChildren(Vec<Widget*>& children) override {
    if (child) {
      children.push_back(child.Get());
    }
  }

  std::unique_ptr<Action> FindAction(Pointer& pointer, PointerButton btn) override {
    if (btn != button) {
      return nullptr;
    }
    return std::make_unique<DragAction>(
        pointer, WeakPtr<Widget>(this),
        [payload = payload, renderer = renderer](DragAndDrop& dnd, const DragEvent& event) {
          dnd.Dragging<T>(event, payload, renderer);
        });
  }
};

// Wraps `widget` so that it can be dragged around, carrying `value`.
//
// `render` is either a `Ptr<DragRenderer<T>>` or a callable `(const T&, RenderContext&) ->
// Ptr<Widget>` which produces the widget shown under the pointer.
template <typename T, typename R>
Ptr<DraggableWidget<std::decay_t<T>>> AsDraggable(Ptr<Widget> widget, T&& value, R&& render) {
  using P = std::decay_t<T>;
  Ptr<DragRenderer<P>> renderer;
  if constexpr (std::is_convertible_v<R, Ptr<DragRenderer<P>>>) {
    renderer = std::forward<R>(render);
  } else {
    renderer = MakeDragRenderer<P>(std::forward<R>(render));
  }
  return MakePtr<DraggableWidget<P>>(std::move(widget), MakePayload(std::forward<T>(value)),
                                     std::move(renderer));
}

}  // namespace tote::ui
