// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "root_widget.hh"

#include <tracy/Tracy.hpp>

#include "context.hh"
#include "drag_and_drop.hh"
#include "pointer.hh"

namespace tote::ui {

RootWidget::RootWidget(Context& context, WindowId window_id, Vec2 size)
    : Widget(nullptr), context(context), window_id(window_id), size(size) {}

RootWidget::~RootWidget() {
  for (auto& child : children) {
    child->parent = nullptr;
  }
  if (drag_layer) {
    drag_layer->parent = nullptr;
  }
}

void RootWidget::AddChild(Ptr<Widget> child) {
  if (child == nullptr) {
    return;
  }
  child->parent = this;
  children.insert(children.begin(), std::move(child));
  WakeAnimation();
}

void RootWidget::RemoveChild(Widget& child) {
  for (auto it = children.begin(); it != children.end(); ++it) {
    if (it->Get() == &child) {
      child.parent = nullptr;
      children.erase(it);
      WakeAnimation();
      return;
    }
  }
}

void RootWidget::RefreshDragLayer() {
  if (drag_layer) {
    drag_layer->parent = nullptr;
  }
  drag_layer = context.drag_and_drop.Render(*this);
}

static void ClearNeedsDraw(Widget& widget) {
  widget.needs_draw = false;
  for (auto* child : widget.Children()) {
    ClearNeedsDraw(*child);
  }
}

void RootWidget::RenderFrame(SkCanvas& canvas) {
  ZoneScopedN("RenderFrame");
  if (needs_draw) {
    RefreshDragLayer();
  }
  Draw(canvas);
  ClearNeedsDraw(*this);
}

void RootWidget::FillChildren(Vec<Widget*>& out_children) {
  if (drag_layer) {
    out_children.push_back(drag_layer.Get());
  }
  for (auto& child : children) {
    out_children.push_back(child.Get());
  }
}

std::unique_ptr<Pointer> RootWidget::MakePointer(Vec2 position) {
  return std::make_unique<Pointer>(*this, position);
}

Ptr<RootWidget> MakeRootWidget(Context& context, WindowId window_id, Vec2 size) {
  auto root = MakePtr<RootWidget>(context, window_id, size);
  context.drag_and_drop.RegisterContainer(*root);
  return root;
}

}  // namespace tote::ui
