// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "pointer.hh"

#include "context.hh"
#include "gui_constants.hh"
#include "log.hh"
#include "root_widget.hh"
#include "tasks.hh"

namespace tote::ui {

Pointer::Pointer(RootWidget& root_widget, Vec2 position)
    : root_widget(root_widget),
      pointer_position(position),
      previous_position(position),
      button_down_position() {
  root_widget.pointers.push_back(this);
}

Pointer::~Pointer() {
  EndAllActions();
  if (hover) {
    hover->PointerLeave(*this);
  }
  root_widget.pointers.Erase(this);
}

static bool FillPath(Pointer& p, Widget& w) {
  if (!w.Hoverable()) {
    return false;
  }
  p.path.emplace_back(&w);
  Vec2 point = p.PositionWithin(w);

  auto shape = w.Shape();
  bool p_inside_w = shape.contains(point.x, point.y);
  bool w_is_unbounded = shape.isEmpty();

  if (p_inside_w || w_is_unbounded) {
    for (auto* child : w.Children()) {
      if (FillPath(p, *child)) {
        return true;
      }
    }
  }
  // This condition happens at most once per search. All of the parent stack frames are
  // short-circuited by `return true`.
  if (p_inside_w) {
    return true;
  }

  p.path.pop_back();
  return false;
}

void Pointer::UpdatePath() {
  auto old_path = std::move(path);
  path.clear();

  FillPath(*this, root_widget);

  if (path.empty()) {
    hover.Reset();
  } else {
    hover = path.back().Lock();
  }

  Vec<Ptr<Widget>> old_path_alive;
  for (auto& w : old_path) {
    if (auto locked = w.Lock()) {
      old_path_alive.push_back(std::move(locked));
    }
  }
  Vec<Ptr<Widget>> new_path_alive;
  for (auto& w : path) {
    if (auto locked = w.Lock()) {
      new_path_alive.push_back(std::move(locked));
    }
  }

  for (auto& old_w : old_path_alive) {
    if (!new_path_alive.Contains(old_w)) {
      old_w->PointerLeave(*this);
    }
  }
  for (auto& new_w : new_path_alive) {
    if (!old_path_alive.Contains(new_w)) {
      new_w->PointerOver(*this);
    }
  }
}

void Pointer::Move(Vec2 position) {
  DispatchGuard dispatch(root_widget.context.tasks);
  previous_position = pointer_position;
  pointer_position = position;

  for (auto& action : actions) {
    if (action) {
      action->Update();
    }
  }
  UpdatePath();
}

void Pointer::ButtonDown(PointerButton btn) {
  if (btn == PointerButton::Unknown || btn >= PointerButton::Count) return;
  DispatchGuard dispatch(root_widget.context.tasks);
  button_down_position[static_cast<int>(btn)] = pointer_position;
  auto& action = actions[static_cast<int>(btn)];

  UpdatePath();

  if (action == nullptr && hover) {
    Widget* curr = hover.Get();
    action = curr->FindAction(*this, btn);
    while (action == nullptr && curr->parent) {
      curr = curr->parent;
      action = curr->FindAction(*this, btn);
    }
  }
}

// The drag layer (overlay or cancel capture) sees every release first.
static bool DeliverReleaseToDragLayer(Pointer& p, PointerButton btn) {
  RootWidget& root = p.root_widget;
  // The drag state may have changed since the last frame (for example the drag was canceled, or a
  // canceled drag was cleared without a redraw).
  root.RefreshDragLayer();
  Ptr<Widget> layer = root.drag_layer;
  if (layer == nullptr) {
    return true;
  }
  ReleaseCapture* capture = layer->AsReleaseCapture();
  if (capture == nullptr) {
    return true;
  }
  Vec2 local = p.PositionWithin(*layer);
  bool inside = layer->Shape().contains(local.x, local.y);
  return capture->PointerRelease(p, btn, inside);
}

void Pointer::ButtonUp(PointerButton btn) {
  if (btn == PointerButton::Unknown || btn >= PointerButton::Count) return;
  DispatchGuard dispatch(root_widget.context.tasks);

  if (DeliverReleaseToDragLayer(*this, btn)) {
    UpdatePath();
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
      Ptr<Widget> widget = it->Lock();
      if (widget == nullptr) {
        continue;
      }
      if (DropTarget* drop_target = widget->AsDropTarget()) {
        if (drop_target->Drop(*this, btn)) {
          if constexpr (kLogDragTransitions) {
            LOG << "Dropped on " << widget->Name() << " (" << *this << ")";
          }
          break;
        }
      }
    }
  }

  if (actions[static_cast<int>(btn)]) {
    actions[static_cast<int>(btn)].reset();
    UpdatePath();
  }
  button_down_position[static_cast<int>(btn)] = Vec2(0, 0);
}

Vec2 Pointer::PositionWithin(const Widget& widget) const {
  SkMatrix transform_down = TransformDown(widget);
  return Vec2(transform_down.mapPoint(pointer_position));
}

Action* Pointer::ActionFor(PointerButton button) const {
  if (button == PointerButton::Unknown || button >= PointerButton::Count) return nullptr;
  return actions[static_cast<int>(button)].get();
}

void Pointer::EndAllActions() {
  for (auto& action : actions) {
    action.reset();
  }
}

std::string Pointer::ToStr() const {
  std::string ret;
  for (auto& weak : path) {
    auto w = weak.Lock();
    if (w == nullptr) {
      continue;
    }
    if (!ret.empty()) {
      ret += " -> ";
    }
    ret += w->Name();
    ret += PositionWithin(*w).ToStrPx();
  }
  return ret;
}

}  // namespace tote::ui
