// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "drag_and_drop.hh"

#include <tracy/Tracy.hpp>

#include "gui_constants.hh"
#include "root_widget.hh"

namespace tote::ui {

DragAndDrop::DragAndDrop(TaskQueue& tasks) : tasks(tasks), state(DragIdle{}) {}

void DragAndDrop::RegisterContainer(Widget& widget) {
  for (auto& container : containers) {
    if (container.Identity() == &widget) {
      return;
    }
  }
  containers.emplace_back(&widget);
}

void DragAndDrop::DraggingAny(const DragEvent& event, AnyPayload payload,
                              Ptr<DragRendererBase> renderer) {
  // Flush whatever the previous event changed before applying this one.
  NotifyContainersForWindow(event.window_id);

  if (IsCanceled()) {
    return;
  }

  if (auto* session = std::get_if<DragSession>(&state)) {
    if (session->window_id == event.window_id) {
      session->position = event.position;
    }
    return;
  }

  if (!payload || renderer == nullptr) {
    ERROR << "Can't start a drag of " << payload.ToStr() << " without a renderer";
    return;
  }

  state = DragSession{
      .window_id = event.window_id,
      .position = event.position,
      .region_offset = Origin(event.region) - event.prev_position,
      .region = event.region,
      .payload = std::move(payload),
      .renderer = std::move(renderer),
  };
  if constexpr (kLogDragTransitions) {
    auto& session = std::get<DragSession>(state);
    LOG << "Started dragging " << session.payload.ToStr() << " in window " << session.window_id
        << " from " << ToStrPx(session.region);
  }
}

void DragAndDrop::Cancel() {
  auto* session = std::get_if<DragSession>(&state);
  if (session == nullptr) {
    return;
  }
  WindowId window_id = session->window_id;
  state = DragCanceled{window_id};
  if constexpr (kLogDragTransitions) {
    LOG << "Canceled dragging in window " << window_id;
  }
  NotifyContainersForWindow(window_id);
}

void DragAndDrop::FinishDragging() {
  if (IsCanceled()) {
    // A drop target canceled the drag while handling this release. The gesture is over, so the
    // capture element would only swallow the next one.
    ClearCanceled();
    return;
  }
  auto* session = std::get_if<DragSession>(&state);
  if (session == nullptr) {
    return;
  }
  WindowId window_id = session->window_id;
  NotifyContainersForWindow(window_id);
  state = DragIdle{};
  if constexpr (kLogDragTransitions) {
    LOG << "Finished dragging in window " << window_id;
  }
}

void DragAndDrop::ClearCanceled() {
  if (!IsCanceled()) {
    return;
  }
  state = DragIdle{};
  if constexpr (kLogDragTransitions) {
    LOG << "Cleared the canceled drag";
  }
}

void DragAndDrop::NotifyContainersForWindow(WindowId window_id) {
  ZoneScopedN("NotifyContainersForWindow");
  Vec<Ptr<Widget>> to_notify;
  std::erase_if(containers, [&](const WeakPtr<Widget>& weak) {
    auto container = weak.Lock();
    if (container == nullptr) {
      return true;
    }
    RootWidget* root = container->FindRootWidget();
    if (root && root->window_id == window_id) {
      to_notify.push_back(std::move(container));
    }
    return false;
  });
  for (auto& container : to_notify) {
    container->WakeAnimation();
  }
}

Ptr<Widget> DragAndDrop::Render(RootWidget& root) {
  if (auto* session = std::get_if<DragSession>(&state)) {
    if (session->window_id != root.window_id) {
      return nullptr;
    }
    // The renderer may call back into the store, so it works on a copy.
    DragSession snapshot = *session;
    auto overlay = MakePtr<DragOverlayWidget>(&root, *this, Size(snapshot.region));
    Vec2 anchor = snapshot.position + snapshot.region_offset;
    overlay->local_to_parent = SkMatrix::Translate(anchor.x, anchor.y);
    RenderContext ctx{root, overlay.Get(), overlay->size};
    overlay->content = snapshot.renderer->Render(snapshot.payload, ctx);
    if (overlay->content) {
      overlay->content->parent = overlay.Get();
    }
    return overlay;
  }
  if (auto* canceled = std::get_if<DragCanceled>(&state)) {
    if (canceled->window_id != root.window_id) {
      return nullptr;
    }
    return MakePtr<DragCaptureWidget>(&root, *this);
  }
  return nullptr;
}

DragOverlayWidget::DragOverlayWidget(Widget* parent, DragAndDrop& drag_and_drop, Vec2 size)
    : Widget(parent), drag_and_drop(drag_and_drop), size(size) {}

DragOverlayWidget::~DragOverlayWidget() {
  if (content) {
    content->parent = nullptr;
  }
}

SkPath DragOverlayWidget::Shape() const {
  return SkPath::Rect(SkRect::MakeWH(size.width, size.height));
}

void DragOverlayWidget::Draw(SkCanvas& canvas) const {
  canvas.save();
  canvas.clipPath(Shape());
  DrawChildren(canvas);
  canvas.restore();
}

void DragOverlayWidget::FillChildren(Vec<Widget*>& children) {
  if (content) {
    children.push_back(content.Get());
  }
}

bool DragOverlayWidget::PointerRelease(Pointer&, PointerButton btn, bool inside) {
  if (btn != kDragButton) {
    return true;
  }
  DragAndDrop& dnd = drag_and_drop;
  // Drop targets below still see the payload because the session is cleared after this pass.
  dnd.tasks.Defer(inside ? "FinishDragging (release inside)" : "FinishDragging (release outside)",
                  [&dnd] { dnd.FinishDragging(); });
  return true;
}

DragCaptureWidget::DragCaptureWidget(Widget* parent, DragAndDrop& drag_and_drop)
    : Widget(parent), drag_and_drop(drag_and_drop) {}

bool DragCaptureWidget::PointerRelease(Pointer&, PointerButton btn, bool inside) {
  if (btn != kDragButton) {
    return true;
  }
  DragAndDrop& dnd = drag_and_drop;
  dnd.tasks.Defer(inside ? "ClearCanceled (release inside)" : "ClearCanceled (release outside)",
                  [&dnd] { dnd.ClearCanceled(); });
  return false;
}

}  // namespace tote::ui
