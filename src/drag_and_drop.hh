// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPath.h>
#include <include/core/SkRect.h>

#include <typeinfo>
#include <variant>

#include "fn.hh"
#include "format.hh"
#include "log.hh"
#include "math.hh"
#include "optional.hh"
#include "payload.hh"
#include "ptr.hh"
#include "tasks.hh"
#include "vec.hh"
#include "widget.hh"

namespace tote::ui {

// Pointer-drag continuation event, sent by draggable widgets on every pointer move.
struct DragEvent {
  WindowId window_id;
  Vec2 position;       // window coordinates
  Vec2 prev_position;  // pointer position at the previous event
  SkRect region;       // bounds of the dragged widget, window coordinates
};

// Passed to the drag renderers when the dragged content is rendered.
struct RenderContext {
  RootWidget& root;
  Widget* parent;  // will own the rendered widget
  Vec2 size;       // size of the dragged region
};

// Renders the content that follows the pointer during a drag.
//
// Renderers are registered at the start of a drag and stay fixed for the whole session.
struct DragRendererBase : ReferenceCounted<DragRendererBase> {
  virtual Ptr<Widget> Render(const AnyPayload&, RenderContext&) const = 0;
};

// Renderer for payloads of type `T`.
template <typename T>
struct DragRenderer : DragRendererBase {
  virtual Ptr<Widget> RenderDragged(const T&, RenderContext&) const = 0;

  Ptr<Widget> Render(const AnyPayload& payload, RenderContext& ctx) const final {
    auto typed = payload.TryDowncast<T>();
    if (typed == nullptr) {
      ERROR << "DragRenderer<" << CleanTypeName(typeid(T).name()) << "> can't render "
            << payload.ToStr();
      return nullptr;
    }
    return RenderDragged(typed->value, ctx);
  }
};

template <typename T>
struct FnDragRenderer final : DragRenderer<T> {
  using RenderFn = Fn<Ptr<Widget>(const T&, RenderContext&)>;
  RenderFn fn;
  explicit FnDragRenderer(RenderFn fn) : fn(std::move(fn)) {}
  Ptr<Widget> RenderDragged(const T& value, RenderContext& ctx) const override {
    return fn ? fn(value, ctx) : nullptr;
  }
};

template <typename T, typename F>
Ptr<DragRenderer<T>> MakeDragRenderer(F&& fn) {
  return MakePtr<FnDragRenderer<T>>(typename FnDragRenderer<T>::RenderFn(std::forward<F>(fn)));
}

struct DragIdle {};

struct DragSession {
  WindowId window_id;
  Vec2 position;       // latest pointer position
  Vec2 region_offset;  // from the pointer to the top left corner of `region`, at the drag start
  SkRect region;       // dragged region, at the drag start
  AnyPayload payload;
  Ptr<DragRendererBase> renderer;
};

// The drag was canceled but its pointer button is still down.
struct DragCanceled {
  WindowId window_id;
};

using DragState = std::variant<DragIdle, DragSession, DragCanceled>;

template <typename T>
struct Dragged {
  Vec2 position;
  Ptr<Payload<T>> payload;
};

// Tracks the (single) drag gesture of an application.
//
// Draggable widgets feed it with DragEvents. Drop targets inspect it with `CurrentlyDragged`.
// RootWidgets render its state with `Render`.
//
// Widgets that display something depending on the drag state register as containers. They get
// `WakeAnimation` whenever the drag state of their window changes.
struct DragAndDrop {
  explicit DragAndDrop(TaskQueue&);
  DragAndDrop(const DragAndDrop&) = delete;

  // Registering the same widget again has no effect. Containers are held weakly.
  void RegisterContainer(Widget&);

  // Returns the dragged payload if a drag of `T` is in progress in the given window.
  template <typename T>
  Optional<Dragged<std::remove_cvref_t<T>>> CurrentlyDragged(WindowId window_id) const {
    using U = std::remove_cvref_t<T>;
    auto* session = std::get_if<DragSession>(&state);
    if (session == nullptr || session->window_id != window_id) {
      return std::nullopt;
    }
    auto payload = session->payload.TryDowncast<U>();
    if (payload == nullptr) {
      return std::nullopt;
    }
    return Dragged<U>{session->position, std::move(payload)};
  }

  // Starts a drag or moves the current one. Called on every drag event of a draggable widget.
  //
  // The payload & renderer are only stored by the first event of a session.
  template <typename T>
  void Dragging(const DragEvent& event, Ptr<Payload<T>> payload, Ptr<DragRenderer<T>> renderer) {
    DraggingAny(event, AnyPayload(std::move(payload)), std::move(renderer));
  }

  // Cancels the current drag, but only if it carries a payload of type `T`.
  //
  // The drag stays in the canceled state until its pointer button is released.
  template <typename T>
  void CancelDragging() {
    auto* session = std::get_if<DragSession>(&state);
    if (session && session->payload.Is<T>()) {
      Cancel();
    }
  }

  // Produces the drag layer for the given window (or null when there's nothing to show there).
  Ptr<Widget> Render(RootWidget&);

  bool IsIdle() const { return std::holds_alternative<DragIdle>(state); }
  bool IsDragging() const { return std::holds_alternative<DragSession>(state); }
  bool IsCanceled() const { return std::holds_alternative<DragCanceled>(state); }

  // Null unless a drag is in progress.
  const DragSession* Session() const { return std::get_if<DragSession>(&state); }

  const DragState& State() const { return state; }

  size_t ContainerCount() const { return containers.size(); }

 private:
  friend struct DragOverlayWidget;
  friend struct DragCaptureWidget;

  void DraggingAny(const DragEvent&, AnyPayload, Ptr<DragRendererBase>);
  void Cancel();

  // Release handlers. They run as deferred tasks, so by the time they run the state may have
  // changed already. In that case they do nothing.
  void FinishDragging();
  void ClearCanceled();

  void NotifyContainersForWindow(WindowId);

  TaskQueue& tasks;
  Vec<WeakPtr<Widget>> containers;
  DragState state;
};

// Follows the pointer during a drag. Hosts the widget produced by the session's renderer.
//
// Invisible to hit-testing (so the widgets below still get hovered & can accept the drop), but
// captures the release of the drag button.
struct DragOverlayWidget : Widget, ReleaseCapture {
  DragAndDrop& drag_and_drop;
  Vec2 size;
  Ptr<Widget> content;

  DragOverlayWidget(Widget* parent, DragAndDrop&, Vec2 size);
  ~DragOverlayWidget();

  SkPath Shape() const override;
  bool Hoverable() const override { return false; }
  void Draw(SkCanvas&) const override;
  void FillChildren(Vec<Widget*>& children) override;
  ReleaseCapture* AsReleaseCapture() override { return this; }
  bool PointerRelease(Pointer&, PointerButton, bool inside) override;
};

// Zero-sized element shown after a drag was canceled. Swallows the release of the drag button so
// that nothing below receives a drop.
struct DragCaptureWidget : Widget, ReleaseCapture {
  DragAndDrop& drag_and_drop;

  DragCaptureWidget(Widget* parent, DragAndDrop&);

  SkPath Shape() const override { return SkPath(); }
  bool Hoverable() const override { return false; }
  void Draw(SkCanvas&) const override {}
  ReleaseCapture* AsReleaseCapture() override { return this; }
  bool PointerRelease(Pointer&, PointerButton, bool inside) override;
};

}  // namespace tote::ui
