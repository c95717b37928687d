// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT

#include "draggable.hh"

#include <include/utils/SkNoDrawCanvas.h>

#include <string>

#include "gtest.hh"
#include "gui_constants.hh"
#include "test_base.hh"

using namespace tote;
using namespace tote::ui;

using testing::ElementsAre;
using testing::IsEmpty;

// Cancels every text drag released over it.
struct VetoZone : BoxWidget, DropTarget {
  DragAndDrop& drag_and_drop;
  int vetoed = 0;

  VetoZone(SkRect rect, DragAndDrop& drag_and_drop)
      : BoxWidget(rect), drag_and_drop(drag_and_drop) {}

  DropTarget* AsDropTarget() override { return this; }

  bool Drop(Pointer& pointer, PointerButton btn) override {
    if (!drag_and_drop.CurrentlyDragged<std::string>(pointer.root_widget.window_id)) {
      return false;
    }
    ++vetoed;
    drag_and_drop.CancelDragging<std::string>();
    return true;
  }
};

struct DraggableTest : TestBase {
  SkNoDrawCanvas canvas{400, 300};
  int render_calls = 0;

  Ptr<DraggableWidget<std::string>> source = AsDraggable(
      MakePtr<BoxWidget>(SkRect::MakeXYWH(10, 10, 50, 30)), std::string("item-42"),
      [this](const std::string&, RenderContext& ctx) -> Ptr<Widget> {
        ++render_calls;
        return MakePtr<BoxWidget>(SkRect::MakeWH(ctx.size.width, ctx.size.height));
      });
  Ptr<DropZone<std::string>> text_zone =
      MakePtr<DropZone<std::string>>(SkRect::MakeXYWH(200, 100, 100, 100), dnd);
  Ptr<DropZone<double>> number_zone =
      MakePtr<DropZone<double>>(SkRect::MakeXYWH(0, 200, 100, 100), dnd);

  DraggableTest() {
    window1->AddChild(source);
    window1->AddChild(text_zone);
    window1->AddChild(number_zone);
  }

  // Press over the source & move the pointer to `to`, drawing a frame after every step.
  std::unique_ptr<Pointer> DragTo(Vec2 to) {
    auto pointer = window1->MakePointer(Vec2(20, 20));
    pointer->Move(Vec2(20, 20));
    pointer->ButtonDown(kDragButton);
    pointer->Move(Vec2(25, 25));
    window1->RenderFrame(canvas);
    pointer->Move(to);
    window1->RenderFrame(canvas);
    return pointer;
  }
};

TEST_F(DraggableTest, PressingDoesNotStartADrag) {
  auto pointer = window1->MakePointer(Vec2(20, 20));
  pointer->Move(Vec2(20, 20));
  pointer->ButtonDown(kDragButton);
  EXPECT_NE(dynamic_cast<DragAction*>(pointer->ActionFor(kDragButton)), nullptr);
  EXPECT_TRUE(dnd.IsIdle());

  pointer->ButtonUp(kDragButton);
  EXPECT_TRUE(dnd.IsIdle());
  EXPECT_EQ(pointer->ActionFor(kDragButton), nullptr);
  EXPECT_EQ(render_calls, 0);
}

TEST_F(DraggableTest, OtherButtonsDontDrag) {
  auto pointer = window1->MakePointer(Vec2(20, 20));
  pointer->Move(Vec2(20, 20));
  pointer->ButtonDown(PointerButton::Right);
  EXPECT_EQ(pointer->ActionFor(PointerButton::Right), nullptr);
  pointer->Move(Vec2(30, 30));
  EXPECT_TRUE(dnd.IsIdle());
}

TEST_F(DraggableTest, FirstMoveStartsTheSession) {
  auto pointer = window1->MakePointer(Vec2(20, 20));
  pointer->Move(Vec2(20, 20));
  pointer->ButtonDown(kDragButton);
  pointer->Move(Vec2(25, 25));

  ASSERT_TRUE(dnd.IsDragging());
  const DragSession* session = dnd.Session();
  EXPECT_EQ(session->window_id, 1);
  EXPECT_EQ(session->region, SkRect::MakeXYWH(10, 10, 50, 30));
  EXPECT_EQ(session->region_offset, Vec2(-10, -10));
  EXPECT_EQ(session->position, Vec2(25, 25));
  EXPECT_EQ(session->payload, AnyPayload(source->payload));
}

TEST_F(DraggableTest, RegionIsInWindowCoordinates) {
  source->local_to_parent = SkMatrix::Translate(100, 50);
  EXPECT_EQ(TransformBetween(*source, *window1).mapPoint(SkPoint::Make(10, 10)),
            SkPoint::Make(110, 60));
  EXPECT_EQ(TransformBetween(*window1, *source).mapPoint(SkPoint::Make(110, 60)),
            SkPoint::Make(10, 10));

  auto pointer = window1->MakePointer(Vec2(120, 70));
  pointer->Move(Vec2(120, 70));
  pointer->ButtonDown(kDragButton);
  pointer->Move(Vec2(125, 75));

  ASSERT_TRUE(dnd.IsDragging());
  EXPECT_EQ(dnd.Session()->region, SkRect::MakeXYWH(110, 60, 50, 30));
  EXPECT_EQ(dnd.Session()->region_offset, Vec2(-10, -10));
}

TEST_F(DraggableTest, DropOntoMatchingTarget) {
  auto pointer = DragTo(Vec2(250, 150));

  // The overlay covers the pointer but doesn't hide the target below it.
  auto* overlay = dynamic_cast<DragOverlayWidget*>(window1->drag_layer.Get());
  ASSERT_NE(overlay, nullptr);
  EXPECT_EQ(overlay->local_to_parent, SkMatrix::Translate(240, 140));
  EXPECT_EQ(pointer->hover, text_zone);

  pointer->ButtonUp(kDragButton);
  EXPECT_THAT(text_zone->dropped, ElementsAre("item-42"));
  EXPECT_THAT(text_zone->drop_positions, ElementsAre(Vec2(250, 150)));
  EXPECT_TRUE(dnd.IsIdle());
  EXPECT_EQ(pointer->ActionFor(kDragButton), nullptr);
}

TEST_F(DraggableTest, MismatchedTargetIgnoresTheDrop) {
  auto pointer = DragTo(Vec2(50, 250));
  EXPECT_EQ(pointer->hover, number_zone);

  pointer->ButtonUp(kDragButton);
  EXPECT_THAT(number_zone->dropped, IsEmpty());
  EXPECT_THAT(text_zone->dropped, IsEmpty());
  EXPECT_TRUE(dnd.IsIdle());
}

TEST_F(DraggableTest, CanceledDragIsNotDropped) {
  auto pointer = DragTo(Vec2(250, 150));
  dnd.CancelDragging<std::string>();
  pointer->Move(Vec2(260, 160));
  EXPECT_TRUE(dnd.IsCanceled());

  pointer->ButtonUp(kDragButton);
  EXPECT_THAT(text_zone->dropped, IsEmpty());
  EXPECT_TRUE(dnd.IsIdle());

  // The next gesture works normally.
  pointer = DragTo(Vec2(250, 150));
  pointer->ButtonUp(kDragButton);
  EXPECT_THAT(text_zone->dropped, ElementsAre("item-42"));
}

TEST_F(DraggableTest, DropTargetCanCancelTheDrop) {
  auto veto_zone = MakePtr<VetoZone>(SkRect::MakeXYWH(300, 0, 100, 100), dnd);
  window1->AddChild(veto_zone);

  auto pointer = DragTo(Vec2(350, 50));
  EXPECT_EQ(pointer->hover, veto_zone);
  pointer->ButtonUp(kDragButton);
  EXPECT_EQ(veto_zone->vetoed, 1);
  EXPECT_TRUE(dnd.IsIdle());

  // The gesture ended with the release, so the next one starts a new session right away.
  pointer = DragTo(Vec2(250, 150));
  EXPECT_TRUE(dnd.IsDragging());
  pointer->ButtonUp(kDragButton);
  EXPECT_THAT(text_zone->dropped, ElementsAre("item-42"));
  EXPECT_EQ(veto_zone->vetoed, 1);
}

TEST_F(DraggableTest, CancelOfOtherTypeKeepsDragging) {
  auto pointer = DragTo(Vec2(250, 150));
  dnd.CancelDragging<double>();
  pointer->ButtonUp(kDragButton);
  EXPECT_THAT(text_zone->dropped, ElementsAre("item-42"));
}

TEST_F(DraggableTest, ReleaseOfAnotherButtonKeepsDragging) {
  auto pointer = DragTo(Vec2(250, 150));
  pointer->ButtonDown(PointerButton::Right);
  pointer->ButtonUp(PointerButton::Right);
  EXPECT_TRUE(dnd.IsDragging());
  EXPECT_THAT(text_zone->dropped, IsEmpty());

  pointer->ButtonUp(kDragButton);
  EXPECT_THAT(text_zone->dropped, ElementsAre("item-42"));
}

TEST_F(DraggableTest, PayloadOutlivesItsSource) {
  auto pointer = DragTo(Vec2(100, 100));
  window1->RemoveChild(*source);
  source.Reset();

  pointer->Move(Vec2(250, 150));  // the source is gone, so nothing moves
  EXPECT_EQ(dnd.Session()->position, Vec2(100, 100));
  auto dragged = dnd.CurrentlyDragged<std::string>(1);
  ASSERT_TRUE(dragged.has_value());
  EXPECT_EQ(dragged->payload->value, "item-42");

  pointer->ButtonUp(kDragButton);
  EXPECT_THAT(text_zone->dropped, ElementsAre("item-42"));
  EXPECT_TRUE(dnd.IsIdle());
}

TEST_F(DraggableTest, OnlyOneWindowDragsAtATime) {
  auto other_source = AsDraggable(MakePtr<BoxWidget>(SkRect::MakeXYWH(10, 10, 50, 30)), 3.5,
                                  [](const double&, RenderContext&) -> Ptr<Widget> {
                                    return MakePtr<BoxWidget>(SkRect::MakeWH(1, 1));
                                  });
  auto other_zone = MakePtr<DropZone<double>>(SkRect::MakeXYWH(200, 100, 100, 100), dnd);
  window2->AddChild(other_source);
  window2->AddChild(other_zone);
  auto container2 = AddContainer(*window2, SkRect::MakeXYWH(390, 290, 10, 10));

  auto pointer1 = DragTo(Vec2(250, 150));

  auto pointer2 = window2->MakePointer(Vec2(20, 20));
  pointer2->Move(Vec2(20, 20));
  pointer2->ButtonDown(kDragButton);
  pointer2->Move(Vec2(250, 150));
  EXPECT_EQ(container2->wake_count, 1);
  EXPECT_EQ(dnd.Session()->window_id, 1);
  EXPECT_EQ(dnd.Render(*window2), nullptr);

  pointer2->ButtonUp(kDragButton);
  EXPECT_THAT(other_zone->dropped, IsEmpty());
  EXPECT_TRUE(dnd.IsDragging());

  pointer1->ButtonUp(kDragButton);
  EXPECT_THAT(text_zone->dropped, ElementsAre("item-42"));
}

TEST_F(DraggableTest, AcceptsARendererObject) {
  auto renderer = MakeDragRenderer<int>([](const int& value, RenderContext& ctx) -> Ptr<Widget> {
    return MakePtr<BoxWidget>(SkRect::MakeWH(value, value));
  });
  auto counter = AsDraggable(MakePtr<BoxWidget>(SkRect::MakeXYWH(0, 0, 5, 5)), 7, renderer);
  EXPECT_EQ(counter->renderer, renderer);
  EXPECT_EQ(counter->payload->value, 7);
  EXPECT_EQ(counter->Shape().getBounds(), SkRect::MakeXYWH(0, 0, 5, 5));

  window2->AddChild(counter);
  auto pointer = window2->MakePointer(Vec2(2, 2));
  pointer->Move(Vec2(2, 2));
  pointer->ButtonDown(kDragButton);
  pointer->Move(Vec2(100, 100));
  window2->RenderFrame(canvas);

  auto* overlay = dynamic_cast<DragOverlayWidget*>(window2->drag_layer.Get());
  ASSERT_NE(overlay, nullptr);
  ASSERT_NE(overlay->content, nullptr);
  EXPECT_EQ(overlay->content->Shape().getBounds(), SkRect::MakeWH(7, 7));
  EXPECT_TRUE(dnd.CurrentlyDragged<int>(2).has_value());
}

TEST_F(DraggableTest, DropIsLoggedInDebugBuilds) {
  auto pointer = DragTo(Vec2(250, 150));
  LogCapture log;
  pointer->ButtonUp(kDragButton);
  if constexpr (kLogDragTransitions) {
    ASSERT_EQ(log.infos.size(), 2);  // the drop & the end of the drag
    EXPECT_THAT(log.infos[0], testing::HasSubstr("RootWidget"));
  } else {
    EXPECT_THAT(log.infos, IsEmpty());
  }
}
