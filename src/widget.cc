// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "widget.hh"

#include <typeinfo>

#include "format.hh"
#include "root_widget.hh"

namespace tote::ui {

Widget::Widget(Widget* parent) : parent(parent) {}

Widget::~Widget() {}

void Widget::WakeAnimation() const {
  for (const Widget* w = this; w != nullptr; w = w->parent) {
    w->needs_draw = true;
  }
}

std::string_view Widget::Name() const {
  const std::type_info& info = typeid(*this);
  return CleanTypeName(info.name());
}

RootWidget* Widget::FindRootWidget() const {
  const Widget* w = this;
  while (w->parent) {
    w = w->parent;
  }
  return dynamic_cast<RootWidget*>(const_cast<Widget*>(w));
}

void Widget::DrawChildren(SkCanvas& canvas) const {
  auto children = Children();
  for (auto it = children.rbegin(); it != children.rend(); ++it) {
    Widget& child = **it;
    canvas.save();
    canvas.concat(child.local_to_parent);
    child.Draw(canvas);
    canvas.restore();
  }
}

SkMatrix TransformUp(const Widget& from) {
  SkMatrix m = SkMatrix::I();
  for (const Widget* w = &from; w != nullptr; w = w->parent) {
    m.postConcat(w->local_to_parent);
  }
  return m;
}

SkMatrix TransformDown(const Widget& to) {
  SkMatrix inverse;
  if (!TransformUp(to).invert(&inverse)) {
    return SkMatrix::I();
  }
  return inverse;
}

SkMatrix TransformBetween(const Widget& from, const Widget& to) {
  return SkMatrix::Concat(TransformDown(to), TransformUp(from));
}

}  // namespace tote::ui
