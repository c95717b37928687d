// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "math.hh"

#include "format.hh"

using namespace tote;

std::string Vec2::ToStr() const { return f("Vec2({}, {})", x, y); }

std::string Vec2::ToStrPx() const { return f("{:.0f}x{:.0f}px", roundf(x), roundf(y)); }

std::string ToStrPx(SkRect r) {
  return f("{:g}x{:g}{:+g}{:+g}px", r.width(), r.height(), r.x(), r.y());
}
