// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkPoint.h>
#include <include/core/SkRect.h>

#include <cmath>
#include <string>

// Window coordinates are in pixels. The origin is at the top left and Y goes down (same as Skia).
union Vec2 {
  struct {
    float x, y;
  };
  struct {
    float width, height;
  };
  float elements[2];
  SkPoint sk;

  constexpr Vec2() : x(0), y(0) {}
  constexpr Vec2(float xy) : x(xy), y(xy) {}
  constexpr Vec2(float x, float y) : x(x), y(y) {}
  constexpr Vec2(SkPoint p) : sk(p) {}
  constexpr Vec2& operator+=(const Vec2& rhs) {
    x += rhs.x;
    y += rhs.y;
    return *this;
  }
  constexpr Vec2& operator-=(const Vec2& rhs) {
    x -= rhs.x;
    y -= rhs.y;
    return *this;
  }
  constexpr Vec2 operator-(const Vec2& rhs) const { return Vec2(x - rhs.x, y - rhs.y); }
  constexpr Vec2 operator-() const { return Vec2(-x, -y); }
  constexpr Vec2 operator+(const Vec2& rhs) const { return Vec2(x + rhs.x, y + rhs.y); }
  constexpr Vec2 operator*(float rhs) const { return Vec2(x * rhs, y * rhs); }
  constexpr Vec2 operator/(float rhs) const { return Vec2(x / rhs, y / rhs); }
  constexpr operator SkPoint() const { return sk; }
  constexpr bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  constexpr bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }
  std::string ToStr() const;
  std::string ToStrPx() const;
};

static_assert(sizeof(Vec2) == 8, "Vec2 is not 8 bytes");

// Top left corner of a rectangle in window coordinates.
constexpr Vec2 Origin(const SkRect& r) { return {r.fLeft, r.fTop}; }
constexpr Vec2 Size(const SkRect& r) { return {r.fRight - r.fLeft, r.fBottom - r.fTop}; }

std::string ToStrPx(SkRect);
