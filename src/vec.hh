// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <vector>

namespace tote {

// std::vector with a couple of conveniences.
template <typename T>
struct Vec : std::vector<T> {
  using std::vector<T>::vector;

  // Remove the first element equal to `value`. Returns true if something was removed.
  bool Erase(const T& value) {
    auto it = std::find(this->begin(), this->end(), value);
    if (it == this->end()) {
      return false;
    }
    this->erase(it);
    return true;
  }

  bool Contains(const T& value) const {
    return std::find(this->begin(), this->end(), value) != this->end();
  }
};

}  // namespace tote
