// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <functional>

// Shortcut for std::function
namespace tote {

template <typename T>
using Fn = std::function<T>;

}  // namespace tote
