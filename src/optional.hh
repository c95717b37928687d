// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <optional>

namespace tote {

template <typename T>
using Optional = std::optional<T>;

}  // namespace tote
