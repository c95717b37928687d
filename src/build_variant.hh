// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

namespace tote::build_variant {

// Build variant constants - values set by CMake via TOTE_BUILD_VARIANT
#if TOTE_BUILD_VARIANT == 1
constexpr bool Debug = true;
constexpr bool Release = false;
constexpr bool Fast = false;
#elif TOTE_BUILD_VARIANT == 2
constexpr bool Debug = false;
constexpr bool Release = true;
constexpr bool Fast = false;
#elif TOTE_BUILD_VARIANT == 3
constexpr bool Debug = false;
constexpr bool Release = false;
constexpr bool Fast = true;
#else
#warning "TOTE_BUILD_VARIANT should be set to 1, 2, or 3"
constexpr bool Debug = false;
constexpr bool Release = false;
constexpr bool Fast = false;
#endif

}  // namespace tote::build_variant
