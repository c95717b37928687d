// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "payload.hh"

#include "format.hh"

namespace tote {

std::string AnyPayload::TypeName() const {
  if (!box) {
    return "empty";
  }
  return std::string(CleanTypeName(box->Type().name()));
}

std::string AnyPayload::ToStr() const {
  return f("AnyPayload({}@{})", TypeName(), static_cast<const void*>(box.Get()));
}

}  // namespace tote
