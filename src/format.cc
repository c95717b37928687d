// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "format.hh"

namespace tote {

std::string_view CleanTypeName(std::string_view mangled) {
#ifdef _WIN32
  // "struct tote::ui::DragOverlayWidget" -> "DragOverlayWidget"
  if (mangled.starts_with("struct ")) {
    mangled.remove_prefix(7);
  } else if (mangled.starts_with("class ")) {
    mangled.remove_prefix(6);
  }
  // "tote::Payload<int>" -> "tote::Payload"
  if (auto template_args = mangled.find('<'); template_args != std::string_view::npos) {
    mangled = mangled.substr(0, template_args);
  }
  for (int i = (int)mangled.size() - 2; i > 0; --i) {
    if (mangled[i] == ':' && mangled[i + 1] == ':') {
      mangled.remove_prefix(i + 2);
      break;
    }
  }
  return mangled;
#else
  // Itanium mangling. "N4tote2ui17DragOverlayWidgetE" is a nested name, "9ListEntry" a top-level
  // one. "St" stands for the std:: prefix and "I...E" wraps template arguments, which are dropped.
  std::string_view rest = mangled;
  bool nested = rest.starts_with("N");
  if (nested) {
    rest.remove_prefix(1);
  }
  if (rest.starts_with("St")) {
    rest.remove_prefix(2);
  }
  std::string_view last;
  while (!rest.empty() && rest[0] >= '0' && rest[0] <= '9') {
    size_t length = 0;
    size_t i = 0;
    while (i < rest.size() && rest[i] >= '0' && rest[i] <= '9') {
      length = length * 10 + (rest[i] - '0');
      i++;
    }
    if (i + length > rest.size()) {
      break;
    }
    last = rest.substr(i, length);
    rest.remove_prefix(i + length);
    if (!nested) {
      break;
    }
  }
  return last.empty() ? mangled : last;
#endif
}

}  // namespace tote
