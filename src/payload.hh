// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <type_traits>
#include <typeinfo>

#include "ptr.hh"

namespace tote {

// Reference-counted box for a value whose type is only known at runtime.
struct PayloadBox : ReferenceCounted<PayloadBox> {
  virtual const std::type_info& Type() const = 0;
};

template <typename T>
struct Payload final : PayloadBox {
  static_assert(std::is_same_v<T, std::remove_cvref_t<T>>, "Payload type must be a plain value");

  T value;

  explicit Payload(T value) : value(std::move(value)) {}
  const std::type_info& Type() const override { return typeid(T); }
};

template <typename T>
Ptr<Payload<std::decay_t<T>>> MakePayload(T&& value) {
  return MakePtr<Payload<std::decay_t<T>>>(std::forward<T>(value));
}

// Shared handle to a payload of any type.
//
// Copies share the same box - the value itself is never cloned. The only way to get the value back
// is `TryDowncast`, which checks the runtime type first.
struct AnyPayload {
  AnyPayload() = default;

  template <typename T>
  AnyPayload(Ptr<Payload<T>> typed) : box(std::move(typed)) {}

  template <typename T>
  static AnyPayload Make(T&& value) {
    return AnyPayload(MakePayload(std::forward<T>(value)));
  }

  template <typename T>
  bool Is() const {
    return box && box->Type() == typeid(std::remove_cvref_t<T>);
  }

  // Returns null when the payload is empty or holds a different type.
  template <typename T>
  Ptr<Payload<std::remove_cvref_t<T>>> TryDowncast() const {
    using U = std::remove_cvref_t<T>;
    if (!Is<U>()) {
      return nullptr;
    }
    return DupPtr(static_cast<Payload<U>*>(box.Get()));
  }

  explicit operator bool() const { return static_cast<bool>(box); }

  // Two handles are the same payload iff they share the box.
  bool operator==(const AnyPayload& other) const { return box == other.box; }

  // Short name of the payload type ("empty" for an empty handle). Used for logging.
  std::string TypeName() const;

  std::string ToStr() const;

 private:
  Ptr<PayloadBox> box;
};

}  // namespace tote
