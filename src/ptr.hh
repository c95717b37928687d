// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <atomic>
#include <cassert>
#include <cstdint>
#include <functional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace tote {

// Intrusive reference counting with support for weak references.
//
// Objects start with one owning reference which should be adopted by a `Ptr` (see `MakePtr`).
// When the last owning reference goes away the object is destroyed. Its memory stays around until
// the last `WeakPtr` releases it, so that weak pointers can still check whether it's alive.
//
// `T` is the base class whose `operator delete` releases the memory. ReferenceCounted must be the
// first base of every class derived from it.
template <typename T>
struct ReferenceCounted {
  using AtomicCounter = std::atomic<uint32_t>;

  // Derived classes may hide this to customize deallocation.
  static void operator delete(void* ptr) { ::operator delete(ptr); }

  mutable AtomicCounter owning_refs = 1;
  mutable AtomicCounter weak_refs = 1;  // weak_refs = #weak + (1 if owning_refs > 0 else 0)

  virtual ~ReferenceCounted() = default;

  [[nodiscard]] bool IncrementOwningRefsNonZero() const {
    uint32_t n = owning_refs.load(std::memory_order_relaxed);
    while (n != 0) {
      if (owning_refs.compare_exchange_weak(n, n + 1, std::memory_order_acquire,
                                            std::memory_order_relaxed)) {
        return true;
      }
    }
    return false;
  }
  void IncrementOwningRefs() const { owning_refs.fetch_add(1, std::memory_order_relaxed); }
  void IncrementWeakRefs() const { weak_refs.fetch_add(1, std::memory_order_relaxed); }
  void DecrementOwningRefs() const {
    if (owning_refs.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      this->~ReferenceCounted();  // call destructor without releasing memory
      DecrementWeakRefs();
    }
  }
  void DecrementWeakRefs() const {
    if (weak_refs.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      // release memory without calling destructor
      T::operator delete((void*)this);
    }
  }
};

template <typename T>
static inline T* SafeIncrementOwningRefs(T* obj) {
  if (obj) {
    obj->IncrementOwningRefs();
  }
  return obj;
}

template <typename T>
static inline void SafeDecrementOwningRefs(T* obj) {
  if (obj) {
    obj->DecrementOwningRefs();
  }
}

template <typename T>
static inline T* SafeIncrementWeakRefs(T* obj) {
  if (obj) {
    obj->IncrementWeakRefs();
  }
  return obj;
}

template <typename T>
static inline void SafeDecrementWeakRefs(T* obj) {
  if (obj) {
    obj->DecrementWeakRefs();
  }
}

// Owning pointer to a ReferenceCounted object.
template <typename T>
struct Ptr {
  using element_type = T;

  constexpr Ptr() : obj(nullptr) {}
  constexpr Ptr(std::nullptr_t) : obj(nullptr) {}

  Ptr(const Ptr<T>& that) : obj(SafeIncrementOwningRefs(that.Get())) {}
  template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
  Ptr(const Ptr<U>& that) : obj(SafeIncrementOwningRefs(that.Get())) {}

  Ptr(Ptr<T>&& that) : obj(that.Release()) {}
  template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
  Ptr(Ptr<U>&& that) : obj(that.Release()) {}

  // Adopt the bare pointer (without incrementing its ref count).
  explicit Ptr(T*&& obj) : obj(obj) {}

  ~Ptr() { SafeDecrementOwningRefs(obj); }

  Ptr<T>& operator=(std::nullptr_t) {
    Reset();
    return *this;
  }
  Ptr<T>& operator=(const Ptr<T>& that) {
    if (this != &that) {
      Reset(SafeIncrementOwningRefs(that.Get()));
    }
    return *this;
  }
  template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
  Ptr<T>& operator=(const Ptr<U>& that) {
    Reset(SafeIncrementOwningRefs(that.Get()));
    return *this;
  }
  Ptr<T>& operator=(Ptr<T>&& that) {
    Reset(that.Release());
    return *this;
  }
  template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
  Ptr<T>& operator=(Ptr<U>&& that) {
    Reset(that.Release());
    return *this;
  }

  T& operator*() const {
    assert(obj != nullptr);
    return *obj;
  }
  T* operator->() const { return obj; }
  explicit operator bool() const { return obj != nullptr; }

  T* Get() const { return obj; }

  // Adopt the new bare pointer and drop the reference to the previous one (if any).
  void Reset(T* ptr = nullptr) {
    // Dropping the old object may re-enter this Ptr (through the object's destructor), so the
    // field is updated first.
    T* old_obj = obj;
    obj = ptr;
    SafeDecrementOwningRefs(old_obj);
  }

  // Return the bare pointer and forget it. The caller takes over the reference.
  [[nodiscard]] T* Release() {
    T* ptr = obj;
    obj = nullptr;
    return ptr;
  }

 private:
  T* obj;
};

template <typename T, typename U>
inline bool operator==(const Ptr<T>& a, const Ptr<U>& b) {
  return a.Get() == b.Get();
}
template <typename T>
inline bool operator==(const Ptr<T>& a, std::nullptr_t) {
  return !a;
}

template <typename C, typename CT, typename T>
auto operator<<(std::basic_ostream<C, CT>& os, const Ptr<T>& sp) -> decltype(os << sp.Get()) {
  return os << sp.Get();
}

template <typename T, typename... Args>
Ptr<T> MakePtr(Args&&... args) {
  return Ptr<T>(new T(std::forward<Args>(args)...));
}

// Returns a Ptr to an object that is already owned elsewhere (incrementing its ref count).
template <typename T>
Ptr<T> DupPtr(T* obj) {
  return Ptr<T>(SafeIncrementOwningRefs(obj));
}

// WeakPtr holds a reference to a reference-counted object while also allowing that object to be
// destroyed. In order to use WeakPtr, it should first be converted to Ptr using `Lock()`.
template <typename T>
struct WeakPtr {
  WeakPtr() : obj(nullptr) {}
  WeakPtr(const Ptr<T>& ptr) : obj(SafeIncrementWeakRefs(ptr.Get())) {}
  explicit WeakPtr(T* obj) : obj(SafeIncrementWeakRefs(obj)) {}
  WeakPtr(const WeakPtr<T>& that) : obj(SafeIncrementWeakRefs(that.obj)) {}
  WeakPtr(WeakPtr<T>&& that) : obj(that.ReleaseWeak()) {}

  ~WeakPtr() { SafeDecrementWeakRefs(obj); }

  WeakPtr<T>& operator=(const WeakPtr<T>& that) {
    if (this != &that) {
      T* old_obj = obj;
      obj = SafeIncrementWeakRefs(that.obj);
      SafeDecrementWeakRefs(old_obj);
    }
    return *this;
  }
  WeakPtr<T>& operator=(WeakPtr<T>&& that) {
    T* old_obj = obj;
    obj = that.ReleaseWeak();
    SafeDecrementWeakRefs(old_obj);
    return *this;
  }

  bool IsExpired() const {
    if (obj) {
      return obj->owning_refs.load(std::memory_order_relaxed) == 0;
    }
    return true;
  }

  Ptr<T> Lock() const {
    if (obj && obj->IncrementOwningRefsNonZero()) {
      return Ptr<T>(static_cast<T*>(obj));
    }
    return Ptr<T>();
  }

  // Address of the referenced object. Stays valid as an identity (but not for access) after the
  // object is destroyed.
  const T* Identity() const { return obj; }

  // Clear this pointer and return its value. The caller takes over the weak reference.
  [[nodiscard]] T* ReleaseWeak() {
    T* ptr = obj;
    obj = nullptr;
    return ptr;
  }

  void Reset(T* ptr = nullptr) {
    T* old_obj = obj;
    obj = SafeIncrementWeakRefs(ptr);
    SafeDecrementWeakRefs(old_obj);
  }

 private:
  T* obj;
};

}  // namespace tote

template <typename T>
struct std::hash<tote::Ptr<T>> {
  size_t operator()(const tote::Ptr<T>& ptr) const { return std::hash<T*>()(ptr.Get()); }
};
