/*
    This file is part of TON Blockchain Library.

    TON Blockchain Library is free software: you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    TON Blockchain Library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with TON Blockchain Library.  If not, see <http://www.gnu.org/licenses/>.

    Copyright 2017-2020 Telegram Systems LLP
*/
#pragma once

#include "cellkit/utils/common.h"
#include "cellkit/utils/logging.h"

#include <atomic>
#include <type_traits>
#include <utility>

namespace cellkit {

template <class T>
class Ref;

class CntObject {
 private:
  mutable std::atomic<int> cnt_;
  template <class T>
  friend class Ref;

  void inc() const {
    cnt_.fetch_add(1, std::memory_order_relaxed);
  }
  bool dec() const {
    return cnt_.fetch_sub(1, std::memory_order_acq_rel) == 1;
  }

 public:
  CntObject() : cnt_(1) {
  }
  CntObject(const CntObject &) : CntObject() {
  }
  virtual ~CntObject() {
    auto cnt = cnt_.load(std::memory_order_relaxed);
    (void)cnt;
    DCHECK(cnt == 0 || cnt == 1);
  }
  int get_refcnt() const {
    return cnt_.load(std::memory_order_acquire);
  }
  bool is_unique() const {
    return get_refcnt() == 1;
  }
};

namespace detail {
void safe_delete(const CntObject *ptr);
}

template <class T>
class Ref {
  T *ptr;
  template <class S>
  friend class Ref;

 public:
  struct acquire_t {};
  Ref() : ptr(nullptr) {
  }
  Ref(std::nullptr_t) : ptr(nullptr) {
  }
  Ref(T *pobj, acquire_t) : ptr(pobj) {
  }
  explicit Ref(const T *pobj) : ptr(const_cast<T *>(pobj)) {
    if (ptr) {
      ptr->inc();
    }
  }
  explicit Ref(const T &obj) : ptr(const_cast<T *>(&obj)) {
    ptr->inc();
  }
  Ref(const Ref &r) : ptr(r.ptr) {
    if (ptr) {
      ptr->inc();
    }
  }
  Ref(Ref &&r) noexcept : ptr(std::move(r.ptr)) {
    r.ptr = nullptr;
  }
  template <class S, std::enable_if_t<std::is_base_of<T, S>::value, int> = 0>
  Ref(const Ref<S> &r) : ptr(static_cast<T *>(r.ptr)) {
    if (ptr) {
      ptr->inc();
    }
  }
  template <class S, std::enable_if_t<std::is_base_of<T, S>::value, int> = 0>
  Ref(Ref<S> &&r) noexcept : ptr(static_cast<T *>(r.ptr)) {
    r.ptr = nullptr;
  }
  ~Ref() {
    clear();
  }

  void clear() {
    if (ptr) {
      release_shared(ptr);
      ptr = nullptr;
    }
  }
  void swap(Ref<T> &r) noexcept {
    std::swap(ptr, r.ptr);
  }
  Ref &operator=(const Ref &r);
  Ref &operator=(Ref &&r) noexcept;
  template <class S, std::enable_if_t<std::is_base_of<T, S>::value, int> = 0>
  Ref &operator=(const Ref<S> &r) {
    return *this = Ref<T>(r);
  }

  const T *get() const {
    return ptr;
  }
  bool is_null() const {
    return ptr == nullptr;
  }
  bool not_null() const {
    return ptr != nullptr;
  }
  explicit operator bool() const {
    return ptr != nullptr;
  }
  const T &operator*() const & {
    CHECK(ptr);
    return *ptr;
  }
  const T *operator->() const {
    CHECK(ptr);
    return ptr;
  }
  T *release() {
    auto res = ptr;
    ptr = nullptr;
    return res;
  }
  bool operator==(const Ref &r) const {
    return ptr == r.ptr;
  }
  bool operator!=(const Ref &r) const {
    return ptr != r.ptr;
  }

 private:
  static void release_shared(T *obj) {
    if (obj->dec()) {
      detail::safe_delete(obj);
    }
  }
};

template <class T>
Ref<T> &Ref<T>::operator=(const Ref<T> &r) {
  if (ptr != r.ptr) {
    clear();
    ptr = r.ptr;
    if (ptr) {
      ptr->inc();
    }
  }
  return *this;
}

template <class T>
Ref<T> &Ref<T>::operator=(Ref<T> &&r) noexcept {
  if (this != &r) {
    clear();
    ptr = r.ptr;
    r.ptr = nullptr;
  }
  return *this;
}

template <class T, class... Args>
Ref<T> make_ref(Args &&...args) {
  return Ref<T>{new T{std::forward<Args>(args)...}, typename Ref<T>::acquire_t{}};
}

template <class T>
void swap(Ref<T> &r1, Ref<T> &r2) {
  r1.swap(r2);
}

int64 ref_get_delete_count();

}  // namespace cellkit
