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

#include <type_traits>
#include <utility>

namespace cellkit {

template <class FunctionT>
class ScopeGuard {
 public:
  explicit ScopeGuard(const FunctionT &func) : func_(func) {
  }
  explicit ScopeGuard(FunctionT &&func) : func_(std::move(func)) {
  }
  ScopeGuard(const ScopeGuard &other) = delete;
  ScopeGuard &operator=(const ScopeGuard &other) = delete;
  ScopeGuard(ScopeGuard &&other) : dismissed_(other.dismissed_), func_(std::move(other.func_)) {
    other.dismissed_ = true;
  }
  ScopeGuard &operator=(ScopeGuard &&other) = delete;

  void dismiss() {
    dismissed_ = true;
  }

  ~ScopeGuard() {
    if (!dismissed_) {
      func_();
    }
  }

 private:
  bool dismissed_ = false;
  FunctionT func_;
};

namespace detail {
enum class ScopeExit {};

template <class FunctionT>
auto operator+(ScopeExit, FunctionT &&func) {
  return ScopeGuard<std::decay_t<FunctionT>>(std::forward<FunctionT>(func));
}
}  // namespace detail

}  // namespace cellkit

#define SCOPE_EXIT auto CELLKIT_CONCAT(SCOPE_EXIT_VAR_, __LINE__) = ::cellkit::detail::ScopeExit() + [&]()
