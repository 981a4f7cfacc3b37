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
#include "cellkit/common/refcnt.hpp"

#include "cellkit/utils/ScopeGuard.h"

#include <vector>

namespace cellkit {

namespace detail {

namespace {

// Objects released while another release is running are parked here and freed by the
// outermost call, so a long chain of cells is destroyed in a loop instead of recursively.
class ReleaseQueue {
 public:
  void release(const CntObject *obj) {
    pending_.push_back(obj);
    if (draining_) {
      return;
    }
    draining_ = true;
    SCOPE_EXIT {
      draining_ = false;
    };
    while (!pending_.empty()) {
      const CntObject *next = pending_.back();
      pending_.pop_back();
      delete next;
      released_++;
    }
  }

  int64 released() const {
    return released_;
  }

 private:
  std::vector<const CntObject *> pending_;
  bool draining_{false};
  int64 released_{0};
};

ReleaseQueue &release_queue() {
  static thread_local ReleaseQueue queue;
  return queue;
}

}  // namespace

void safe_delete(const CntObject *ptr) {
  release_queue().release(ptr);
}

}  // namespace detail

int64 ref_get_delete_count() {
  return detail::release_queue().released();
}

}  // namespace cellkit
