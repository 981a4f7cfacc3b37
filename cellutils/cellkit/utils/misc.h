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

#include "cellkit/utils/Status.h"
#include "cellkit/utils/common.h"

#include <limits>
#include <type_traits>

namespace cellkit {

template <class R, class A>
Result<R> narrow_cast_safe(const A &a) {
  static_assert(std::is_integral<R>::value && std::is_integral<A>::value, "expected integral types");
  auto r = static_cast<R>(a);
  if (static_cast<A>(r) != a || (std::is_signed<A>::value != std::is_signed<R>::value && ((a < A{}) != (r < R{})))) {
    return Status::Error(PSLICE() << "Narrow cast failed from " << a);
  }
  return r;
}

inline uint32 count_leading_zeroes32(uint32 x) {
  return x == 0 ? 32 : static_cast<uint32>(__builtin_clz(x));
}

inline uint32 count_leading_zeroes64(uint64 x) {
  return x == 0 ? 64 : static_cast<uint32>(__builtin_clzll(x));
}

inline uint32 count_trailing_zeroes32(uint32 x) {
  return x == 0 ? 32 : static_cast<uint32>(__builtin_ctz(x));
}

inline uint32 count_bits32(uint32 x) {
  return static_cast<uint32>(__builtin_popcount(x));
}

}  // namespace cellkit
