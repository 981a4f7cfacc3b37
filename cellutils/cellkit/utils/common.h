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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#define CELLKIT_CONCAT_IMPL(x, y) x##y
#define CELLKIT_CONCAT(x, y) CELLKIT_CONCAT_IMPL(x, y)

#define CELLKIT_DEFINE_STR_IMPL(x) #x
#define CELLKIT_DEFINE_STR(x) CELLKIT_DEFINE_STR_IMPL(x)

#define CELLKIT_WARN_UNUSED_RESULT [[nodiscard]]

#if defined(__GNUC__) || defined(__clang__)
#define CELLKIT_LIKELY(x) __builtin_expect(static_cast<bool>(x), 1)
#define CELLKIT_UNLIKELY(x) __builtin_expect(static_cast<bool>(x), 0)
#else
#define CELLKIT_LIKELY(x) (x)
#define CELLKIT_UNLIKELY(x) (x)
#endif

namespace cellkit {

using int8 = std::int8_t;
using int16 = std::int16_t;
using int32 = std::int32_t;
using int64 = std::int64_t;
using uint8 = std::uint8_t;
using uint16 = std::uint16_t;
using uint32 = std::uint32_t;
using uint64 = std::uint64_t;

using std::string;
using std::vector;

template <class T>
using unique_ptr = std::unique_ptr<T>;

using std::make_unique;

struct Unit {};

inline uint32 bswap32(uint32 x) {
#if defined(__GNUC__) || defined(__clang__)
  return __builtin_bswap32(x);
#else
  return ((x & 0xff) << 24) | ((x & 0xff00) << 8) | ((x >> 8) & 0xff00) | (x >> 24);
#endif
}

}  // namespace cellkit
