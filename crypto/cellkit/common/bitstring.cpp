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
#include "cellkit/common/bitstring.h"

#include "cellkit/utils/logging.h"

namespace cellkit {

namespace bitstring {

namespace {
// at most 56 bits so that any bit offset fits into eight bytes
constexpr unsigned chunk_bits = 56;

uint64 load_chunk(const unsigned char *from, int offs, unsigned bits) {
  unsigned total = static_cast<unsigned>(offs) + bits;
  unsigned bytes = (total + 7) >> 3;
  uint64 acc = 0;
  for (unsigned i = 0; i < bytes; i++) {
    acc = (acc << 8) | from[i];
  }
  acc >>= bytes * 8 - total;
  return acc & ((1ULL << bits) - 1);
}

void store_chunk(unsigned char *to, int offs, uint64 val, unsigned bits) {
  unsigned total = static_cast<unsigned>(offs) + bits;
  unsigned bytes = (total + 7) >> 3;
  uint64 acc = 0;
  for (unsigned i = 0; i < bytes; i++) {
    acc = (acc << 8) | to[i];
  }
  unsigned shift = bytes * 8 - total;
  uint64 mask = ((1ULL << bits) - 1) << shift;
  acc = (acc & ~mask) | ((val << shift) & mask);
  for (unsigned i = bytes; i > 0; i--) {
    to[i - 1] = static_cast<unsigned char>(acc);
    acc >>= 8;
  }
}
}  // namespace

void bits_memcpy(unsigned char *to, int to_offs, const unsigned char *from, int from_offs, std::size_t bit_count) {
  to += to_offs >> 3;
  to_offs &= 7;
  from += from_offs >> 3;
  from_offs &= 7;
  if (!to_offs && !from_offs) {
    std::size_t bytes = bit_count >> 3;
    for (std::size_t i = 0; i < bytes; i++) {
      to[i] = from[i];
    }
    to += bytes;
    from += bytes;
    bit_count &= 7;
  }
  while (bit_count > 0) {
    unsigned cur = bit_count < chunk_bits ? static_cast<unsigned>(bit_count) : chunk_bits;
    store_chunk(to, to_offs, load_chunk(from, from_offs, cur), cur);
    to_offs += cur;
    from_offs += cur;
    to += to_offs >> 3;
    to_offs &= 7;
    from += from_offs >> 3;
    from_offs &= 7;
    bit_count -= cur;
  }
}

void bits_memset(unsigned char *to, int to_offs, bool val, std::size_t bit_count) {
  to += to_offs >> 3;
  to_offs &= 7;
  while (bit_count > 0) {
    unsigned cur = bit_count < chunk_bits ? static_cast<unsigned>(bit_count) : chunk_bits;
    store_chunk(to, to_offs, val ? ~0ULL : 0, cur);
    to_offs += cur;
    to += to_offs >> 3;
    to_offs &= 7;
    bit_count -= cur;
  }
}

void bits_store_long(unsigned char *to, int to_offs, uint64 val, unsigned top_bits) {
  CHECK(top_bits <= 64);
  to += to_offs >> 3;
  to_offs &= 7;
  if (top_bits > chunk_bits) {
    unsigned low_bits = top_bits - 32;
    store_chunk(to, to_offs, val >> low_bits, 32);
    bits_store_long(to, to_offs + 32, val, low_bits);
  } else if (top_bits > 0) {
    store_chunk(to, to_offs, val, top_bits);
  }
}

uint64 bits_load_ulong(const unsigned char *from, int from_offs, unsigned top_bits) {
  CHECK(top_bits <= 64);
  from += from_offs >> 3;
  from_offs &= 7;
  if (top_bits > chunk_bits) {
    unsigned low_bits = top_bits - 32;
    return (load_chunk(from, from_offs, 32) << low_bits) | bits_load_ulong(from, from_offs + 32, low_bits);
  }
  return top_bits ? load_chunk(from, from_offs, top_bits) : 0;
}

int64 bits_load_long(const unsigned char *from, int from_offs, unsigned top_bits) {
  uint64 val = bits_load_ulong(from, from_offs, top_bits);
  if (top_bits == 0 || top_bits == 64) {
    return static_cast<int64>(val);
  }
  uint64 sign = 1ULL << (top_bits - 1);
  return static_cast<int64>((val ^ sign) - sign);
}

string bits_to_hex(const unsigned char *ptr, int offs, std::size_t len) {
  static const char hex_digits[] = "0123456789ABCDEF";
  string res;
  std::size_t nibbles = len >> 2;
  for (std::size_t i = 0; i < nibbles; i++) {
    res += hex_digits[bits_load_ulong(ptr, offs + static_cast<int>(4 * i), 4)];
  }
  unsigned rest = static_cast<unsigned>(len & 3);
  if (rest) {
    // completion tag: the remaining bits followed by a single one bit
    auto tail = (bits_load_ulong(ptr, offs + static_cast<int>(4 * nibbles), rest) << (4 - rest)) | (1u << (3 - rest));
    res += hex_digits[tail];
    res += '_';
  }
  return res;
}

}  // namespace bitstring

}  // namespace cellkit
