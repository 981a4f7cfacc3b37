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

namespace cellkit {

namespace bitstring {

// Bits are numbered from the most significant bit of the first byte.
void bits_memcpy(unsigned char *to, int to_offs, const unsigned char *from, int from_offs, std::size_t bit_count);
void bits_memset(unsigned char *to, int to_offs, bool val, std::size_t bit_count);

void bits_store_long(unsigned char *to, int to_offs, uint64 val, unsigned top_bits);
uint64 bits_load_ulong(const unsigned char *from, int from_offs, unsigned top_bits);
int64 bits_load_long(const unsigned char *from, int from_offs, unsigned top_bits);

inline void bits_store_long(unsigned char *to, uint64 val, unsigned top_bits) {
  bits_store_long(to, 0, val, top_bits);
}
inline uint64 bits_load_ulong(const unsigned char *from, unsigned top_bits) {
  return bits_load_ulong(from, 0, top_bits);
}

string bits_to_hex(const unsigned char *ptr, int offs, std::size_t len);

}  // namespace bitstring

}  // namespace cellkit
