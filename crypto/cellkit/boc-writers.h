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

#include "cellkit/utils/Slice.h"
#include "cellkit/utils/crypto.h"
#include "cellkit/utils/logging.h"

#include <cstring>

namespace cellkit {
namespace boc_writers {
struct BufferWriter {
  BufferWriter(unsigned char *store_start, unsigned char *store_end)
      : store_start(store_start), store_ptr(store_start), store_end(store_end) {
  }

  size_t position() const {
    return store_ptr - store_start;
  }
  size_t remaining() const {
    return store_end - store_ptr;
  }
  void chk() const {
    CHECK(store_ptr <= store_end);
  }
  bool empty() const {
    return store_ptr == store_end;
  }
  void store_uint(unsigned long long value, unsigned bytes) {
    unsigned char *ptr = store_ptr += bytes;
    chk();
    while (bytes) {
      *--ptr = value & 0xff;
      value >>= 8;
      --bytes;
    }
  }
  void store_bytes(unsigned char const *data, size_t s) {
    store_ptr += s;
    chk();
    std::memcpy(store_ptr - s, data, s);
  }
  uint32 get_crc32() const {
    return crc32c(Slice{store_start, store_ptr});
  }

 private:
  unsigned char *store_start;
  unsigned char *store_ptr;
  unsigned char *store_end;
};
}  // namespace boc_writers
}  // namespace cellkit
