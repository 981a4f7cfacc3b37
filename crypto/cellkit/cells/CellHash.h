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

#include "cellkit/cells/CellTraits.h"
#include "cellkit/utils/Slice.h"
#include "cellkit/utils/base64.h"
#include "cellkit/utils/common.h"
#include "cellkit/utils/logging.h"

#include <array>
#include <cstring>
#include <ostream>

namespace cellkit {

struct CellHash {
 public:
  Slice as_slice() const {
    return Slice(hash_.data(), hash_.size());
  }
  MutableSlice as_slice() {
    return MutableSlice(hash_.data(), hash_.size());
  }
  bool operator==(const CellHash &other) const {
    return hash_ == other.hash_;
  }
  bool operator!=(const CellHash &other) const {
    return hash_ != other.hash_;
  }
  bool operator<(const CellHash &other) const {
    return hash_ < other.hash_;
  }
  string to_hex() const {
    return hex_encode(as_slice());
  }
  static CellHash from_slice(Slice slice) {
    CellHash res;
    CHECK(slice.size() == res.hash_.size());
    std::memcpy(res.hash_.data(), slice.data(), res.hash_.size());
    return res;
  }

 private:
  std::array<unsigned char, CellTraits::hash_bytes> hash_{};
};

inline std::ostream &operator<<(std::ostream &os, const CellHash &hash) {
  return os << hash.to_hex();
}

// Picks eight bytes of an already uniformly distributed hash for hash-table keys.
struct CellHashHasher {
  size_t operator()(const CellHash &hash) const {
    size_t res;
    std::memcpy(&res, hash.as_slice().data(), sizeof(res));
    return res;
  }
};

}  // namespace cellkit
