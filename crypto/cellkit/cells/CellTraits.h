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
#include "cellkit/utils/misc.h"

#include <algorithm>
#include <ostream>

namespace cellkit {

struct CellTraits {
  enum class SpecialType : uint8 {
    Ordinary = 0,
    PrunnedBranch = 1,
    Library = 2,
    MerkleProof = 3,
    MerkleUpdate = 4,
  };

  static constexpr unsigned max_refs = 4;
  static constexpr unsigned max_bits = 1023;
  static constexpr unsigned max_bytes = (max_bits + 7) / 8;
  static constexpr unsigned max_level = 3;
  static constexpr unsigned max_depth = 0xffff;
  static constexpr unsigned hash_bytes = 32;
  static constexpr unsigned hash_bits = hash_bytes * 8;
  static constexpr unsigned depth_bytes = 2;
  static constexpr unsigned depth_bits = depth_bytes * 8;
  static constexpr unsigned max_serialized_bytes = 2 + max_bytes + (max_level + 1) * (hash_bytes + depth_bytes);
};

std::ostream &operator<<(std::ostream &os, CellTraits::SpecialType special_type);

namespace detail {

class LevelMask {
 public:
  explicit LevelMask(uint32 new_mask = 0) : mask_(new_mask) {
  }
  uint32 get_mask() const {
    return mask_;
  }
  uint32 get_level() const {
    return mask_ == 0 ? 0 : 32 - count_leading_zeroes32(mask_);
  }
  uint32 get_hash_i() const {
    return count_bits32(mask_);
  }
  uint32 get_hashes_count() const {
    return get_hash_i() + 1;
  }
  LevelMask apply(uint32 level) const {
    DCHECK(level < 32);
    return LevelMask(mask_ & ((1u << level) - 1));
  }
  LevelMask apply_or(LevelMask other) const {
    return LevelMask(mask_ | other.mask_);
  }
  LevelMask shift_right() const {
    return LevelMask(mask_ >> 1);
  }
  bool is_significant(uint32 level) const {
    DCHECK(level < 32);
    return level == 0 || ((mask_ >> (level - 1)) % 2 != 0);
  }
  bool operator==(const LevelMask &other) const {
    return mask_ == other.mask_;
  }
  bool operator!=(const LevelMask &other) const {
    return !(*this == other);
  }

  static LevelMask one_level(uint32 level) {
    DCHECK(level > 0 && level <= 32);
    return LevelMask(1u << (level - 1));
  }

 private:
  uint32 mask_;
};

inline std::ostream &operator<<(std::ostream &os, LevelMask level_mask) {
  return os << level_mask.get_mask();
}

struct VirtualizationParameters {
  static constexpr uint8 max_level = CellTraits::max_level;
  uint8 level{max_level};
  uint8 virtualization{0};

  VirtualizationParameters() = default;
  VirtualizationParameters(uint8 level, uint8 virtualization) : level(level), virtualization(virtualization) {
  }

  bool is_virtualized() const {
    return level != max_level || virtualization != 0;
  }
  VirtualizationParameters apply(VirtualizationParameters outer) const {
    return VirtualizationParameters(std::min(level, outer.level), std::max(virtualization, outer.virtualization));
  }
  uint8 get_level() const {
    return level;
  }
  uint8 get_virtualization() const {
    return virtualization;
  }
  bool operator==(const VirtualizationParameters &other) const {
    return level == other.level && virtualization == other.virtualization;
  }
};

}  // namespace detail

}  // namespace cellkit
