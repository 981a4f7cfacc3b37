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
#include "cellkit/cells/DataCell.h"

#include "cellkit/excno.hpp"
#include "cellkit/utils/crypto.h"

#include <algorithm>
#include <cstring>
#include <limits>

namespace cellkit {

namespace {

constexpr unsigned max_level = CellTraits::max_level;
constexpr unsigned hash_bytes = CellTraits::hash_bytes;
constexpr unsigned depth_bytes = CellTraits::depth_bytes;

// Keeps the top used_bits of a partial byte and appends the completion tag.
uint8 complete_last_byte(uint8 byte, unsigned used_bits) {
  return static_cast<uint8>((byte & (0xff00u >> used_bits)) | (0x80u >> used_bits));
}

struct CellInfo {
  Cell::SpecialType type{Cell::SpecialType::Ordinary};
  Cell::LevelMask level_mask;
  uint8 virtualization{0};
  std::array<CellHash, max_level + 1> hashes{};
  std::array<uint16, max_level + 1> depths{};
};

// Validates the raw parts of a cell and derives its level mask, hashes and depths.
class CellValidator {
 public:
  CellValidator(Slice data, unsigned bit_len, Span<Ref<Cell>> refs, bool is_special)
      : data_(data), bit_len_(bit_len), refs_(refs), is_special_(is_special) {
  }

  Result<CellInfo> run() {
    TRY_STATUS(read_type());
    switch (info_.type) {
      case Cell::SpecialType::Ordinary:
        for (auto &ref : refs_) {
          info_.level_mask = info_.level_mask.apply_or(ref->get_level_mask());
        }
        break;
      case Cell::SpecialType::PrunnedBranch:
        TRY_STATUS(check_pruned_branch());
        break;
      case Cell::SpecialType::Library:
        TRY_STATUS(check_layout(1 + hash_bytes, 0, "library cell"));
        break;
      case Cell::SpecialType::MerkleProof:
        TRY_STATUS(check_layout(1 + hash_bytes + depth_bytes, 1, "Merkle proof"));
        TRY_STATUS(check_merkle_children());
        break;
      case Cell::SpecialType::MerkleUpdate:
        TRY_STATUS(check_layout(1 + 2 * (hash_bytes + depth_bytes), 2, "Merkle update"));
        TRY_STATUS(check_merkle_children());
        break;
    }

    uint32 virtualization = 0;
    for (auto &ref : refs_) {
      virtualization = std::max(virtualization, ref->get_virtualization());
    }
    if (virtualization > std::numeric_limits<uint8>::max()) {
      return excno_error(Excno::virt_err, "Virtualization is too big to be stored in a DataCell");
    }
    info_.virtualization = static_cast<uint8>(virtualization);

    TRY_STATUS(compute_levels());
    return std::move(info_);
  }

 private:
  Status read_type() {
    if (!is_special_) {
      return Status::OK();
    }
    if (bit_len_ < 8) {
      return excno_error(Excno::invalid_cell, "Not enough data for a special cell");
    }
    auto tag = data_.ubegin()[0];
    if (tag < static_cast<uint8>(Cell::SpecialType::PrunnedBranch) ||
        tag > static_cast<uint8>(Cell::SpecialType::MerkleUpdate)) {
      return excno_error(Excno::invalid_cell, PSLICE() << "Invalid special cell type " << static_cast<int>(tag));
    }
    info_.type = static_cast<Cell::SpecialType>(tag);
    return Status::OK();
  }

  Status check_layout(unsigned byte_len, size_t refs_cnt, Slice what) const {
    if (refs_.size() != refs_cnt) {
      return excno_error(Excno::invalid_cell, PSLICE() << "A " << what << " must have " << refs_cnt
                                                       << " references, not " << refs_.size());
    }
    if (bit_len_ != byte_len * 8) {
      return excno_error(Excno::invalid_cell, PSLICE() << "Length mismatch in a " << what);
    }
    return Status::OK();
  }

  // [type][mask] followed by one (hash, depth) pair for every level below the pruned level:
  // all hashes first, then all depths.
  Status check_pruned_branch() {
    if (bit_len_ < 16) {
      return excno_error(Excno::invalid_cell, "Length mismatch in a pruned branch");
    }
    info_.level_mask = Cell::LevelMask{data_.ubegin()[1]};
    auto level = info_.level_mask.get_level();
    if (level == 0 || level > max_level) {
      return excno_error(Excno::invalid_cell, "Invalid level mask in a pruned branch");
    }
    return check_layout(2 + level * (hash_bytes + depth_bytes), 0, "pruned branch");
  }

  CellHash pruned_hash(unsigned level) const {
    return CellHash::from_slice(data_.substr(2 + level * hash_bytes, hash_bytes));
  }

  uint16 pruned_depth(unsigned level) const {
    auto hashes_end = 2 + info_.level_mask.get_level() * hash_bytes;
    return DataCell::load_depth(data_.ubegin() + hashes_end + level * depth_bytes);
  }

  // [type] then the level 0 hash of every child, then the level 0 depth of every child
  Status check_merkle_children() {
    Cell::LevelMask children_mask;
    auto depths_begin = 1 + refs_.size() * hash_bytes;
    for (size_t i = 0; i < refs_.size(); i++) {
      const auto &child = refs_[i];
      if (CellHash::from_slice(data_.substr(1 + i * hash_bytes, hash_bytes)) != child->get_hash(0)) {
        return excno_error(Excno::invalid_cell, PSLICE() << "Stored hash of child #" << i << " in a "
                                                         << info_.type << " does not match");
      }
      if (DataCell::load_depth(data_.ubegin() + depths_begin + i * depth_bytes) != child->get_depth(0)) {
        return excno_error(Excno::invalid_cell, PSLICE() << "Stored depth of child #" << i << " in a "
                                                         << info_.type << " does not match");
      }
      children_mask = children_mask.apply_or(child->get_level_mask());
    }
    info_.level_mask = children_mask.shift_right();
    return Status::OK();
  }

  Status compute_levels() {
    bool is_pruned = info_.type == Cell::SpecialType::PrunnedBranch;
    bool is_merkle = info_.type == Cell::SpecialType::MerkleProof || info_.type == Cell::SpecialType::MerkleUpdate;
    unsigned level_offset = is_merkle ? 1 : 0;
    auto own_level = info_.level_mask.get_level();

    bool have_previous = false;
    for (unsigned level = 0; level <= max_level; level++) {
      if (is_pruned && level < own_level) {
        info_.hashes[level] = pruned_hash(level);
        info_.depths[level] = pruned_depth(level);
        continue;
      }
      if (have_previous && !info_.level_mask.is_significant(level)) {
        info_.hashes[level] = info_.hashes[level - 1];
        info_.depths[level] = info_.depths[level - 1];
        continue;
      }
      TRY_STATUS(hash_level(level, have_previous, std::min(level + level_offset, max_level)));
      have_previous = true;
    }
    return Status::OK();
  }

  // d1 with the mask cut to `level`, d2, then the data (or the previous level hash),
  // child depths and child hashes taken at child_level
  Status hash_level(unsigned level, bool chain_previous, unsigned child_level) {
    uint8 descriptor[2];
    descriptor[0] = static_cast<uint8>(refs_.size() + (is_special_ ? 8 : 0) +
                                       (info_.level_mask.apply(level).get_mask() << 5));
    descriptor[1] = static_cast<uint8>(bit_len_ / 8 + (bit_len_ + 7) / 8);

    sha_.init();
    sha_.feed(Slice(descriptor, 2));
    if (chain_previous) {
      sha_.feed(info_.hashes[level - 1].as_slice());
    } else {
      sha_.feed(data_.substr(0, bit_len_ / 8));
      if (bit_len_ % 8 != 0) {
        uint8 last = complete_last_byte(data_.ubegin()[bit_len_ / 8], bit_len_ % 8);
        sha_.feed(Slice(&last, 1));
      }
    }

    uint32 depth = 0;
    for (auto &ref : refs_) {
      auto child_depth = ref->get_depth(child_level);
      uint8 serialized_depth[depth_bytes];
      DataCell::store_depth(serialized_depth, child_depth);
      sha_.feed(Slice(serialized_depth, depth_bytes));
      depth = std::max<uint32>(depth, child_depth + 1u);
    }
    if (depth > CellTraits::max_depth) {
      return excno_error(Excno::depth_overflow, PSLICE() << "Depth " << depth << " of level " << level
                                                         << " is too big");
    }
    for (auto &ref : refs_) {
      sha_.feed(ref->get_hash(child_level).as_slice());
    }

    sha_.extract(info_.hashes[level].as_slice());
    info_.depths[level] = static_cast<uint16>(depth);
    return Status::OK();
  }

  Slice data_;
  unsigned bit_len_;
  Span<Ref<Cell>> refs_;
  bool is_special_;
  CellInfo info_;
  Sha256State sha_;
};

}  // namespace

Result<Ref<DataCell>> DataCell::create(Slice data, unsigned bit_length, Span<Ref<Cell>> refs, bool is_special,
                                       std::optional<LevelMask> declared_level_mask) {
  CHECK(data.size() * 8 >= static_cast<size_t>(bit_length));
  if (refs.size() > CellTraits::max_refs) {
    return excno_error(Excno::invalid_cell, PSLICE() << "Too many references: " << refs.size());
  }
  if (bit_length > CellTraits::max_bits) {
    return excno_error(Excno::invalid_cell, PSLICE() << "Too many data bits: " << bit_length);
  }
  if (std::any_of(refs.begin(), refs.end(), [](const Ref<Cell> &ref) { return ref.is_null(); })) {
    return excno_error(Excno::invalid_cell, "Null reference");
  }

  TRY_RESULT(info, CellValidator(data, bit_length, refs, is_special).run());
  if (declared_level_mask && *declared_level_mask != info.level_mask) {
    return excno_error(Excno::invalid_cell, PSLICE() << "Level mask mismatch: declared " << *declared_level_mask
                                                     << ", computed " << info.level_mask);
  }

  // LevelInfo for levels 0..level, then the data bytes, live in the trailer
  auto level = info.level_mask.get_level();
  auto data_bytes = (bit_length + 7) / 8;
  auto trailer_size = sizeof(detail::LevelInfo) * (level + 1) + data_bytes;

  auto *cell = new (::operator new(sizeof(DataCell) + trailer_size))
      DataCell{bit_length, refs.size(), info.type, info.level_mask, info.virtualization};
  auto *level_info = new (cell->trailer_) detail::LevelInfo[level + 1];
  for (unsigned i = 0; i <= level; i++) {
    level_info[i] = {info.hashes[i], info.depths[i]};
  }

  auto *cell_data = reinterpret_cast<uint8 *>(cell->trailer_ + sizeof(detail::LevelInfo) * (level + 1));
  std::memcpy(cell_data, data.data(), data_bytes);
  if (bit_length % 8 != 0) {
    cell_data[bit_length / 8] = complete_last_byte(cell_data[bit_length / 8], bit_length % 8);
  }
  std::copy(refs.begin(), refs.end(), cell->refs_.begin());

  return Ref<DataCell>{cell, Ref<DataCell>::acquire_t{}};
}

DataCell::~DataCell() {
  auto *info = const_cast<detail::LevelInfo *>(level_info());
  std::destroy_n(info, level_ + 1);
}

int DataCell::serialize(unsigned char *buff, int buff_size, bool with_hashes) const {
  int len = get_serialized_size(with_hashes);
  if (len > buff_size) {
    return 0;
  }
  auto mask = get_level_mask();
  auto *ptr = buff;
  *ptr++ = static_cast<unsigned char>(construct_d1(max_level) | (with_hashes ? 16 : 0));
  *ptr++ = construct_d2();
  if (with_hashes) {
    // hashes of the significant levels, then their depths
    for (unsigned i = 0; i <= mask.get_level(); i++) {
      if (mask.is_significant(i)) {
        auto hash = get_hash(i);
        ptr = std::copy(hash.as_slice().ubegin(), hash.as_slice().uend(), ptr);
      }
    }
    for (unsigned i = 0; i <= mask.get_level(); i++) {
      if (mask.is_significant(i)) {
        store_depth(ptr, get_depth(i));
        ptr += depth_bytes;
      }
    }
  }
  auto data = get_data_slice();
  ptr = std::copy(data.ubegin(), data.uend(), ptr);
  CHECK(ptr - buff == len);
  return len;
}

std::string DataCell::serialize() const {
  unsigned char buff[max_serialized_bytes];
  int len = serialize(buff, sizeof(buff));
  return std::string(buff, buff + len);
}

std::string DataCell::to_hex() const {
  return hex_encode(serialize());
}

DataCell::DataCell(unsigned bit_length, size_t refs_cnt, SpecialType type, LevelMask level_mask, uint8 virtualization)
    : bit_length_(bit_length)
    , refs_cnt_(static_cast<uint8>(refs_cnt))
    , type_(static_cast<uint8>(type))
    , level_(static_cast<uint8>(level_mask.get_level()))
    , level_mask_(level_mask.get_mask())
    , virtualization_(virtualization) {
}

}  // namespace cellkit
