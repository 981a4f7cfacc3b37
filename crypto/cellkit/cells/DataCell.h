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

#include "cellkit/cells/Cell.h"
#include "cellkit/common/bitstring.h"
#include "cellkit/utils/Span.h"

#include <array>
#include <new>
#include <optional>

namespace cellkit {

namespace detail {

struct LevelInfo {
  CellHash hash;
  uint16 depth;
};

}  // namespace detail

class DataCell final : public Cell {
 public:
  // declared_level_mask is the mask read from a serialized descriptor, if any
  static Result<Ref<DataCell>> create(Slice data, unsigned bit_length, Span<Ref<Cell>> refs, bool is_special,
                                      std::optional<LevelMask> declared_level_mask = {});

  static void store_depth(uint8 *dest, uint16 depth) {
    bitstring::bits_store_long(dest, depth, depth_bits);
  }

  static uint16 load_depth(const uint8 *src) {
    return bitstring::bits_load_ulong(src, depth_bits) & 0xffff;
  }

  void operator delete(DataCell *ptr, std::destroying_delete_t) {
    ptr->~DataCell();
    ::operator delete(ptr);
  }

  DataCell(DataCell const &) = delete;
  DataCell(DataCell &&) = delete;

  ~DataCell() override;

  Result<LoadedCell> load_cell() const override {
    return LoadedCell{Ref<DataCell>{this}, {}};
  }

  uint32 get_virtualization() const override {
    return virtualization_;
  }

  LevelMask get_level_mask() const override {
    return LevelMask{level_mask_};
  }

  unsigned size_refs() const {
    return refs_cnt_;
  }

  unsigned size() const {
    return bit_length_;
  }

  unsigned char const *get_data() const {
    return reinterpret_cast<unsigned char const *>(trailer_ + sizeof(detail::LevelInfo) * (level_ + 1));
  }

  Slice get_data_slice() const {
    return Slice(get_data(), (bit_length_ + 7) / 8);
  }

  Ref<Cell> get_ref(unsigned idx) const {
    if (idx >= refs_cnt_) {
      return {};
    }
    return refs_[idx];
  }

  Cell *get_ref_raw_ptr(unsigned idx) const {
    DCHECK(idx < refs_cnt_);
    return const_cast<Cell *>(refs_[idx].get());
  }

  bool is_special() const {
    return type_ != static_cast<uint8>(SpecialType::Ordinary);
  }

  SpecialType special_type() const {
    return static_cast<SpecialType>(type_);
  }

  int get_serialized_size(bool with_hashes = false) const {
    return ((size() + 23) >> 3) +
           (with_hashes ? get_level_mask().get_hashes_count() * (hash_bytes + depth_bytes) : 0);
  }

  int serialize(unsigned char *buff, int buff_size, bool with_hashes = false) const;

  std::string serialize() const;

  std::string to_hex() const;

  uint8 construct_d1(uint32 level) const {
    return static_cast<uint8>(refs_cnt_ + (is_special() << 3) + (get_level_mask().apply(level).get_mask() << 5));
  }

  uint8 construct_d2() const {
    return static_cast<uint8>(bit_length_ / 8 + (bit_length_ + 7) / 8);
  }

 private:
  DataCell(unsigned bit_length, size_t refs_cnt, SpecialType type, LevelMask level_mask, uint8 virtualization);

  detail::LevelInfo const *level_info() const {
    return reinterpret_cast<detail::LevelInfo const *>(trailer_);
  }

  uint16 do_get_depth(uint32 level) const override {
    return level_info()[std::min<uint32>(level_, level)].depth;
  }

  Hash do_get_hash(uint32 level) const override {
    return level_info()[std::min<uint32>(level_, level)].hash;
  }

  unsigned bit_length_ : 11;
  unsigned refs_cnt_ : 3;
  unsigned type_ : 3;
  unsigned level_ : 3;
  unsigned level_mask_ : 3;
  unsigned virtualization_ : 8;

  std::array<Ref<Cell>, max_refs> refs_{};

  alignas(detail::LevelInfo) char trailer_[];
};

inline std::ostream &operator<<(std::ostream &os, const DataCell &c) {
  return os << c.to_hex();
}

}  // namespace cellkit
