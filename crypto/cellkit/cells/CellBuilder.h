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

#include "cellkit/cells/CellContext.h"
#include "cellkit/cells/DataCell.h"

#include <array>

namespace cellkit {

class CellSlice;

class CellBuilder {
 public:
  CellBuilder() = default;

  unsigned size() const {
    return bits_;
  }
  unsigned size_refs() const {
    return refs_cnt_;
  }
  unsigned remaining_bits() const {
    return Cell::max_bits - bits_;
  }
  unsigned remaining_refs() const {
    return Cell::max_refs - refs_cnt_;
  }
  bool can_extend_by(std::size_t bits) const {
    return bits <= remaining_bits();
  }
  bool can_extend_by(std::size_t bits, unsigned refs) const {
    return bits <= remaining_bits() && refs <= remaining_refs();
  }
  const unsigned char *data() const {
    return data_.data();
  }
  Ref<Cell> get_ref(unsigned idx) const {
    return idx < refs_cnt_ ? refs_[idx] : Ref<Cell>{};
  }

  bool store_bits_bool(const unsigned char *str, std::size_t bit_count, int bit_offset = 0);
  bool store_bytes_bool(Slice bytes) {
    return store_bits_bool(bytes.ubegin(), bytes.size() * 8);
  }
  bool store_long_bool(int64 val, unsigned val_bits = 64);
  bool store_ulong_bool(uint64 val, unsigned val_bits = 64);
  bool store_zeroes_bool(std::size_t bit_count);
  bool store_ones_bool(std::size_t bit_count);
  bool store_ref_bool(Ref<Cell> ref);
  bool store_builder_bool(const CellBuilder &other);
  bool store_slice_bool(const CellSlice &cs);

  Status store_bits_chk(const unsigned char *str, std::size_t bit_count, int bit_offset = 0);
  Status store_long_chk(int64 val, unsigned val_bits);
  Status store_ulong_chk(uint64 val, unsigned val_bits);
  Status store_ref_chk(Ref<Cell> ref);

  void reset();

  Result<Ref<DataCell>> finalize(bool special = false) const;
  Result<Ref<Cell>> finalize_ext(CellContext &context, bool special = false) const;

 private:
  unsigned bits_{0};
  unsigned refs_cnt_{0};
  std::array<unsigned char, Cell::max_bytes> data_{};
  std::array<Ref<Cell>, Cell::max_refs> refs_;

  CellParts to_parts(bool special) const;
};

}  // namespace cellkit
