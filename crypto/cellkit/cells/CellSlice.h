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

namespace cellkit {

class CellSlice {
 public:
  using VirtualizationParameters = Cell::VirtualizationParameters;

  CellSlice() = default;
  explicit CellSlice(Cell::LoadedCell loaded_cell);
  explicit CellSlice(Ref<DataCell> cell) : CellSlice(Cell::LoadedCell{std::move(cell), {}}) {
  }

  bool is_valid() const {
    return cell_.not_null();
  }
  unsigned size() const {
    return bits_en_ - bits_st_;
  }
  unsigned size_refs() const {
    return refs_en_ - refs_st_;
  }
  bool empty() const {
    return size() == 0;
  }
  bool empty_ext() const {
    return size() == 0 && size_refs() == 0;
  }
  bool have(unsigned bits) const {
    return bits <= size();
  }
  bool have(unsigned bits, unsigned refs) const {
    return bits <= size() && refs <= size_refs();
  }
  bool have_refs(unsigned refs = 1) const {
    return refs <= size_refs();
  }

  bool is_special() const {
    return cell_.not_null() && cell_->is_special();
  }
  Cell::SpecialType special_type() const {
    return cell_.is_null() ? Cell::SpecialType::Ordinary : cell_->special_type();
  }
  const Ref<DataCell> &get_base_cell() const {
    return cell_;
  }
  VirtualizationParameters get_virtualization() const {
    return virt_;
  }
  const unsigned char *data() const {
    return cell_->get_data();
  }
  unsigned cur_pos() const {
    return bits_st_;
  }

  bool advance(unsigned bits);
  bool advance_refs(unsigned refs);

  uint64 prefetch_ulong(unsigned bits) const;
  uint64 fetch_ulong(unsigned bits);
  int64 prefetch_long(unsigned bits) const;
  int64 fetch_long(unsigned bits);
  bool prefetch_uint_to(unsigned bits, uint64 &res) const;
  bool fetch_uint_to(unsigned bits, uint64 &res);
  bool prefetch_int_to(unsigned bits, int64 &res) const;
  bool fetch_int_to(unsigned bits, int64 &res);
  bool prefetch_bits_to(unsigned char *buffer, unsigned bits) const;
  bool fetch_bits_to(unsigned char *buffer, unsigned bits);

  Ref<Cell> prefetch_ref(unsigned offset = 0) const;
  Ref<Cell> fetch_ref();

  Result<uint64> fetch_ulong_chk(unsigned bits);
  Result<int64> fetch_long_chk(unsigned bits);
  Result<Ref<Cell>> fetch_ref_chk();

  string to_hex() const;

 private:
  Ref<DataCell> cell_;
  VirtualizationParameters virt_;
  unsigned bits_st_{0}, refs_st_{0}, bits_en_{0}, refs_en_{0};

  VirtualizationParameters child_virt() const;
};

Result<CellSlice> load_cell_slice(Ref<Cell> cell, CellContext &context, LoadMode mode = LoadMode::Full);

inline Result<CellSlice> load_cell_slice(Ref<Cell> cell) {
  return load_cell_slice(std::move(cell), EmptyCellContext::get(), LoadMode::Noop);
}

}  // namespace cellkit
