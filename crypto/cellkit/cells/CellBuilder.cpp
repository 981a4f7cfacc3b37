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
#include "cellkit/cells/CellBuilder.h"

#include "cellkit/cells/CellSlice.h"
#include "cellkit/common/bitstring.h"
#include "cellkit/excno.hpp"

namespace cellkit {

namespace {
Status overflow_error(Slice what) {
  return excno_error(Excno::cell_ov, PSLICE() << "cannot store " << what << " into a cell builder");
}
}  // namespace

bool CellBuilder::store_bits_bool(const unsigned char *str, std::size_t bit_count, int bit_offset) {
  if (!can_extend_by(bit_count)) {
    return false;
  }
  bitstring::bits_memcpy(data_.data(), static_cast<int>(bits_), str, bit_offset, bit_count);
  bits_ += static_cast<unsigned>(bit_count);
  return true;
}

bool CellBuilder::store_long_bool(int64 val, unsigned val_bits) {
  if (val_bits > 64 || !can_extend_by(val_bits)) {
    return false;
  }
  if (val_bits < 64) {
    int64 bound = val_bits ? (int64{1} << (val_bits - 1)) : 0;
    if (val_bits == 0 ? val != 0 : (val < -bound || val >= bound)) {
      return false;
    }
  }
  bitstring::bits_store_long(data_.data(), static_cast<int>(bits_), static_cast<uint64>(val), val_bits);
  bits_ += val_bits;
  return true;
}

bool CellBuilder::store_ulong_bool(uint64 val, unsigned val_bits) {
  if (val_bits > 64 || !can_extend_by(val_bits)) {
    return false;
  }
  if (val_bits < 64 && (val >> val_bits) != 0) {
    return false;
  }
  bitstring::bits_store_long(data_.data(), static_cast<int>(bits_), val, val_bits);
  bits_ += val_bits;
  return true;
}

bool CellBuilder::store_zeroes_bool(std::size_t bit_count) {
  if (!can_extend_by(bit_count)) {
    return false;
  }
  bitstring::bits_memset(data_.data(), static_cast<int>(bits_), false, bit_count);
  bits_ += static_cast<unsigned>(bit_count);
  return true;
}

bool CellBuilder::store_ones_bool(std::size_t bit_count) {
  if (!can_extend_by(bit_count)) {
    return false;
  }
  bitstring::bits_memset(data_.data(), static_cast<int>(bits_), true, bit_count);
  bits_ += static_cast<unsigned>(bit_count);
  return true;
}

bool CellBuilder::store_ref_bool(Ref<Cell> ref) {
  if (ref.is_null() || refs_cnt_ >= Cell::max_refs) {
    return false;
  }
  refs_[refs_cnt_++] = std::move(ref);
  return true;
}

bool CellBuilder::store_builder_bool(const CellBuilder &other) {
  if (!can_extend_by(other.bits_, other.refs_cnt_)) {
    return false;
  }
  bitstring::bits_memcpy(data_.data(), static_cast<int>(bits_), other.data(), 0, other.bits_);
  bits_ += other.bits_;
  for (unsigned i = 0; i < other.refs_cnt_; i++) {
    refs_[refs_cnt_++] = other.refs_[i];
  }
  return true;
}

bool CellBuilder::store_slice_bool(const CellSlice &cs) {
  if (!cs.is_valid() || !can_extend_by(cs.size(), cs.size_refs())) {
    return false;
  }
  bitstring::bits_memcpy(data_.data(), static_cast<int>(bits_), cs.data(), static_cast<int>(cs.cur_pos()), cs.size());
  bits_ += cs.size();
  for (unsigned i = 0; i < cs.size_refs(); i++) {
    refs_[refs_cnt_++] = cs.prefetch_ref(i);
  }
  return true;
}

Status CellBuilder::store_bits_chk(const unsigned char *str, std::size_t bit_count, int bit_offset) {
  if (!store_bits_bool(str, bit_count, bit_offset)) {
    return overflow_error(PSLICE() << bit_count << " bits");
  }
  return Status::OK();
}

Status CellBuilder::store_long_chk(int64 val, unsigned val_bits) {
  if (!store_long_bool(val, val_bits)) {
    return overflow_error(PSLICE() << val_bits << "-bit signed integer " << val);
  }
  return Status::OK();
}

Status CellBuilder::store_ulong_chk(uint64 val, unsigned val_bits) {
  if (!store_ulong_bool(val, val_bits)) {
    return overflow_error(PSLICE() << val_bits << "-bit unsigned integer " << val);
  }
  return Status::OK();
}

Status CellBuilder::store_ref_chk(Ref<Cell> ref) {
  if (!store_ref_bool(std::move(ref))) {
    return overflow_error("reference");
  }
  return Status::OK();
}

void CellBuilder::reset() {
  for (unsigned i = 0; i < refs_cnt_; i++) {
    refs_[i].clear();
  }
  data_.fill(0);
  bits_ = refs_cnt_ = 0;
}

CellParts CellBuilder::to_parts(bool special) const {
  CellParts parts;
  parts.data = Slice(data_.data(), (bits_ + 7) / 8);
  parts.bit_len = bits_;
  parts.refs = Span<Ref<Cell>>(refs_.data(), refs_cnt_);
  parts.is_special = special;
  return parts;
}

Result<Ref<DataCell>> CellBuilder::finalize(bool special) const {
  auto parts = to_parts(special);
  return DataCell::create(parts.data, parts.bit_len, parts.refs, parts.is_special);
}

Result<Ref<Cell>> CellBuilder::finalize_ext(CellContext &context, bool special) const {
  return context.finalize_cell(to_parts(special));
}

}  // namespace cellkit
