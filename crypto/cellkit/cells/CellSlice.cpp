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
#include "cellkit/cells/CellSlice.h"

#include "cellkit/common/bitstring.h"
#include "cellkit/excno.hpp"

#include <limits>

namespace cellkit {

CellSlice::CellSlice(Cell::LoadedCell loaded_cell)
    : cell_(std::move(loaded_cell.data_cell)), virt_(loaded_cell.virt) {
  if (cell_.not_null()) {
    bits_en_ = cell_->size();
    refs_en_ = cell_->size_refs();
  }
}

bool CellSlice::advance(unsigned bits) {
  if (!have(bits)) {
    return false;
  }
  bits_st_ += bits;
  return true;
}

bool CellSlice::advance_refs(unsigned refs) {
  if (!have_refs(refs)) {
    return false;
  }
  refs_st_ += refs;
  return true;
}

bool CellSlice::prefetch_uint_to(unsigned bits, uint64 &res) const {
  if (bits > 64 || !have(bits) || !is_valid()) {
    return false;
  }
  res = bitstring::bits_load_ulong(data(), static_cast<int>(bits_st_), bits);
  return true;
}

bool CellSlice::fetch_uint_to(unsigned bits, uint64 &res) {
  return prefetch_uint_to(bits, res) && advance(bits);
}

bool CellSlice::prefetch_int_to(unsigned bits, int64 &res) const {
  if (bits > 64 || !have(bits) || !is_valid()) {
    return false;
  }
  res = bitstring::bits_load_long(data(), static_cast<int>(bits_st_), bits);
  return true;
}

bool CellSlice::fetch_int_to(unsigned bits, int64 &res) {
  return prefetch_int_to(bits, res) && advance(bits);
}

uint64 CellSlice::prefetch_ulong(unsigned bits) const {
  uint64 res;
  return prefetch_uint_to(bits, res) ? res : std::numeric_limits<uint64>::max();
}

uint64 CellSlice::fetch_ulong(unsigned bits) {
  uint64 res;
  return fetch_uint_to(bits, res) ? res : std::numeric_limits<uint64>::max();
}

int64 CellSlice::prefetch_long(unsigned bits) const {
  int64 res;
  return prefetch_int_to(bits, res) ? res : std::numeric_limits<int64>::min();
}

int64 CellSlice::fetch_long(unsigned bits) {
  int64 res;
  return fetch_int_to(bits, res) ? res : std::numeric_limits<int64>::min();
}

bool CellSlice::prefetch_bits_to(unsigned char *buffer, unsigned bits) const {
  if (!have(bits) || !is_valid()) {
    return false;
  }
  bitstring::bits_memcpy(buffer, 0, data(), static_cast<int>(bits_st_), bits);
  return true;
}

bool CellSlice::fetch_bits_to(unsigned char *buffer, unsigned bits) {
  return prefetch_bits_to(buffer, bits) && advance(bits);
}

Cell::VirtualizationParameters CellSlice::child_virt() const {
  auto type = special_type();
  if (type == Cell::SpecialType::MerkleProof || type == Cell::SpecialType::MerkleUpdate) {
    auto level = std::min<unsigned>(virt_.get_level() + 1u, Cell::max_level);
    return VirtualizationParameters(static_cast<uint8>(level), virt_.get_virtualization());
  }
  return virt_;
}

Ref<Cell> CellSlice::prefetch_ref(unsigned offset) const {
  if (offset >= size_refs()) {
    return {};
  }
  auto ref = cell_->get_ref(refs_st_ + offset);
  if (!virt_.is_virtualized()) {
    return ref;
  }
  return ref->virtualize(child_virt());
}

Ref<Cell> CellSlice::fetch_ref() {
  auto ref = prefetch_ref();
  if (ref.not_null()) {
    refs_st_++;
  }
  return ref;
}

Result<uint64> CellSlice::fetch_ulong_chk(unsigned bits) {
  uint64 res;
  if (!fetch_uint_to(bits, res)) {
    return excno_error(Excno::cell_und, PSLICE() << "cannot fetch " << bits << "-bit unsigned integer");
  }
  return res;
}

Result<int64> CellSlice::fetch_long_chk(unsigned bits) {
  int64 res;
  if (!fetch_int_to(bits, res)) {
    return excno_error(Excno::cell_und, PSLICE() << "cannot fetch " << bits << "-bit signed integer");
  }
  return res;
}

Result<Ref<Cell>> CellSlice::fetch_ref_chk() {
  auto ref = fetch_ref();
  if (ref.is_null()) {
    return excno_error(Excno::cell_und, "no references left in a cell slice");
  }
  return std::move(ref);
}

string CellSlice::to_hex() const {
  if (!is_valid()) {
    return "<invalid>";
  }
  return bitstring::bits_to_hex(data(), static_cast<int>(bits_st_), size());
}

Result<CellSlice> load_cell_slice(Ref<Cell> cell, CellContext &context, LoadMode mode) {
  if (cell.is_null()) {
    return excno_error(Excno::cell_und, "cannot load a null cell");
  }
  TRY_RESULT(loaded, context.load_cell(std::move(cell), mode));
  TRY_RESULT(loaded_cell, loaded->load_cell());
  return CellSlice(std::move(loaded_cell));
}

}  // namespace cellkit
