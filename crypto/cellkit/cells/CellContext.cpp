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
#include "cellkit/cells/CellContext.h"

#include "cellkit/cells/DataCell.h"
#include "cellkit/cells/VirtualCell.h"

namespace cellkit {

namespace {
Result<Ref<Cell>> create_data_cell(const CellParts &parts) {
  TRY_RESULT(cell, DataCell::create(parts.data, parts.bit_len, parts.refs, parts.is_special, parts.level_mask));
  return Ref<Cell>(std::move(cell));
}
}  // namespace

EmptyCellContext &EmptyCellContext::get() {
  static EmptyCellContext context;
  return context;
}

Result<Ref<Cell>> EmptyCellContext::finalize_cell(const CellParts &parts) {
  return create_data_cell(parts);
}

Result<Ref<Cell>> EmptyCellContext::load_cell(Ref<Cell> cell, LoadMode mode) {
  return std::move(cell);
}

Result<const Cell *> EmptyCellContext::load_dyn_cell(const Cell *cell, LoadMode mode) {
  return cell;
}

void GasCellContext::register_library(Ref<Cell> library) {
  CHECK(library.not_null());
  auto hash = library->get_hash();
  libraries_[hash] = std::move(library);
}

Result<Ref<Cell>> GasCellContext::finalize_cell(const CellParts &parts) {
  TRY_STATUS(gas_.consume_chk(GasLimits::cell_create_gas_price));
  return create_data_cell(parts);
}

Result<Ref<Cell>> GasCellContext::load_cell(Ref<Cell> cell, LoadMode mode) {
  CHECK(cell.not_null());
  if (use_gas(mode)) {
    TRY_STATUS(register_cell_load(*cell));
  }
  if (resolve(mode)) {
    return resolve_cell(std::move(cell));
  }
  return std::move(cell);
}

Result<const Cell *> GasCellContext::load_dyn_cell(const Cell *cell, LoadMode mode) {
  CHECK(cell != nullptr);
  if (use_gas(mode)) {
    TRY_STATUS(register_cell_load(*cell));
  }
  if (!resolve(mode)) {
    return cell;
  }
  TRY_RESULT(resolved, resolve_cell(Ref<Cell>(cell)));
  const Cell *res = resolved.get();
  if (res != cell) {
    resolved_cells_.push_back(std::move(resolved));
  }
  return res;
}

Status GasCellContext::register_cell_load(const Cell &cell) {
  bool is_new = loaded_cells_.insert(cell.get_hash()).second;
  return gas_.consume_chk(is_new ? GasLimits::cell_load_gas_price : GasLimits::cell_reload_gas_price);
}

Result<Ref<Cell>> GasCellContext::resolve_cell(Ref<Cell> cell) {
  TRY_RESULT(loaded_cell, cell->load_cell());
  auto &data_cell = loaded_cell.data_cell;
  switch (data_cell->special_type()) {
    case Cell::SpecialType::Library: {
      auto hash = CellHash::from_slice(data_cell->get_data_slice().substr(1, Cell::hash_bytes));
      auto it = libraries_.find(hash);
      if (it == libraries_.end()) {
        return excno_error(Excno::cell_und, PSLICE() << "failed to load library cell " << hash);
      }
      return it->second;
    }
    case Cell::SpecialType::MerkleProof:
      return data_cell->get_ref(0)->virtualize(Cell::VirtualizationParameters(0, 1));
    case Cell::SpecialType::PrunnedBranch:
      return excno_error(Excno::virt_err, PSLICE() << "cannot load pruned branch cell " << cell->get_hash());
    default:
      return std::move(cell);
  }
}

}  // namespace cellkit
