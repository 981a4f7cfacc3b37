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
#include "cellkit/cells/DataCell.h"

namespace cellkit {

class VirtualCell : public Cell {
 private:
  struct PrivateTag {};

 public:
  static Ref<Cell> create(VirtualizationParameters virt, Ref<Cell> cell) {
    if (cell->get_level() <= virt.get_level() && virt.get_virtualization() <= cell->get_virtualization()) {
      return cell;
    }
    return make_ref<VirtualCell>(virt, std::move(cell), PrivateTag{});
  }

  VirtualCell(VirtualizationParameters virt, Ref<Cell> cell, PrivateTag) : virt_(virt), cell_(std::move(cell)) {
  }

  // load interface
  Result<LoadedCell> load_cell() const override {
    TRY_RESULT(loaded_cell, cell_->load_cell());
    loaded_cell.virt = loaded_cell.virt.apply(virt_);
    return std::move(loaded_cell);
  }

  Ref<Cell> virtualize(VirtualizationParameters virt) const override {
    return create(virt_.apply(virt), cell_);
  }

  uint32 get_virtualization() const override {
    return std::max<uint32>(virt_.get_virtualization(), cell_->get_virtualization());
  }

  bool is_virtualized() const override {
    return true;
  }

  // hash and level
  LevelMask get_level_mask() const override {
    return cell_->get_level_mask().apply(virt_.get_level());
  }

 protected:
  Hash do_get_hash(uint32 level) const override {
    return cell_->get_hash(std::min<uint32>(virt_.get_level(), level));
  }
  uint16 do_get_depth(uint32 level) const override {
    return cell_->get_depth(std::min<uint32>(virt_.get_level(), level));
  }

 private:
  VirtualizationParameters virt_;
  Ref<Cell> cell_;
};

}  // namespace cellkit
