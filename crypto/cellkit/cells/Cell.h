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

#include "cellkit/cells/CellHash.h"
#include "cellkit/cells/CellTraits.h"
#include "cellkit/common/refcnt.hpp"
#include "cellkit/utils/Status.h"
#include "cellkit/utils/common.h"

namespace cellkit {

class DataCell;

class Cell : public CntObject, public CellTraits {
 public:
  using LevelMask = detail::LevelMask;
  using VirtualizationParameters = detail::VirtualizationParameters;
  using Hash = CellHash;
  static_assert(std::is_standard_layout<CellHash>::value, "CellHash is not a standard layout type");
  static_assert(sizeof(CellHash) == hash_bytes, "");

  struct LoadedCell {
    Ref<DataCell> data_cell;
    VirtualizationParameters virt;
  };

  Cell() = default;
  Cell(const Cell &other) = delete;
  ~Cell() override = default;

  virtual Result<LoadedCell> load_cell() const = 0;
  virtual Ref<Cell> virtualize(VirtualizationParameters virt) const;
  virtual uint32 get_virtualization() const = 0;
  virtual bool is_virtualized() const {
    return false;
  }

  virtual LevelMask get_level_mask() const = 0;
  uint32 get_level() const {
    return get_level_mask().get_level();
  }

  // level defaults to the representation hash
  Hash get_hash(uint32 level = max_level) const {
    return do_get_hash(level);
  }
  uint16 get_depth(uint32 level = max_level) const {
    return do_get_depth(level);
  }

 protected:
  virtual Hash do_get_hash(uint32 level) const = 0;
  virtual uint16 do_get_depth(uint32 level) const = 0;
};

std::ostream &operator<<(std::ostream &os, const Cell &cell);

}  // namespace cellkit
