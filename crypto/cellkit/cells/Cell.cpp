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
#include "cellkit/cells/Cell.h"

#include "cellkit/cells/VirtualCell.h"

namespace cellkit {

Ref<Cell> Cell::virtualize(VirtualizationParameters virt) const {
  return VirtualCell::create(virt, Ref<Cell>(this));
}

std::ostream &operator<<(std::ostream &os, CellTraits::SpecialType special_type) {
  switch (special_type) {
    case CellTraits::SpecialType::Ordinary:
      return os << "Ordinary";
    case CellTraits::SpecialType::PrunnedBranch:
      return os << "PrunnedBranch";
    case CellTraits::SpecialType::Library:
      return os << "Library";
    case CellTraits::SpecialType::MerkleProof:
      return os << "MerkleProof";
    case CellTraits::SpecialType::MerkleUpdate:
      return os << "MerkleUpdate";
  }
  return os << "Unknown(" << static_cast<int>(special_type) << ")";
}

std::ostream &operator<<(std::ostream &os, const Cell &cell) {
  return os << cell.get_hash().to_hex();
}

}  // namespace cellkit
