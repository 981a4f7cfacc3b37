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
#include "cellkit/cells/GasLimits.h"
#include "cellkit/utils/Span.h"

#include <map>
#include <optional>
#include <unordered_set>

namespace cellkit {

enum class LoadMode : uint8 {
  Noop = 0,
  UseGas = 1,
  Resolve = 2,
  Full = 3,
};

inline LoadMode operator|(LoadMode a, LoadMode b) {
  return static_cast<LoadMode>(static_cast<uint8>(a) | static_cast<uint8>(b));
}

inline bool use_gas(LoadMode mode) {
  return (static_cast<uint8>(mode) & static_cast<uint8>(LoadMode::UseGas)) != 0;
}

inline bool resolve(LoadMode mode) {
  return (static_cast<uint8>(mode) & static_cast<uint8>(LoadMode::Resolve)) != 0;
}

// Cell under construction. level_mask is set when the descriptor was read from a serialized form.
struct CellParts {
  Slice data;
  unsigned bit_len{0};
  Span<Ref<Cell>> refs;
  bool is_special{false};
  std::optional<Cell::LevelMask> level_mask;
};

class CellContext {
 public:
  virtual ~CellContext() = default;

  virtual Result<Ref<Cell>> finalize_cell(const CellParts &parts) = 0;
  virtual Result<Ref<Cell>> load_cell(Ref<Cell> cell, LoadMode mode) = 0;
  // The returned pointer stays valid while both the argument and the context are alive.
  virtual Result<const Cell *> load_dyn_cell(const Cell *cell, LoadMode mode) = 0;
};

class EmptyCellContext final : public CellContext {
 public:
  static EmptyCellContext &get();

  Result<Ref<Cell>> finalize_cell(const CellParts &parts) override;
  Result<Ref<Cell>> load_cell(Ref<Cell> cell, LoadMode mode) override;
  Result<const Cell *> load_dyn_cell(const Cell *cell, LoadMode mode) override;
};

class GasCellContext final : public CellContext {
 public:
  explicit GasCellContext(GasLimits &gas) : gas_(gas) {
  }

  void register_library(Ref<Cell> library);
  void set_libraries(std::map<CellHash, Ref<Cell>> libraries) {
    libraries_ = std::move(libraries);
  }

  Result<Ref<Cell>> finalize_cell(const CellParts &parts) override;
  Result<Ref<Cell>> load_cell(Ref<Cell> cell, LoadMode mode) override;
  Result<const Cell *> load_dyn_cell(const Cell *cell, LoadMode mode) override;

  const GasLimits &gas() const {
    return gas_;
  }
  size_t loaded_cells_count() const {
    return loaded_cells_.size();
  }
  bool is_loaded(const CellHash &hash) const {
    return loaded_cells_.count(hash) != 0;
  }

 private:
  GasLimits &gas_;
  std::map<CellHash, Ref<Cell>> libraries_;
  std::unordered_set<CellHash, CellHashHasher> loaded_cells_;
  vector<Ref<Cell>> resolved_cells_;

  Status register_cell_load(const Cell &cell);
  Result<Ref<Cell>> resolve_cell(Ref<Cell> cell);
};

}  // namespace cellkit
