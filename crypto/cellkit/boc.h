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

#include "cellkit/boc-writers.h"
#include "cellkit/cells/CellContext.h"
#include "cellkit/cells/DataCell.h"
#include "cellkit/excno.hpp"
#include "cellkit/utils/Status.h"
#include "cellkit/utils/misc.h"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <utility>

namespace cellkit {

struct BocTag {
  static constexpr uint32 Indexed = 0x68ff65f3;
  static constexpr uint32 IndexedCrc32 = 0xacc3a728;
  static constexpr uint32 Generic = 0xb5ee9c72;
};

struct BagOfCells {
  enum Mode { WithIndex = 1, WithCRC32C = 2, WithTopHash = 4, WithCacheBits = 16 };
};

/*
 *
 *   BAG OF CELLS ENCODER
 *
 */

// Serializes the cells reachable from the roots, each distinct cell exactly once.
// Cells are numbered so that every reference points to a cell with a greater index.
template <class HasherT = CellHashHasher>
class BocEncoder {
 public:
  Status add_root(Ref<Cell> root) {
    if (root.is_null()) {
      return excno_error(Excno::invalid_cell, "cannot serialize a null root cell");
    }
    if (root->is_virtualized()) {
      return excno_error(Excno::virt_err, "cannot serialize a virtualized root cell");
    }
    roots_.push_back(std::move(root));
    return Status::OK();
  }

  size_t get_root_count() const {
    return roots_.size();
  }

  Result<string> encode(int mode = 0) {
    if ((mode & BagOfCells::WithCacheBits) && !(mode & BagOfCells::WithIndex)) {
      return excno_error(Excno::invalid_header, "cache bits require an index");
    }
    if (roots_.empty()) {
      return excno_error(Excno::invalid_cell, "no cells to serialize");
    }
    TRY_STATUS(import_cells());
    TRY_RESULT(data_bytes, compute_sizes(mode));
    return serialize(mode, data_bytes);
  }

 private:
  struct CellInfo {
    Ref<DataCell> dc;
    std::array<int, Cell::max_refs> ref_idx{};
    int parents{0};
    bool is_root_cell{false};

    unsigned get_ref_num() const {
      return dc->size_refs();
    }
  };

  vector<Ref<Cell>> roots_;
  vector<int> root_idx_;
  // cells in post-order: children always precede their parents
  vector<CellInfo> cells_;
  std::unordered_map<CellHash, int, HasherT> cell_index_;
  int ref_byte_size_{0};
  int offset_byte_size_{0};

  Result<Ref<DataCell>> load_data_cell(const Ref<Cell> &cell) const {
    TRY_RESULT(loaded_cell, cell->load_cell());
    if (loaded_cell.virt.is_virtualized()) {
      return excno_error(Excno::virt_err, "cannot serialize a virtualized cell");
    }
    return std::move(loaded_cell.data_cell);
  }

  Result<int> import_root(const Ref<Cell> &root) {
    auto it = cell_index_.find(root->get_hash());
    if (it != cell_index_.end()) {
      return it->second;
    }
    struct Frame {
      Ref<DataCell> dc;
      unsigned remaining;
      std::array<int, Cell::max_refs> ref_idx;
    };
    vector<Frame> stack;
    TRY_RESULT(root_dc, load_data_cell(root));
    unsigned root_refs = root_dc->size_refs();
    stack.push_back(Frame{std::move(root_dc), root_refs, {}});
    int last_idx = -1;
    while (!stack.empty()) {
      auto &frame = stack.back();
      if (frame.remaining > 0) {
        unsigned i = --frame.remaining;
        auto child = frame.dc->get_ref(i);
        auto child_it = cell_index_.find(child->get_hash());
        if (child_it != cell_index_.end()) {
          frame.ref_idx[i] = child_it->second;
          cells_[child_it->second].parents++;
          continue;
        }
        TRY_RESULT(child_dc, load_data_cell(child));
        unsigned child_refs = child_dc->size_refs();
        stack.push_back(Frame{std::move(child_dc), child_refs, {}});
        continue;
      }
      last_idx = static_cast<int>(cells_.size());
      auto hash = frame.dc->get_hash();
      cells_.push_back(CellInfo{std::move(frame.dc), frame.ref_idx, 0, false});
      cell_index_.emplace(hash, last_idx);
      stack.pop_back();
      if (!stack.empty()) {
        auto &parent = stack.back();
        parent.ref_idx[parent.remaining] = last_idx;
        cells_[last_idx].parents++;
      }
    }
    return last_idx;
  }

  Status import_cells() {
    root_idx_.assign(roots_.size(), -1);
    cells_.clear();
    cell_index_.clear();
    // importing the roots backwards puts the first root first once the order is reversed
    for (size_t i = roots_.size(); i-- > 0;) {
      TRY_RESULT(idx, import_root(roots_[i]));
      cells_[idx].is_root_cell = true;
      root_idx_[i] = idx;
    }
    if (cells_.size() >= (1ULL << 32)) {
      return excno_error(Excno::cell_ov, "bag of cells is too large");
    }
    LOG(DEBUG) << "imported " << cells_.size() << " cells from " << roots_.size() << " root(s)";
    return Status::OK();
  }

  static bool with_hashes(const CellInfo &info, int mode) {
    return info.is_root_cell && (mode & BagOfCells::WithTopHash);
  }

  unsigned serialized_size(const CellInfo &info, int mode) const {
    return static_cast<unsigned>(info.dc->get_serialized_size(with_hashes(info, mode))) +
           info.get_ref_num() * static_cast<unsigned>(ref_byte_size_);
  }

  Result<uint64> compute_sizes(int mode) {
    int rs = 0, os = 0;
    uint64 cell_count = cells_.size();
    while (cell_count >= (1ULL << (rs << 3))) {
      rs++;
    }
    if (rs > 4) {
      return excno_error(Excno::cell_ov, "bag of cells is too large");
    }
    ref_byte_size_ = rs;
    uint64 data_bytes = 0;
    for (const auto &info : cells_) {
      data_bytes += serialized_size(info, mode);
    }
    uint64 max_offset = (mode & BagOfCells::WithCacheBits) ? data_bytes * 2 : data_bytes;
    while (os < 8 && max_offset >= (1ULL << (os << 3))) {
      os++;
    }
    offset_byte_size_ = std::max(os, 1);
    return data_bytes;
  }

  Result<string> serialize(int mode, uint64 data_bytes) const {
    bool has_index = mode & BagOfCells::WithIndex;
    bool has_crc32c = mode & BagOfCells::WithCRC32C;
    bool has_cache_bits = mode & BagOfCells::WithCacheBits;
    int cell_count = static_cast<int>(cells_.size());
    uint64 roots_offset = 4 + 1 + 1 + 3 * ref_byte_size_ + offset_byte_size_;
    uint64 data_offset = roots_offset + roots_.size() * ref_byte_size_;
    if (has_index) {
      data_offset += static_cast<uint64>(cell_count) * offset_byte_size_;
    }
    uint64 total_size = data_offset + data_bytes + (has_crc32c ? 4 : 0);
    TRY_RESULT(size, narrow_cast_safe<size_t>(total_size));

    string res(size, '\0');
    auto begin = reinterpret_cast<unsigned char *>(&res[0]);
    boc_writers::BufferWriter writer{begin, begin + size};
    auto store_ref = [&](unsigned long long value) { writer.store_uint(value, ref_byte_size_); };
    auto store_offset = [&](unsigned long long value) { writer.store_uint(value, offset_byte_size_); };

    writer.store_uint(BocTag::Generic, 4);

    uint8 byte{0};
    if (has_index) {
      byte |= 1 << 7;
    }
    if (has_crc32c) {
      byte |= 1 << 6;
    }
    if (has_cache_bits) {
      byte |= 1 << 5;
    }
    byte |= static_cast<uint8>(ref_byte_size_);
    writer.store_uint(byte, 1);

    writer.store_uint(offset_byte_size_, 1);
    store_ref(cell_count);
    store_ref(roots_.size());
    store_ref(0);
    store_offset(data_bytes);
    for (int idx : root_idx_) {
      int k = cell_count - 1 - idx;
      DCHECK(k >= 0 && k < cell_count);
      store_ref(k);
    }
    if (has_index) {
      uint64 offs = 0;
      for (int i = cell_count - 1; i >= 0; --i) {
        const auto &info = cells_[i];
        offs += serialized_size(info, mode);
        auto fixed_offset = offs;
        if (has_cache_bits) {
          fixed_offset = offs * 2 + (info.parents > 1);
        }
        store_offset(fixed_offset);
      }
      DCHECK(offs == data_bytes);
    }
    DCHECK(writer.position() == data_offset);
    for (int i = 0; i < cell_count; ++i) {
      const auto &info = cells_[cell_count - 1 - i];
      unsigned char buf[Cell::max_serialized_bytes];
      int s = info.dc->serialize(buf, sizeof(buf), with_hashes(info, mode));
      CHECK(s > 0);
      writer.store_bytes(buf, s);
      unsigned ref_num = info.get_ref_num();
      for (unsigned j = 0; j < ref_num; ++j) {
        int k = cell_count - 1 - info.ref_idx[j];
        DCHECK(k > i && k < cell_count);
        store_ref(k);
      }
    }
    DCHECK(writer.position() == data_offset + data_bytes);
    if (has_crc32c) {
      uint32 crc = writer.get_crc32();
      writer.store_uint(bswap32(crc), 4);
    }
    DCHECK(writer.empty());
    LOG(DEBUG) << "serialized " << cell_count << " cells into " << size << " bytes";
    return std::move(res);
  }
};

extern template class BocEncoder<CellHashHasher>;

/*
 *
 *   BAG OF CELLS DECODER
 *
 */

class ProcessedCells {
 public:
  ProcessedCells() = default;
  explicit ProcessedCells(vector<Ref<Cell>> cells) : cells_(std::move(cells)) {
  }

  size_t size() const {
    return cells_.size();
  }
  // null when the index is out of range or the cell is absent
  Ref<Cell> get(uint32 index) const {
    return index < cells_.size() ? cells_[index] : Ref<Cell>{};
  }
  Result<Ref<Cell>> get_root(uint32 index) const;

 private:
  vector<Ref<Cell>> cells_;
};

// Validated header and raw cell records of a serialized bag of cells.
// Keeps slices into the source buffer, which must outlive it.
class BocHeader {
 public:
  struct Options {
    size_t min_roots{1};
    size_t max_roots{1};
  };

  struct RawCell {
    Slice data;
    unsigned bit_len{0};
    bool is_special{false};
    Cell::LevelMask level_mask;
    Slice stored_hashes;
    unsigned refs_cnt{0};
    std::array<uint32, Cell::max_refs> refs{};
  };

  static Result<BocHeader> decode(Slice data, const Options &options);

  uint32 get_tag() const {
    return tag_;
  }
  int get_ref_byte_size() const {
    return ref_byte_size_;
  }
  int get_offset_byte_size() const {
    return offset_byte_size_;
  }
  bool has_index() const {
    return has_index_;
  }
  bool has_crc32c() const {
    return has_crc32c_;
  }
  bool has_cache_bits() const {
    return has_cache_bits_;
  }
  uint64 get_cell_count() const {
    return cells_.size();
  }
  uint64 get_absent_count() const {
    return absent_count_;
  }
  uint64 get_total_cells_size() const {
    return total_cells_size_;
  }
  const vector<uint32> &roots() const {
    return roots_;
  }
  const vector<RawCell> &cells() const {
    return cells_;
  }

  Result<ProcessedCells> finalize(CellContext &context) const;

 private:
  uint32 tag_{0};
  int ref_byte_size_{0};
  int offset_byte_size_{0};
  bool has_index_{false};
  bool has_crc32c_{false};
  bool has_cache_bits_{false};
  uint64 absent_count_{0};
  uint64 total_cells_size_{0};
  vector<uint32> roots_;
  vector<RawCell> cells_;

  static Status check_stored_hashes(const RawCell &raw, const Cell &cell);
};

/*
 *
 *   WHOLE-TREE HELPERS
 *
 */

Result<string> std_boc_serialize(Ref<Cell> root, int mode = 0);
Result<string> std_boc_serialize_pair(Ref<Cell> first, Ref<Cell> second, int mode = 0);
Result<string> std_boc_serialize_base64(Ref<Cell> root, int mode = 0);

Result<Ref<Cell>> std_boc_deserialize(Slice data);
Result<Ref<Cell>> std_boc_deserialize_ext(Slice data, CellContext &context);
Result<std::pair<Ref<Cell>, Ref<Cell>>> std_boc_deserialize_pair(Slice data);
Result<std::pair<Ref<Cell>, Ref<Cell>>> std_boc_deserialize_pair_ext(Slice data, CellContext &context);
Result<Ref<Cell>> std_boc_deserialize_base64(Slice base64);

// SHA-256 of the serialized bytes
CellHash boc_file_hash(Slice data);

}  // namespace cellkit
