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
#include "cellkit/boc.h"

#include "cellkit/utils/base64.h"
#include "cellkit/utils/crypto.h"
#include "cellkit/utils/misc.h"

namespace cellkit {

template class BocEncoder<CellHashHasher>;

namespace {

uint64 read_be(const unsigned char *ptr, int bytes) {
  uint64 res = 0;
  while (bytes-- > 0) {
    res = (res << 8) | *ptr++;
  }
  return res;
}

bool is_known_tag(uint32 tag) {
  return tag == BocTag::Generic || tag == BocTag::Indexed || tag == BocTag::IndexedCrc32;
}

Status boc_error(Excno exc_no, Slice message) {
  LOG(DEBUG) << "bag-of-cells rejected: " << message;
  return excno_error(exc_no, message);
}

}  // namespace

Result<Ref<Cell>> ProcessedCells::get_root(uint32 index) const {
  auto cell = get(index);
  if (cell.is_null()) {
    return excno_error(Excno::root_cell_not_found, PSLICE() << "bag-of-cells error: root cell #" << index << " not found");
  }
  return std::move(cell);
}

Result<BocHeader> BocHeader::decode(Slice data, const Options &options) {
  BocHeader res;
  const auto *base = data.ubegin();
  uint64 size = data.size();
  if (size < 4) {
    return boc_error(Excno::unexpected_eof, "bag-of-cells is too short to contain a tag");
  }
  res.tag_ = static_cast<uint32>(read_be(base, 4));
  if (!is_known_tag(res.tag_)) {
    return boc_error(Excno::unknown_boc_tag, PSLICE() << "unknown bag-of-cells tag " << hex_encode(data.substr(0, 4)));
  }
  if (size < 6) {
    return boc_error(Excno::unexpected_eof, "bag-of-cells header is truncated");
  }
  uint8 byte = base[4];
  if (res.tag_ == BocTag::Generic) {
    res.has_index_ = (byte >> 7) & 1;
    res.has_crc32c_ = (byte >> 6) & 1;
    res.has_cache_bits_ = (byte >> 5) & 1;
  } else {
    res.has_index_ = true;
    res.has_crc32c_ = res.tag_ == BocTag::IndexedCrc32;
  }
  if (res.has_cache_bits_ && !res.has_index_) {
    return boc_error(Excno::invalid_header, "bag-of-cells error: cache bits require an index");
  }
  res.ref_byte_size_ = byte & 7;
  if (res.ref_byte_size_ > 4 || res.ref_byte_size_ < 1) {
    return boc_error(Excno::invalid_header,
                     PSLICE() << "bag-of-cells error: invalid reference size " << res.ref_byte_size_);
  }
  res.offset_byte_size_ = base[5];
  if (res.offset_byte_size_ > 8 || res.offset_byte_size_ < 1) {
    return boc_error(Excno::invalid_header,
                     PSLICE() << "bag-of-cells error: invalid offset size " << res.offset_byte_size_);
  }
  const int rs = res.ref_byte_size_;
  const int os = res.offset_byte_size_;
  uint64 pos = 6;
  if (size < pos + 3 * rs + os) {
    return boc_error(Excno::unexpected_eof, "bag-of-cells header is truncated");
  }
  uint64 cell_count = read_be(base + pos, rs);
  uint64 root_count = read_be(base + pos + rs, rs);
  res.absent_count_ = read_be(base + pos + 2 * rs, rs);
  pos += 3 * rs;
  res.total_cells_size_ = read_be(base + pos, os);
  pos += os;

  if (cell_count == 0) {
    return boc_error(Excno::invalid_header, "bag-of-cells error: no cells");
  }
  if (root_count < options.min_roots || root_count > options.max_roots) {
    return boc_error(Excno::unexpected_root_count, PSLICE() << "bag-of-cells has " << root_count
                                                            << " roots, expected between " << options.min_roots
                                                            << " and " << options.max_roots);
  }
  if (root_count > cell_count) {
    return boc_error(Excno::invalid_header, PSLICE() << "bag-of-cells error: " << root_count << " roots but only "
                                                     << cell_count << " cells");
  }
  if (res.tag_ != BocTag::Generic && root_count != 1) {
    return boc_error(Excno::invalid_header, "bag-of-cells error: indexed format supports exactly one root");
  }
  if (res.absent_count_ > cell_count) {
    return boc_error(Excno::invalid_header, "bag-of-cells error: too many absent cells");
  }
  const uint64 tot = res.total_cells_size_;
  if (tot < cell_count * (2 + rs) - rs || tot > (cell_count << 10)) {
    return boc_error(Excno::invalid_header,
                     PSLICE() << "bag-of-cells error: invalid total cells size " << tot << " for " << cell_count
                              << " cells");
  }

  uint64 roots_size = res.tag_ == BocTag::Generic ? root_count * rs : 0;
  uint64 index_size = res.has_index_ ? cell_count * os : 0;
  uint64 expected = pos + roots_size + index_size + tot + (res.has_crc32c_ ? 4 : 0);
  if (size < expected) {
    return boc_error(Excno::unexpected_eof, PSLICE() << "bag-of-cells is truncated: " << size << " bytes of "
                                                     << expected << " expected");
  }
  if (size > expected) {
    return boc_error(Excno::invalid_header, PSLICE() << "bag-of-cells has " << size - expected
                                                     << " unexpected trailing bytes");
  }

  if (res.tag_ == BocTag::Generic) {
    for (uint64 i = 0; i < root_count; i++) {
      uint64 idx = read_be(base + pos, rs);
      pos += rs;
      if (idx >= cell_count) {
        return boc_error(Excno::invalid_header,
                         PSLICE() << "bag-of-cells error: root #" << i << " refers to non-existent cell #" << idx);
      }
      res.roots_.push_back(static_cast<uint32>(idx));
    }
  } else {
    res.roots_.push_back(0);
  }

  vector<uint64> index;
  if (res.has_index_) {
    index.reserve(static_cast<size_t>(cell_count));
    uint64 prev = 0;
    for (uint64 i = 0; i < cell_count; i++) {
      uint64 offs = read_be(base + pos, os);
      pos += os;
      if (res.has_cache_bits_) {
        offs >>= 1;
      }
      if (offs < prev || offs > tot) {
        return boc_error(Excno::invalid_header, PSLICE() << "bag-of-cells error: invalid index entry #" << i);
      }
      index.push_back(offs);
      prev = offs;
    }
  }

  const uint64 cells_start = pos;
  const uint64 cells_end = cells_start + tot;
  res.cells_.resize(static_cast<size_t>(cell_count));
  for (uint64 i = 0; i < cell_count; i++) {
    auto &cell = res.cells_[static_cast<size_t>(i)];
    auto truncated = [&]() {
      return boc_error(Excno::unexpected_eof,
                       PSLICE() << "bag-of-cells error: cell #" << i << " extends past the end of cell data");
    };
    if (pos + 2 > cells_end) {
      return truncated();
    }
    uint8 d1 = base[pos];
    uint8 d2 = base[pos + 1];
    pos += 2;
    cell.refs_cnt = d1 & 7;
    cell.is_special = (d1 & 8) != 0;
    bool with_hashes = (d1 & 16) != 0;
    cell.level_mask = Cell::LevelMask(d1 >> 5);
    if (cell.refs_cnt > Cell::max_refs) {
      return boc_error(Excno::invalid_cell,
                       PSLICE() << "bag-of-cells error: cell #" << i << " has " << cell.refs_cnt << " references");
    }
    if (with_hashes) {
      uint64 hashes_size = cell.level_mask.get_hashes_count() * (Cell::hash_bytes + Cell::depth_bytes);
      if (pos + hashes_size > cells_end) {
        return truncated();
      }
      cell.stored_hashes = data.substr(static_cast<size_t>(pos), static_cast<size_t>(hashes_size));
      pos += hashes_size;
    }
    unsigned data_len = (d2 >> 1) + (d2 & 1);
    if (pos + data_len > cells_end) {
      return truncated();
    }
    cell.data = data.substr(static_cast<size_t>(pos), data_len);
    if (d2 & 1) {
      uint8 last = base[pos + data_len - 1];
      if ((last & 0x7f) == 0) {
        return boc_error(Excno::invalid_cell,
                         PSLICE() << "bag-of-cells error: cell #" << i << " has a non-canonical completion tag");
      }
      cell.bit_len = (data_len - 1) * 8 + 7 - count_trailing_zeroes32(last);
    } else {
      cell.bit_len = data_len * 8;
    }
    pos += data_len;
    if (pos + cell.refs_cnt * rs > cells_end) {
      return truncated();
    }
    for (unsigned k = 0; k < cell.refs_cnt; k++) {
      uint64 ref = read_be(base + pos, rs);
      pos += rs;
      if (ref <= i) {
        return boc_error(Excno::invalid_ref, PSLICE() << "bag-of-cells error: reference #" << k << " of cell #" << i
                                                      << " is to cell #" << ref << " with smaller index");
      }
      if (ref >= cell_count) {
        return boc_error(Excno::invalid_ref, PSLICE() << "bag-of-cells error: reference #" << k << " of cell #" << i
                                                      << " is to non-existent cell #" << ref << ", only "
                                                      << cell_count << " cells are defined");
      }
      cell.refs[k] = static_cast<uint32>(ref);
    }
    if (res.has_index_ && pos - cells_start != index[static_cast<size_t>(i)]) {
      return boc_error(Excno::invalid_header,
                       PSLICE() << "bag-of-cells error: cell #" << i << " does not end at its index offset");
    }
  }
  if (pos != cells_end) {
    return boc_error(Excno::invalid_header, PSLICE() << "bag-of-cells error: cells occupy " << pos - cells_start
                                                     << " bytes instead of " << tot);
  }

  if (res.has_crc32c_) {
    uint32 stored = static_cast<uint32>(base[pos]) | (static_cast<uint32>(base[pos + 1]) << 8) |
                    (static_cast<uint32>(base[pos + 2]) << 16) | (static_cast<uint32>(base[pos + 3]) << 24);
    uint32 computed = crc32c(data.substr(0, static_cast<size_t>(pos)));
    if (stored != computed) {
      return boc_error(Excno::invalid_checksum, "bag-of-cells CRC32C mismatch");
    }
  }
  return std::move(res);
}

Status BocHeader::check_stored_hashes(const RawCell &raw, const Cell &cell) {
  auto mask = cell.get_level_mask();
  size_t hashes_count = mask.get_hashes_count();
  CHECK(raw.stored_hashes.size() == hashes_count * (Cell::hash_bytes + Cell::depth_bytes));
  auto hashes = raw.stored_hashes.substr(0, hashes_count * Cell::hash_bytes);
  auto depths = raw.stored_hashes.substr(hashes_count * Cell::hash_bytes);
  for (unsigned level = 0, k = 0; level <= mask.get_level(); level++) {
    if (!mask.is_significant(level)) {
      continue;
    }
    if (cell.get_hash(level).as_slice() != hashes.substr(k * Cell::hash_bytes, Cell::hash_bytes)) {
      return excno_error(Excno::invalid_cell, PSLICE() << "stored hash of level " << level << " does not match");
    }
    if (cell.get_depth(level) != DataCell::load_depth(depths.substr(k * Cell::depth_bytes).ubegin())) {
      return excno_error(Excno::invalid_cell, PSLICE() << "stored depth of level " << level << " does not match");
    }
    k++;
  }
  return Status::OK();
}

Result<ProcessedCells> BocHeader::finalize(CellContext &context) const {
  size_t cell_count = cells_.size();
  vector<Ref<Cell>> cells(cell_count);
  for (size_t i = cell_count; i-- > 0;) {
    const auto &raw = cells_[i];
    std::array<Ref<Cell>, Cell::max_refs> refs;
    for (unsigned k = 0; k < raw.refs_cnt; k++) {
      refs[k] = cells[raw.refs[k]];
      CHECK(refs[k].not_null());
    }
    CellParts parts{raw.data, raw.bit_len, Span<Ref<Cell>>(refs.data(), raw.refs_cnt), raw.is_special,
                    raw.level_mask};
    TRY_RESULT_PREFIX(cell, context.finalize_cell(parts),
                      PSLICE() << "bag-of-cells error: failed to deserialize cell #" << i << ": ");
    if (!raw.stored_hashes.empty()) {
      TRY_STATUS_PREFIX(check_stored_hashes(raw, *cell), PSLICE() << "bag-of-cells error: cell #" << i << ": ");
    }
    cells[i] = std::move(cell);
  }
  return ProcessedCells{std::move(cells)};
}

namespace {

Result<vector<Ref<Cell>>> deserialize_roots(Slice data, size_t root_count, CellContext &context) {
  TRY_RESULT(header, BocHeader::decode(data, {root_count, root_count}));
  TRY_RESULT(cells, header.finalize(context));
  vector<Ref<Cell>> roots;
  for (auto idx : header.roots()) {
    TRY_RESULT(root, cells.get_root(idx));
    roots.push_back(std::move(root));
  }
  return std::move(roots);
}

}  // namespace

Result<string> std_boc_serialize(Ref<Cell> root, int mode) {
  BocEncoder<> encoder;
  TRY_STATUS(encoder.add_root(std::move(root)));
  return encoder.encode(mode);
}

Result<string> std_boc_serialize_pair(Ref<Cell> first, Ref<Cell> second, int mode) {
  BocEncoder<> encoder;
  TRY_STATUS(encoder.add_root(std::move(first)));
  TRY_STATUS(encoder.add_root(std::move(second)));
  return encoder.encode(mode);
}

Result<string> std_boc_serialize_base64(Ref<Cell> root, int mode) {
  TRY_RESULT(data, std_boc_serialize(std::move(root), mode));
  return base64_encode(data);
}

Result<Ref<Cell>> std_boc_deserialize(Slice data) {
  return std_boc_deserialize_ext(data, EmptyCellContext::get());
}

Result<Ref<Cell>> std_boc_deserialize_ext(Slice data, CellContext &context) {
  TRY_RESULT(roots, deserialize_roots(data, 1, context));
  return std::move(roots[0]);
}

Result<std::pair<Ref<Cell>, Ref<Cell>>> std_boc_deserialize_pair(Slice data) {
  return std_boc_deserialize_pair_ext(data, EmptyCellContext::get());
}

Result<std::pair<Ref<Cell>, Ref<Cell>>> std_boc_deserialize_pair_ext(Slice data, CellContext &context) {
  TRY_RESULT(roots, deserialize_roots(data, 2, context));
  return std::make_pair(std::move(roots[0]), std::move(roots[1]));
}

Result<Ref<Cell>> std_boc_deserialize_base64(Slice base64) {
  TRY_RESULT(data, base64_decode(base64));
  return std_boc_deserialize(data);
}

CellHash boc_file_hash(Slice data) {
  CellHash hash;
  sha256(data, hash.as_slice());
  return hash;
}

}  // namespace cellkit
