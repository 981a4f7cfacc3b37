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
#include "cellkit/cells/CellContext.h"
#include "cellkit/cells/CellSlice.h"
#include "cellkit/cells/DataCell.h"
#include "cellkit/cells/VirtualCell.h"
#include "cellkit/excno.hpp"
#include "cellkit/utils/tests.h"

namespace {

using namespace cellkit;

Ref<DataCell> make_leaf(uint64 value, unsigned bits = 32) {
  CellBuilder cb;
  CHECK(cb.store_ulong_bool(value, bits));
  return cb.finalize().move_as_ok();
}

Ref<DataCell> make_pruned(const CellHash &hash, uint16 depth) {
  CellBuilder cb;
  CHECK(cb.store_ulong_bool(static_cast<uint8>(Cell::SpecialType::PrunnedBranch), 8) &&
        cb.store_ulong_bool(1, 8) && cb.store_bytes_bool(hash.as_slice()) && cb.store_ulong_bool(depth, 16));
  return cb.finalize(true).move_as_ok();
}

Result<Ref<DataCell>> make_merkle_proof(Ref<Cell> child) {
  CellBuilder cb;
  CHECK(cb.store_ulong_bool(static_cast<uint8>(Cell::SpecialType::MerkleProof), 8) &&
        cb.store_bytes_bool(child->get_hash(0).as_slice()) && cb.store_ulong_bool(child->get_depth(0), 16) &&
        cb.store_ref_bool(std::move(child)));
  return cb.finalize(true);
}

Ref<DataCell> make_library(const CellHash &hash) {
  CellBuilder cb;
  CHECK(cb.store_ulong_bool(static_cast<uint8>(Cell::SpecialType::Library), 8) &&
        cb.store_bytes_bool(hash.as_slice()));
  return cb.finalize(true).move_as_ok();
}

}  // namespace

TEST(Cells, empty_cell) {
  auto cell = CellBuilder().finalize().move_as_ok();
  ASSERT_EQ(cell->get_hash().to_hex(), "96a296d224f285c67bee93c30f8a309157f0daa35dc5b87e410b78630a09cfc7");
  ASSERT_EQ(cell->get_depth(), 0);
  ASSERT_EQ(cell->get_level(), 0u);
  ASSERT_EQ(cell->size(), 0u);
  ASSERT_EQ(cell->special_type(), Cell::SpecialType::Ordinary);
  ASSERT_EQ(cell->to_hex(), "0000");
}

TEST(Cells, builder_capacity) {
  CellBuilder cb;
  ASSERT_TRUE(cb.store_ones_bool(1000));
  ASSERT_TRUE(cb.store_zeroes_bool(23));
  ASSERT_EQ(cb.size(), 1023u);
  ASSERT_EQ(cb.remaining_bits(), 0u);
  ASSERT_TRUE(!cb.store_ones_bool(1));
  ASSERT_EQ(cb.size(), 1023u);
  ASSERT_EQ(get_excno(cb.store_long_chk(0, 1)), Excno::cell_ov);

  auto leaf = make_leaf(1);
  for (int i = 0; i < 4; i++) {
    ASSERT_TRUE(cb.store_ref_bool(leaf));
  }
  ASSERT_TRUE(!cb.store_ref_bool(leaf));
  ASSERT_EQ(get_excno(cb.store_ref_chk(leaf)), Excno::cell_ov);
  ASSERT_EQ(cb.size_refs(), 4u);

  auto cell = cb.finalize().move_as_ok();
  ASSERT_EQ(cell->size(), 1023u);
  ASSERT_EQ(cell->size_refs(), 4u);
  ASSERT_EQ(cell->get_depth(), 1);
  ASSERT_EQ(cell->get_serialized_size(), 2 + 128);

  CellBuilder small;
  ASSERT_TRUE(!small.store_ulong_bool(256, 8));
  ASSERT_TRUE(!small.store_long_bool(-129, 8));
  ASSERT_TRUE(small.store_long_bool(-128, 8));
  ASSERT_EQ(small.size(), 8u);
  small.reset();
  ASSERT_EQ(small.size(), 0u);
}

TEST(Cells, partial_byte_descriptor) {
  CellBuilder cb;
  ASSERT_TRUE(cb.store_ulong_bool(5, 3));
  auto cell = cb.finalize().move_as_ok();
  ASSERT_EQ(cell->size(), 3u);
  ASSERT_EQ(cell->to_hex(), "0001b0");
  ASSERT_EQ(cell->construct_d2(), 1);
}

TEST(Cells, cell_slice) {
  auto leaf = make_leaf(0xdeadbeef);
  CellBuilder cb;
  ASSERT_TRUE(cb.store_ulong_bool(0xab, 8));
  ASSERT_TRUE(cb.store_long_bool(-5, 16));
  ASSERT_TRUE(cb.store_ref_bool(leaf));
  auto cell = cb.finalize().move_as_ok();

  auto cs = load_cell_slice(cell).move_as_ok();
  ASSERT_EQ(cs.size(), 24u);
  ASSERT_EQ(cs.size_refs(), 1u);
  ASSERT_EQ(cs.prefetch_ulong(4), 0xau);
  ASSERT_EQ(cs.fetch_ulong(8), 0xabu);
  ASSERT_EQ(cs.fetch_long(16), -5);
  ASSERT_TRUE(cs.empty());
  ASSERT_EQ(get_excno(cs.fetch_ulong_chk(1).move_as_error()), Excno::cell_und);

  auto child = cs.fetch_ref();
  ASSERT_TRUE(child.not_null());
  ASSERT_EQ(child->get_hash(), leaf->get_hash());
  ASSERT_TRUE(cs.empty_ext());
  ASSERT_TRUE(cs.fetch_ref().is_null());
  ASSERT_EQ(get_excno(cs.fetch_ref_chk().move_as_error()), Excno::cell_und);

  auto child_cs = load_cell_slice(child).move_as_ok();
  unsigned char buf[4];
  ASSERT_TRUE(child_cs.fetch_bits_to(buf, 32));
  ASSERT_EQ(Slice(buf, 4), Slice("\xde\xad\xbe\xef"));
}

TEST(Cells, store_slice) {
  CellBuilder cb;
  ASSERT_TRUE(cb.store_ulong_bool(0x1234, 16));
  ASSERT_TRUE(cb.store_ref_bool(make_leaf(7)));
  auto cell = cb.finalize().move_as_ok();

  auto cs = load_cell_slice(cell).move_as_ok();
  ASSERT_TRUE(cs.advance(4));
  CellBuilder copy;
  ASSERT_TRUE(copy.store_ulong_bool(1, 4));
  ASSERT_TRUE(copy.store_slice_bool(cs));
  ASSERT_EQ(copy.finalize().move_as_ok()->get_hash(), cell->get_hash());
}

TEST(Cells, exotic_validation) {
  CellBuilder cb;
  ASSERT_TRUE(cb.store_ulong_bool(0, 8));
  ASSERT_EQ(get_excno(cb.finalize(true).move_as_error()), Excno::invalid_cell);

  auto pruned_level0 = [] {
    CellBuilder cb;
    CHECK(cb.store_ulong_bool(1, 8) && cb.store_ulong_bool(0, 8) && cb.store_zeroes_bool(256 + 16));
    return cb.finalize(true);
  }();
  ASSERT_EQ(get_excno(pruned_level0.move_as_error()), Excno::invalid_cell);

  auto proof_without_ref = [] {
    CellBuilder cb;
    CHECK(cb.store_ulong_bool(3, 8) && cb.store_zeroes_bool(256 + 16));
    return cb.finalize(true);
  }();
  ASSERT_EQ(get_excno(proof_without_ref.move_as_error()), Excno::invalid_cell);

  auto leaf = make_leaf(42);
  auto short_update = [&] {
    CellBuilder cb;
    CHECK(cb.store_ulong_bool(4, 8) && cb.store_zeroes_bool(256) && cb.store_ref_bool(leaf) &&
          cb.store_ref_bool(leaf));
    return cb.finalize(true);
  }();
  ASSERT_EQ(get_excno(short_update.move_as_error()), Excno::invalid_cell);

  auto wrong_proof = [&] {
    CellBuilder cb;
    CHECK(cb.store_ulong_bool(3, 8) && cb.store_zeroes_bool(256) && cb.store_ulong_bool(leaf->get_depth(0), 16) &&
          cb.store_ref_bool(leaf));
    return cb.finalize(true);
  }();
  ASSERT_EQ(get_excno(wrong_proof.move_as_error()), Excno::invalid_cell);

  auto library = make_library(leaf->get_hash());
  ASSERT_EQ(library->special_type(), Cell::SpecialType::Library);
  ASSERT_EQ(library->get_level(), 0u);

  auto proof = make_merkle_proof(leaf).move_as_ok();
  ASSERT_EQ(proof->special_type(), Cell::SpecialType::MerkleProof);
  ASSERT_EQ(proof->get_depth(), 1);
}

TEST(Cells, pruned_branch) {
  auto leaf = make_leaf(1);
  auto pruned = make_pruned(leaf->get_hash(), 17);
  ASSERT_EQ(pruned->get_level(), 1u);
  ASSERT_EQ(pruned->get_level_mask().get_mask(), 1u);
  ASSERT_EQ(pruned->get_hash(0), leaf->get_hash());
  ASSERT_EQ(pruned->get_depth(0), 17);
  ASSERT_EQ(pruned->get_depth(), 0);
  ASSERT_TRUE(pruned->get_hash() != leaf->get_hash());

  CellBuilder cb;
  ASSERT_TRUE(cb.store_ref_bool(pruned));
  auto deep_parent = cb.finalize().move_as_ok();
  ASSERT_EQ(deep_parent->get_level(), 1u);
  ASSERT_EQ(deep_parent->get_depth(0), 18);
  ASSERT_EQ(deep_parent->get_depth(), 1);

  CellBuilder pruned_cb;
  ASSERT_TRUE(pruned_cb.store_ref_bool(make_pruned(leaf->get_hash(), leaf->get_depth())));
  auto parent = pruned_cb.finalize().move_as_ok();
  ASSERT_TRUE(parent->get_hash(0) != parent->get_hash(1));

  CellBuilder original;
  ASSERT_TRUE(original.store_ref_bool(leaf));
  // hiding a subtree behind a pruned branch keeps the level 0 hash
  ASSERT_EQ(parent->get_hash(0), original.finalize().move_as_ok()->get_hash());
}

TEST(Cells, pruned_branch_with_mask_gap) {
  auto first = make_leaf(7);
  auto second = make_leaf(8);
  auto make_gap_pruned = [&](bool with_second_level) {
    CellBuilder cb;
    CHECK(cb.store_ulong_bool(static_cast<uint8>(Cell::SpecialType::PrunnedBranch), 8) &&
          cb.store_ulong_bool(0b010, 8) && cb.store_bytes_bool(first->get_hash().as_slice()));
    if (with_second_level) {
      CHECK(cb.store_bytes_bool(second->get_hash().as_slice()));
    }
    CHECK(cb.store_ulong_bool(11, 16));
    if (with_second_level) {
      CHECK(cb.store_ulong_bool(12, 16));
    }
    return cb.finalize(true);
  };

  // mask 0b010 has level 2, so two (hash, depth) pairs are stored
  ASSERT_EQ(get_excno(make_gap_pruned(false).move_as_error()), Excno::invalid_cell);
  auto pruned = make_gap_pruned(true).move_as_ok();
  ASSERT_EQ(pruned->size(), 16u + 2 * (256 + 16));
  ASSERT_EQ(pruned->get_level(), 2u);
  ASSERT_EQ(pruned->get_level_mask().get_mask(), 0b010u);
  ASSERT_EQ(pruned->get_hash(0), first->get_hash());
  ASSERT_EQ(pruned->get_hash(1), second->get_hash());
  ASSERT_EQ(pruned->get_depth(0), 11);
  ASSERT_EQ(pruned->get_depth(1), 12);
  ASSERT_EQ(pruned->get_depth(2), 0);
  ASSERT_TRUE(pruned->get_hash(2) != first->get_hash() && pruned->get_hash(2) != second->get_hash());
  ASSERT_EQ(pruned->get_hash(3), pruned->get_hash(2));

  CellBuilder cb;
  ASSERT_TRUE(cb.store_ref_bool(pruned));
  auto parent = cb.finalize().move_as_ok();
  ASSERT_EQ(parent->get_level_mask().get_mask(), 0b010u);
  ASSERT_EQ(parent->get_depth(0), 12);
  ASSERT_EQ(parent->get_hash(1), parent->get_hash(0));
  ASSERT_TRUE(parent->get_hash(2) != parent->get_hash(0));

  auto declared = DataCell::create(pruned->get_data_slice(), pruned->size(), {}, true, Cell::LevelMask(0b011));
  ASSERT_EQ(get_excno(declared.move_as_error()), Excno::invalid_cell);
  ASSERT_TRUE(DataCell::create(pruned->get_data_slice(), pruned->size(), {}, true, Cell::LevelMask(0b010)).is_ok());
}

TEST(Cells, depth_overflow) {
  auto pruned = make_pruned(make_leaf(1)->get_hash(), 0xffff);
  ASSERT_EQ(pruned->get_depth(0), 0xffff);
  CellBuilder cb;
  ASSERT_TRUE(cb.store_ref_bool(pruned));
  ASSERT_EQ(get_excno(cb.finalize().move_as_error()), Excno::depth_overflow);
}

TEST(Cells, declared_level_mask) {
  unsigned char data[] = {0x80};
  auto r_cell = DataCell::create(Slice(data, 1), 1, {}, false, Cell::LevelMask(1));
  ASSERT_EQ(get_excno(r_cell.move_as_error()), Excno::invalid_cell);
  ASSERT_TRUE(DataCell::create(Slice(data, 1), 1, {}, false, Cell::LevelMask(0)).is_ok());

  Ref<Cell> refs[1];
  ASSERT_EQ(get_excno(DataCell::create(Slice(data, 1), 1, refs, false).move_as_error()), Excno::invalid_cell);
}

TEST(Cells, virtual_cell) {
  auto leaf = make_leaf(5);
  CellBuilder cb;
  ASSERT_TRUE(cb.store_ulong_bool(9, 8));
  ASSERT_TRUE(cb.store_ref_bool(make_pruned(leaf->get_hash(), leaf->get_depth())));
  auto cell = cb.finalize().move_as_ok();
  ASSERT_EQ(cell->get_level(), 1u);

  auto same = cell->virtualize(Cell::VirtualizationParameters(3, 0));
  ASSERT_TRUE(same.get() == cell.get());

  auto virt = cell->virtualize(Cell::VirtualizationParameters(0, 1));
  ASSERT_TRUE(virt->is_virtualized());
  ASSERT_EQ(virt->get_level(), 0u);
  ASSERT_EQ(virt->get_virtualization(), 1u);
  ASSERT_EQ(virt->get_hash(), cell->get_hash(0));
  ASSERT_EQ(virt->get_hash(2), cell->get_hash(0));
  ASSERT_EQ(virt->get_depth(), cell->get_depth(0));

  auto cs = load_cell_slice(virt).move_as_ok();
  ASSERT_EQ(cs.fetch_ulong(8), 9u);
  auto child = cs.fetch_ref();
  ASSERT_TRUE(child->is_virtualized());
  ASSERT_EQ(child->get_level(), 0u);
  ASSERT_EQ(child->get_hash(), leaf->get_hash());
}

TEST(Cells, gas_context_charges) {
  GasLimits gas(10000);
  GasCellContext context(gas);
  CellBuilder cb;
  ASSERT_TRUE(cb.store_ulong_bool(3, 2));
  auto cell = cb.finalize_ext(context).move_as_ok();
  ASSERT_EQ(gas.gas_consumed(), 500);

  context.load_cell(cell, LoadMode::UseGas).ensure();
  ASSERT_EQ(gas.gas_consumed(), 600);
  ASSERT_TRUE(context.is_loaded(cell->get_hash()));
  context.load_cell(cell, LoadMode::Full).ensure();
  ASSERT_EQ(gas.gas_consumed(), 625);
  context.load_cell(cell, LoadMode::Resolve).ensure();
  ASSERT_EQ(gas.gas_consumed(), 625);
  ASSERT_EQ(context.loaded_cells_count(), 1u);

  auto cs = load_cell_slice(cell, context).move_as_ok();
  ASSERT_EQ(cs.fetch_ulong(2), 3u);
  ASSERT_EQ(gas.gas_consumed(), 650);
  ASSERT_TRUE(gas.final_ok());
}

TEST(Cells, gas_context_out_of_gas) {
  GasLimits gas(550);
  GasCellContext context(gas);
  auto cell = CellBuilder().finalize_ext(context).move_as_ok();
  ASSERT_EQ(get_excno(context.load_cell(cell, LoadMode::UseGas).move_as_error()), Excno::out_of_gas);
  ASSERT_TRUE(!gas.final_ok());
  ASSERT_EQ(get_excno(CellBuilder().finalize_ext(context).move_as_error()), Excno::out_of_gas);
}

TEST(Cells, gas_context_resolve) {
  GasLimits gas;
  GasCellContext context(gas);
  auto leaf = make_leaf(77);
  auto library = make_library(leaf->get_hash());

  ASSERT_EQ(get_excno(context.load_cell(library, LoadMode::Resolve).move_as_error()), Excno::cell_und);
  ASSERT_TRUE(context.load_cell(library, LoadMode::UseGas).move_as_ok().get() == library.get());
  context.register_library(leaf);
  auto resolved = context.load_cell(library, LoadMode::Full).move_as_ok();
  ASSERT_EQ(resolved->get_hash(), leaf->get_hash());

  auto proof = make_merkle_proof(leaf).move_as_ok();
  auto inner = context.load_cell(proof, LoadMode::Resolve).move_as_ok();
  ASSERT_TRUE(inner->is_virtualized());
  ASSERT_EQ(inner->get_hash(), leaf->get_hash());

  auto dyn = context.load_dyn_cell(proof.get(), LoadMode::Resolve).move_as_ok();
  ASSERT_TRUE(dyn != proof.get());
  ASSERT_EQ(dyn->get_hash(), leaf->get_hash());
  ASSERT_TRUE(context.load_dyn_cell(leaf.get(), LoadMode::Resolve).move_as_ok() == leaf.get());

  auto pruned = make_pruned(leaf->get_hash(), 0);
  ASSERT_EQ(get_excno(context.load_cell(pruned, LoadMode::Resolve).move_as_error()), Excno::virt_err);
  ASSERT_TRUE(context.load_cell(pruned, LoadMode::Noop).is_ok());
}

TEST(Cells, empty_context) {
  auto &context = EmptyCellContext::get();
  auto leaf = make_leaf(1);
  auto proof = make_merkle_proof(leaf).move_as_ok();
  ASSERT_TRUE(context.load_cell(proof, LoadMode::Full).move_as_ok().get() == proof.get());
  ASSERT_TRUE(context.load_dyn_cell(proof.get(), LoadMode::Full).move_as_ok() == proof.get());
}

TEST(Cells, long_chain_release) {
  Ref<Cell> cell = CellBuilder().finalize().move_as_ok();
  for (int i = 0; i < 60000; i++) {
    CellBuilder cb;
    CHECK(cb.store_ref_bool(std::move(cell)));
    cell = cb.finalize().move_as_ok();
  }
  ASSERT_EQ(cell->get_depth(), 60000);
  auto released = ref_get_delete_count();
  cell.clear();
  ASSERT_EQ(ref_get_delete_count() - released, 60001);
  ASSERT_TRUE(cell.is_null());
}
