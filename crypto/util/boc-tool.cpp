/* 
    This file is part of TON Blockchain source code.

    TON Blockchain is free software; you can redistribute it and/or
    modify it under the terms of the GNU General Public License
    as published by the Free Software Foundation; either version 2
    of the License, or (at your option) any later version.

    TON Blockchain is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with TON Blockchain.  If not, see <http://www.gnu.org/licenses/>.

    In addition, as a special exception, the copyright holders give permission 
    to link the code of portions of this program with the OpenSSL library. 
    You must obey the GNU General Public License in all respects for all 
    of the code used other than OpenSSL. If you modify file(s) with this 
    exception, you may extend this exception to your version of the file(s), 
    but you are not obligated to do so. If you do not wish to do so, delete this 
    exception statement from your version. If you delete this exception statement 
    from all source files in the program, then also delete it here.

    Copyright 2017-2020 Telegram Systems LLP
*/
#include "cellkit/boc.h"
#include "cellkit/cells/CellSlice.h"
#include "cellkit/utils/base64.h"
#include "cellkit/utils/filesystem.h"

#include <cstdlib>
#include <getopt.h>
#include <iostream>

const char* progname;

int usage() {
  std::cerr << "usage: " << progname
            << " [-i][-c][-t][-C][-b][-p][-v] [-o<output-boc>] [<input-boc>]\n"
               "Decodes a bag of cells from <input-boc> (standard input by default), prints its roots "
               "and optionally re-encodes it into <output-boc>\n"
               "\t-i\twrite an index when re-encoding\n"
               "\t-c\tappend a CRC32C checksum when re-encoding\n"
               "\t-t\tstore root cell hashes when re-encoding\n"
               "\t-C\twrite cache bits when re-encoding (implies -i)\n"
               "\t-b\tinput is base64-encoded\n"
               "\t-p\texpect a pair of roots\n"
               "\t-v\tincrease verbosity\n";
  std::exit(2);
}

void print_root(int idx, const cellkit::Ref<cellkit::Cell>& root) {
  std::cout << "root #" << idx << ": hash " << root->get_hash().to_hex() << ", depth " << root->get_depth()
            << ", level " << root->get_level();
  auto loaded = root->load_cell();
  if (loaded.is_ok()) {
    auto& dc = loaded.ok().data_cell;
    std::cout << ", " << dc->size() << " bits, " << dc->size_refs() << " refs";
    if (dc->is_special()) {
      std::cout << ", " << dc->special_type();
    }
  }
  std::cout << std::endl;
}

cellkit::Status run(const std::string& input, bool base64, bool pair, int mode, const std::string& output) {
  std::string data = input;
  if (base64) {
    TRY_RESULT_ASSIGN(data, cellkit::base64_decode(cellkit::Slice(input).truncate(input.find_last_not_of("\r\n") + 1)));
  }
  size_t roots = pair ? 2 : 1;
  TRY_RESULT(header, cellkit::BocHeader::decode(data, {roots, roots}));
  TRY_RESULT(cells, header.finalize(cellkit::EmptyCellContext::get()));
  std::cout << "file hash: " << cellkit::boc_file_hash(data).to_hex() << std::endl;
  std::cout << "cells: " << header.get_cell_count() << ", total cells size: " << header.get_total_cells_size()
            << ", index: " << header.has_index() << ", crc32c: " << header.has_crc32c() << std::endl;
  cellkit::BocEncoder<> encoder;
  for (size_t i = 0; i < header.roots().size(); i++) {
    TRY_RESULT(root, cells.get_root(header.roots()[i]));
    print_root(static_cast<int>(i), root);
    TRY_STATUS(encoder.add_root(std::move(root)));
  }
  if (!output.empty()) {
    TRY_RESULT(boc, encoder.encode(mode));
    TRY_STATUS(cellkit::write_file(output, boc));
    std::cerr << "Saving " << boc.size() << " bytes of serialized bag of cells into file `" << output << "`"
              << std::endl;
  }
  return cellkit::Status::OK();
}

int main(int argc, char* const argv[]) {
  progname = argv[0];
  int i, verbosity = 0, mode = 0;
  bool base64 = false, pair = false;
  std::string output;
  while ((i = getopt(argc, argv, "ictCbpvo:h")) != -1) {
    switch (i) {
      case 'i':
        mode |= cellkit::BagOfCells::WithIndex;
        break;
      case 'c':
        mode |= cellkit::BagOfCells::WithCRC32C;
        break;
      case 't':
        mode |= cellkit::BagOfCells::WithTopHash;
        break;
      case 'C':
        mode |= cellkit::BagOfCells::WithIndex | cellkit::BagOfCells::WithCacheBits;
        break;
      case 'b':
        base64 = true;
        break;
      case 'p':
        pair = true;
        break;
      case 'v':
        ++verbosity;
        break;
      case 'o':
        output = optarg;
        break;
      case 'h':
        return usage();
      default:
        std::cerr << "unknown option" << std::endl;
        return usage();
    }
  }
  if (argc > optind + 1) {
    return usage();
  }
  SET_VERBOSITY_LEVEL(VERBOSITY_NAME(ERROR) + verbosity);

  auto r_input = argc == optind ? cellkit::read_stdin() : cellkit::read_file(argv[optind]);
  if (r_input.is_error()) {
    LOG(ERROR) << r_input.move_as_error();
    return 1;
  }
  auto status = run(r_input.move_as_ok(), base64, pair, mode, output);
  if (status.is_error()) {
    LOG(ERROR) << cellkit::get_excno(status) << ": " << status;
    return 1;
  }
  return 0;
}
