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

#include "cellkit/utils/Slice.h"
#include "cellkit/utils/Status.h"

namespace cellkit {

enum class Excno : int {
  none = 0,
  invalid_cell = 1,
  depth_overflow = 2,
  cell_ov = 3,
  cell_und = 4,
  unexpected_eof = 5,
  unknown_boc_tag = 6,
  invalid_header = 7,
  unexpected_root_count = 8,
  invalid_ref = 9,
  invalid_checksum = 10,
  root_cell_not_found = 11,
  out_of_gas = 12,
  virt_err = 13,
  unknown = 14,
};

const char *get_exception_msg(Excno exc_no);

inline Status excno_error(Excno exc_no, Slice message) {
  return Status::Error(static_cast<int>(exc_no), message);
}

inline Status excno_error(Excno exc_no) {
  return excno_error(exc_no, Slice(get_exception_msg(exc_no), std::char_traits<char>::length(get_exception_msg(exc_no))));
}

Excno get_excno(const Status &status);

std::ostream &operator<<(std::ostream &os, Excno exc_no);

}  // namespace cellkit
