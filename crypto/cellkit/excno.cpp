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
#include "cellkit/excno.hpp"

namespace cellkit {

const char *get_exception_msg(Excno exc_no) {
  switch (exc_no) {
    case Excno::none:
      return "none";
    case Excno::invalid_cell:
      return "invalid cell";
    case Excno::depth_overflow:
      return "cell depth overflow";
    case Excno::cell_ov:
      return "cell overflow";
    case Excno::cell_und:
      return "cell underflow";
    case Excno::unexpected_eof:
      return "unexpected end of bag-of-cells data";
    case Excno::unknown_boc_tag:
      return "unknown bag-of-cells tag";
    case Excno::invalid_header:
      return "invalid bag-of-cells header";
    case Excno::unexpected_root_count:
      return "unexpected number of bag-of-cells roots";
    case Excno::invalid_ref:
      return "invalid cell reference";
    case Excno::invalid_checksum:
      return "bag-of-cells checksum mismatch";
    case Excno::root_cell_not_found:
      return "root cell not found";
    case Excno::out_of_gas:
      return "out of gas";
    case Excno::virt_err:
      return "virtualization error";
    case Excno::unknown:
      return "unknown error";
  }
  return "unknown error";
}

Excno get_excno(const Status &status) {
  if (status.is_ok()) {
    return Excno::none;
  }
  auto code = status.code();
  if (code <= 0 || code > static_cast<int>(Excno::unknown)) {
    return Excno::unknown;
  }
  return static_cast<Excno>(code);
}

std::ostream &operator<<(std::ostream &os, Excno exc_no) {
  return os << get_exception_msg(exc_no);
}

}  // namespace cellkit
