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
#include "cellkit/utils/common.h"

namespace cellkit {

void sha256(Slice data, MutableSlice output);
string sha256(Slice data);

class Sha256State {
 public:
  Sha256State();
  Sha256State(Sha256State &&other) noexcept;
  Sha256State &operator=(Sha256State &&other) noexcept;
  ~Sha256State();

  void init();
  void feed(Slice data);
  void extract(MutableSlice output, bool destroy = false);

 private:
  class Impl;
  unique_ptr<Impl> impl_;
  bool is_inited_ = false;
};

uint32 crc32c(Slice data);
uint32 crc32c_extend(uint32 old_crc, Slice data);

}  // namespace cellkit
