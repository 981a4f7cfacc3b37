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
#include "cellkit/utils/Status.h"

namespace cellkit {

string Status::to_string() const {
  if (is_ok()) {
    return "OK";
  }
  return PSTRING() << "[Error : " << info_->code << " : " << info_->message << ']';
}

Status Status::move_as_error_prefix(Slice prefix) const {
  CHECK(is_error());
  return Status(info_->code, PSTRING() << prefix << info_->message);
}

Status Status::move_as_error_suffix(Slice suffix) const {
  CHECK(is_error());
  return Status(info_->code, PSTRING() << info_->message << suffix);
}

std::ostream &operator<<(std::ostream &os, const Status &status) {
  return os << status.to_string();
}

}  // namespace cellkit
