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
#include "cellkit/utils/filesystem.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>

namespace cellkit {

namespace {
Status os_error(Slice what, const string &path) {
  return Status::Error(PSLICE() << what << " \"" << path << "\": " << std::strerror(errno));
}
}  // namespace

Result<string> read_file(const string &path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return os_error("cannot open file", path);
  }
  string res{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return os_error("cannot read file", path);
  }
  return std::move(res);
}

Result<string> read_stdin() {
  string res{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
  if (std::cin.bad()) {
    return Status::Error("cannot read standard input");
  }
  return std::move(res);
}

Status write_file(const string &path, Slice data) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return os_error("cannot create file", path);
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.flush();
  if (!out) {
    return os_error("cannot write file", path);
  }
  return Status::OK();
}

}  // namespace cellkit
