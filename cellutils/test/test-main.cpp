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
#include "cellkit/utils/logging.h"
#include "cellkit/utils/tests.h"

#include <cstring>

int main(int argc, char **argv) {
  SET_VERBOSITY_LEVEL(VERBOSITY_NAME(ERROR));
  for (int i = 1; i < argc; i++) {
    if (!std::strcmp(argv[i], "--verbose") || !std::strcmp(argv[i], "-v")) {
      SET_VERBOSITY_LEVEL(VERBOSITY_NAME(DEBUG));
    } else if ((!std::strcmp(argv[i], "--filter") || !std::strcmp(argv[i], "-f")) && i + 1 < argc) {
      cellkit::TestsRunner::get_default().add_substr_filter(argv[++i]);
    } else {
      cellkit::TestsRunner::get_default().add_substr_filter(argv[i]);
    }
  }
  cellkit::TestsRunner::get_default().run_all();
  return 0;
}
