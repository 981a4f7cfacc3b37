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
#include "cellkit/utils/ScopeGuard.h"
#include "cellkit/utils/Status.h"
#include "cellkit/utils/base64.h"
#include "cellkit/utils/crypto.h"
#include "cellkit/utils/filesystem.h"
#include "cellkit/utils/misc.h"
#include "cellkit/utils/tests.h"

#include <cstdio>

using namespace cellkit;

TEST(Misc, base64) {
  ASSERT_EQ(base64_encode(""), "");
  ASSERT_EQ(base64_encode("f"), "Zg==");
  ASSERT_EQ(base64_encode("fo"), "Zm8=");
  ASSERT_EQ(base64_encode("foo"), "Zm9v");
  ASSERT_EQ(base64_encode("foobar"), "Zm9vYmFy");
  ASSERT_EQ(base64_decode("Zm9vYg==").move_as_ok(), "foob");
  ASSERT_EQ(base64_decode("Zm9vYg").move_as_ok(), "foob");
  ASSERT_EQ(base64_decode("Zm9vYmE=").move_as_ok(), "fooba");
  ASSERT_TRUE(base64_decode("Zm9v!mFy").is_error());
  ASSERT_TRUE(base64_decode("Z").is_error());

  string all_bytes;
  for (int i = 0; i < 256; i++) {
    all_bytes += static_cast<char>(i);
  }
  ASSERT_EQ(base64_decode(base64_encode(all_bytes)).move_as_ok(), all_bytes);
}

TEST(Misc, hex) {
  ASSERT_EQ(hex_encode("\x01\xab\xff"), "01abff");
  ASSERT_EQ(hex_decode("01ABff").move_as_ok(), "\x01\xab\xff");
  ASSERT_TRUE(hex_decode("abc").is_error());
  ASSERT_TRUE(hex_decode("zz").is_error());
}

TEST(Crypto, crc32c) {
  ASSERT_EQ(crc32c(""), 0u);
  ASSERT_EQ(crc32c("123456789"), 0xe3069283u);
  ASSERT_EQ(crc32c_extend(crc32c("1234"), "56789"), crc32c("123456789"));
}

TEST(Crypto, sha256) {
  ASSERT_EQ(hex_encode(sha256("abc")), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  ASSERT_EQ(hex_encode(sha256("")), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

  Sha256State state;
  state.init();
  state.feed("a");
  state.feed("bc");
  string output(32, '\0');
  state.extract(MutableSlice(output), true);
  ASSERT_EQ(output, sha256("abc"));
}

TEST(Misc, status) {
  auto ok = Status::OK();
  ASSERT_TRUE(ok.is_ok());
  ASSERT_EQ(ok.code(), 0);

  auto error = Status::Error(7, "broken");
  ASSERT_TRUE(error.is_error());
  ASSERT_EQ(error.code(), 7);
  ASSERT_EQ(error.message(), Slice("broken"));

  auto prefixed = error.move_as_error_prefix("cell #3: ");
  ASSERT_EQ(prefixed.code(), 7);
  ASSERT_EQ(prefixed.message(), Slice("cell #3: broken"));
  ASSERT_EQ(error.clone().message(), Slice("broken"));
}

namespace {
Result<int> parse_positive(int x) {
  if (x <= 0) {
    return Status::Error(1, PSLICE() << "not positive: " << x);
  }
  return x;
}

Result<int> twice_positive(int x) {
  TRY_RESULT(value, parse_positive(x));
  return value * 2;
}
}  // namespace

TEST(Misc, result) {
  ASSERT_EQ(twice_positive(21).move_as_ok(), 42);
  auto r_bad = twice_positive(-1);
  ASSERT_TRUE(r_bad.is_error());
  ASSERT_EQ(r_bad.error().message(), Slice("not positive: -1"));

  ASSERT_TRUE(narrow_cast_safe<uint8>(300).is_error());
  ASSERT_TRUE(narrow_cast_safe<uint32>(-1).is_error());
  ASSERT_EQ(narrow_cast_safe<uint8>(200).move_as_ok(), 200);
}

TEST(Misc, scope_exit) {
  int counter = 0;
  {
    SCOPE_EXIT {
      counter++;
    };
    ASSERT_EQ(counter, 0);
  }
  ASSERT_EQ(counter, 1);
}

TEST(Misc, bit_helpers) {
  ASSERT_EQ(count_trailing_zeroes32(0x80), 7u);
  ASSERT_EQ(count_leading_zeroes32(1), 31u);
  ASSERT_EQ(count_bits32(0x7), 3u);
}

TEST(Misc, files) {
  string path = "test-cellutils-file.tmp";
  SCOPE_EXIT {
    std::remove(path.c_str());
  };
  string data("\x00\x01\xfe\xff", 4);
  write_file(path, data).ensure();
  ASSERT_EQ(read_file(path).move_as_ok(), data);
  ASSERT_TRUE(read_file("this-file-does-not-exist.tmp").is_error());
}
