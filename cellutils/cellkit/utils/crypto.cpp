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
#include "cellkit/utils/crypto.h"

#include "cellkit/utils/logging.h"

#include <openssl/evp.h>

#include <array>

namespace cellkit {

class Sha256State::Impl {
 public:
  Impl() : ctx_(EVP_MD_CTX_new()) {
    CHECK(ctx_ != nullptr);
  }
  Impl(const Impl &) = delete;
  Impl &operator=(const Impl &) = delete;
  ~Impl() {
    EVP_MD_CTX_free(ctx_);
  }

  EVP_MD_CTX *ctx() {
    return ctx_;
  }

 private:
  EVP_MD_CTX *ctx_;
};

Sha256State::Sha256State() = default;

Sha256State::Sha256State(Sha256State &&other) noexcept {
  impl_ = std::move(other.impl_);
  is_inited_ = other.is_inited_;
  other.is_inited_ = false;
}

Sha256State &Sha256State::operator=(Sha256State &&other) noexcept {
  Sha256State tmp(std::move(other));
  impl_ = std::move(tmp.impl_);
  is_inited_ = tmp.is_inited_;
  return *this;
}

Sha256State::~Sha256State() = default;

void Sha256State::init() {
  if (!impl_) {
    impl_ = make_unique<Impl>();
  }
  CHECK(EVP_DigestInit_ex(impl_->ctx(), EVP_sha256(), nullptr) == 1);
  is_inited_ = true;
}

void Sha256State::feed(Slice data) {
  CHECK(is_inited_);
  CHECK(EVP_DigestUpdate(impl_->ctx(), data.ubegin(), data.size()) == 1);
}

void Sha256State::extract(MutableSlice output, bool destroy) {
  CHECK(output.size() >= 32);
  CHECK(is_inited_);
  unsigned size = 0;
  CHECK(EVP_DigestFinal_ex(impl_->ctx(), output.ubegin(), &size) == 1 && size == 32);
  is_inited_ = false;
  if (destroy) {
    impl_.reset();
  }
}

void sha256(Slice data, MutableSlice output) {
  CHECK(output.size() >= 32);
  unsigned size = 0;
  CHECK(EVP_Digest(data.ubegin(), data.size(), output.ubegin(), &size, EVP_sha256(), nullptr) == 1 && size == 32);
}

string sha256(Slice data) {
  string result(32, '\0');
  sha256(data, MutableSlice(result));
  return result;
}

namespace {
// reflected Castagnoli polynomial 0x1EDC6F41
constexpr uint32 CRC32C_POLY = 0x82F63B78;

std::array<uint32, 256> make_crc32c_table() {
  std::array<uint32, 256> table{};
  for (uint32 i = 0; i < 256; i++) {
    uint32 crc = i;
    for (int j = 0; j < 8; j++) {
      crc = (crc >> 1) ^ (CRC32C_POLY & (0u - (crc & 1)));
    }
    table[i] = crc;
  }
  return table;
}
}  // namespace

uint32 crc32c_extend(uint32 old_crc, Slice data) {
  static const std::array<uint32, 256> table = make_crc32c_table();
  uint32 crc = ~old_crc;
  for (auto c : data.as_string_view()) {
    crc = table[(crc ^ static_cast<unsigned char>(c)) & 0xff] ^ (crc >> 8);
  }
  return ~crc;
}

uint32 crc32c(Slice data) {
  return crc32c_extend(0, data);
}

}  // namespace cellkit
