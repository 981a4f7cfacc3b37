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

#include "cellkit/utils/common.h"

#include <algorithm>
#include <cassert>
#include <cstring>
#include <ostream>
#include <string_view>

namespace cellkit {

class MutableSlice {
 public:
  MutableSlice() = default;
  MutableSlice(char *s, size_t len) : s_(s), len_(len) {
  }
  MutableSlice(unsigned char *s, size_t len) : s_(reinterpret_cast<char *>(s)), len_(len) {
  }
  MutableSlice(char *s, char *t) : s_(s), len_(static_cast<size_t>(t - s)) {
  }
  MutableSlice(unsigned char *s, unsigned char *t) : MutableSlice(reinterpret_cast<char *>(s), reinterpret_cast<char *>(t)) {
  }
  explicit MutableSlice(string &s) : s_(s.data()), len_(s.size()) {
  }

  bool empty() const {
    return len_ == 0;
  }
  size_t size() const {
    return len_;
  }

  void remove_prefix(size_t prefix_len) {
    assert(prefix_len <= len_);
    s_ += prefix_len;
    len_ -= prefix_len;
  }
  void truncate(size_t size) {
    len_ = std::min(len_, size);
  }
  MutableSlice substr(size_t from) const {
    assert(from <= len_);
    return MutableSlice(s_ + from, len_ - from);
  }
  MutableSlice substr(size_t from, size_t size) const {
    assert(from <= len_);
    return MutableSlice(s_ + from, std::min(size, len_ - from));
  }

  void copy_from(const char *data, size_t size) {
    assert(size <= len_);
    std::memcpy(s_, data, size);
  }
  void fill(char c) {
    std::memset(s_, c, len_);
  }
  void fill_zero() {
    fill('\0');
  }

  char *data() const {
    return s_;
  }
  char *begin() const {
    return s_;
  }
  unsigned char *ubegin() const {
    return reinterpret_cast<unsigned char *>(s_);
  }
  char *end() const {
    return s_ + len_;
  }
  unsigned char *uend() const {
    return reinterpret_cast<unsigned char *>(s_) + len_;
  }
  string str() const {
    return string(s_, len_);
  }
  char &operator[](size_t i) const {
    return s_[i];
  }

 private:
  char *s_ = const_cast<char *>("");
  size_t len_ = 0;
};

class Slice {
 public:
  Slice() = default;
  Slice(const MutableSlice &other) : s_(other.begin()), len_(other.size()) {
  }
  Slice(const char *s, size_t len) : s_(s), len_(len) {
  }
  Slice(const unsigned char *s, size_t len) : s_(reinterpret_cast<const char *>(s)), len_(len) {
  }
  Slice(const string &s) : s_(s.data()), len_(s.size()) {
  }
  Slice(std::string_view s) : s_(s.data()), len_(s.size()) {
  }
  Slice(const char *s, const char *t) : s_(s), len_(static_cast<size_t>(t - s)) {
  }
  Slice(const unsigned char *s, const unsigned char *t)
      : s_(reinterpret_cast<const char *>(s)), len_(static_cast<size_t>(t - s)) {
  }
  template <size_t N>
  constexpr Slice(char (&a)[N]) = delete;
  template <size_t N>
  constexpr Slice(const char (&a)[N]) : s_(a), len_(N - 1) {
  }

  bool empty() const {
    return len_ == 0;
  }
  size_t size() const {
    return len_;
  }

  Slice &remove_prefix(size_t prefix_len) {
    assert(prefix_len <= len_);
    s_ += prefix_len;
    len_ -= prefix_len;
    return *this;
  }
  Slice &remove_suffix(size_t suffix_len) {
    assert(suffix_len <= len_);
    len_ -= suffix_len;
    return *this;
  }
  Slice &truncate(size_t size) {
    len_ = std::min(len_, size);
    return *this;
  }
  Slice substr(size_t from) const {
    assert(from <= len_);
    return Slice(s_ + from, len_ - from);
  }
  Slice substr(size_t from, size_t size) const {
    assert(from <= len_);
    return Slice(s_ + from, std::min(size, len_ - from));
  }

  const char *data() const {
    return s_;
  }
  const char *begin() const {
    return s_;
  }
  const unsigned char *ubegin() const {
    return reinterpret_cast<const unsigned char *>(s_);
  }
  const char *end() const {
    return s_ + len_;
  }
  const unsigned char *uend() const {
    return reinterpret_cast<const unsigned char *>(s_) + len_;
  }
  string str() const {
    return string(s_, len_);
  }
  std::string_view as_string_view() const {
    return std::string_view(s_, len_);
  }
  char operator[](size_t i) const {
    return s_[i];
  }

 private:
  const char *s_ = "";
  size_t len_ = 0;
};

inline bool operator==(const Slice &a, const Slice &b) {
  return a.size() == b.size() && std::memcmp(a.data(), b.data(), a.size()) == 0;
}

inline bool operator!=(const Slice &a, const Slice &b) {
  return !(a == b);
}

inline std::ostream &operator<<(std::ostream &os, Slice slice) {
  return os.write(slice.data(), static_cast<std::streamsize>(slice.size()));
}

}  // namespace cellkit
