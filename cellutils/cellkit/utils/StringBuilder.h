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

#include <sstream>
#include <type_traits>

namespace cellkit {

class StringBuilder {
 public:
  StringBuilder() = default;
  StringBuilder(const StringBuilder &) = delete;
  StringBuilder &operator=(const StringBuilder &) = delete;

  StringBuilder &operator<<(Slice slice) {
    stream_.write(slice.data(), static_cast<std::streamsize>(slice.size()));
    return *this;
  }
  StringBuilder &operator<<(const char *str) {
    return *this << Slice(str, std::char_traits<char>::length(str));
  }
  StringBuilder &operator<<(const string &str) {
    return *this << Slice(str);
  }
  StringBuilder &operator<<(char c) {
    stream_ << c;
    return *this;
  }
  StringBuilder &operator<<(bool b) {
    return *this << (b ? Slice("true") : Slice("false"));
  }
  template <class T, std::enable_if_t<std::is_arithmetic<T>::value, int> = 0>
  StringBuilder &operator<<(T x) {
    stream_ << +x;
    return *this;
  }
  template <class T, std::enable_if_t<!std::is_arithmetic<T>::value && !std::is_array<T>::value &&
                                          !std::is_convertible<const T &, Slice>::value &&
                                          !std::is_convertible<const T &, const char *>::value,
                                      int> = 0>
  StringBuilder &operator<<(const T &x) {
    stream_ << x;
    return *this;
  }

  string as_string() const {
    return stream_.str();
  }

 private:
  std::ostringstream stream_;
};

namespace detail {
struct Stringify {
  string operator&(const StringBuilder &sb) const {
    return sb.as_string();
  }
};
}  // namespace detail

}  // namespace cellkit

#define PSTRING() ::cellkit::detail::Stringify() & ::cellkit::StringBuilder()
#define PSLICE() PSTRING()
