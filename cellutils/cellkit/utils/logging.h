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
#include "cellkit/utils/StringBuilder.h"
#include "cellkit/utils/common.h"

#define VERBOSITY_NAME(x) ::cellkit::verbosity_##x

#define LOG_IS_ON(level) (VERBOSITY_NAME(level) <= ::cellkit::get_verbosity_level())

#define LOG_IMPL(level, condition, comment)                                           \
  !(LOG_IS_ON(level) && (condition))                                                  \
      ? (void)0                                                                       \
      : ::cellkit::detail::Voidify() &                                                \
            ::cellkit::Logger(VERBOSITY_NAME(level), __FILE__, __LINE__, ::cellkit::Slice(comment))

#define LOG(level) LOG_IMPL(level, true, "")
#define LOG_IF(level, condition) LOG_IMPL(level, condition, #condition)

#define CHECK(condition) LOG_IMPL(FATAL, !(condition), #condition)

#ifdef NDEBUG
#define DCHECK(condition) LOG_IMPL(FATAL, false && !(condition), #condition)
#else
#define DCHECK(condition) CHECK(condition)
#endif

#define UNREACHABLE() LOG(FATAL) << "Unreachable"

#define SET_VERBOSITY_LEVEL(new_level) ::cellkit::set_verbosity_level(new_level)

namespace cellkit {

constexpr int verbosity_FATAL = 0;
constexpr int verbosity_ERROR = 1;
constexpr int verbosity_WARNING = 2;
constexpr int verbosity_INFO = 3;
constexpr int verbosity_DEBUG = 4;

int get_verbosity_level();
void set_verbosity_level(int new_level);

class Logger {
 public:
  Logger(int log_level, const char *file_name, int line_num, Slice comment);
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;
  ~Logger();

  template <class T>
  Logger &operator<<(const T &other) {
    sb_ << other;
    return *this;
  }

 private:
  int log_level_;
  StringBuilder sb_;
};

namespace detail {
class Voidify {
 public:
  void operator&(const Logger &) {
  }
};
}  // namespace detail

}  // namespace cellkit
