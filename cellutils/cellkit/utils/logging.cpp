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

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace cellkit {

namespace {
std::atomic<int> verbosity_level{verbosity_ERROR};
std::mutex log_mutex;

const char *level_name(int log_level) {
  switch (log_level) {
    case verbosity_FATAL:
      return "FATAL";
    case verbosity_ERROR:
      return "ERROR";
    case verbosity_WARNING:
      return "WARNING";
    case verbosity_INFO:
      return "INFO";
    default:
      return "DEBUG";
  }
}

Slice base_name(const char *file_name) {
  const char *last = std::strrchr(file_name, '/');
  return last == nullptr ? Slice(file_name, std::strlen(file_name)) : Slice(last + 1, std::strlen(last + 1));
}
}  // namespace

int get_verbosity_level() {
  return verbosity_level.load(std::memory_order_relaxed);
}

void set_verbosity_level(int new_level) {
  verbosity_level.store(new_level < verbosity_FATAL ? verbosity_FATAL : new_level, std::memory_order_relaxed);
}

Logger::Logger(int log_level, const char *file_name, int line_num, Slice comment) : log_level_(log_level) {
  sb_ << '[' << level_name(log_level) << "][" << base_name(file_name) << ':' << line_num << ']';
  if (!comment.empty()) {
    sb_ << "[&" << comment << ']';
  }
  sb_ << '\t';
}

Logger::~Logger() {
  sb_ << '\n';
  {
    std::lock_guard<std::mutex> guard(log_mutex);
    std::cerr << sb_.as_string() << std::flush;
  }
  if (log_level_ == verbosity_FATAL) {
    std::abort();
  }
}

}  // namespace cellkit
