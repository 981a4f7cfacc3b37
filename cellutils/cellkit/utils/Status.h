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
#include "cellkit/utils/logging.h"

#include <optional>
#include <ostream>
#include <type_traits>

#define TRY_STATUS(status)               \
  {                                      \
    auto try_status = (status);          \
    if (try_status.is_error()) {         \
      return try_status.move_as_error(); \
    }                                    \
  }

#define TRY_STATUS_PREFIX(status, prefix)             \
  {                                                   \
    auto try_status = (status);                       \
    if (try_status.is_error()) {                      \
      return try_status.move_as_error_prefix(prefix); \
    }                                                 \
  }

#define TRY_RESULT(name, result) TRY_RESULT_IMPL(CELLKIT_CONCAT(r_, name), auto name, result)

#define TRY_RESULT_ASSIGN(name, result) TRY_RESULT_IMPL(CELLKIT_CONCAT(r_, name), name, result)

#define TRY_RESULT_PREFIX(name, result, prefix) \
  TRY_RESULT_PREFIX_IMPL(CELLKIT_CONCAT(r_, name), auto name, result, prefix)

#define TRY_RESULT_IMPL(r_name, name, result) \
  auto r_name = (result);                     \
  if (r_name.is_error()) {                    \
    return r_name.move_as_error();            \
  }                                           \
  name = r_name.move_as_ok();

#define TRY_RESULT_PREFIX_IMPL(r_name, name, result, prefix) \
  auto r_name = (result);                                    \
  if (r_name.is_error()) {                                   \
    return r_name.move_as_error_prefix(prefix);              \
  }                                                          \
  name = r_name.move_as_ok();

namespace cellkit {

class CELLKIT_WARN_UNUSED_RESULT Status {
 public:
  Status() = default;
  Status(Status &&) noexcept = default;
  Status &operator=(Status &&) noexcept = default;
  Status(const Status &) = delete;
  Status &operator=(const Status &) = delete;
  ~Status() = default;

  static Status OK() {
    return Status();
  }

  static Status Error(int code, Slice message) {
    return Status(code, message.str());
  }
  static Status Error(Slice message) {
    return Error(0, message);
  }
  static Status Error() {
    return Error(0, Slice());
  }

  bool is_ok() const {
    return !is_error();
  }
  bool is_error() const {
    return info_ != nullptr;
  }

  int code() const {
    return is_ok() ? 0 : info_->code;
  }
  Slice message() const {
    return is_ok() ? Slice() : Slice(info_->message);
  }

  string to_string() const;

  Status clone() const {
    return is_ok() ? Status() : Status(info_->code, info_->message);
  }

  Status move_as_error() {
    CHECK(is_error());
    return std::move(*this);
  }
  Status move_as_error_prefix(Slice prefix) const;
  Status move_as_error_suffix(Slice suffix) const;

  void ensure() const {
    if (!is_ok()) {
      LOG(FATAL) << "Unexpected Status " << to_string();
    }
  }
  void ignore() const {
  }

 private:
  struct Info {
    int code;
    string message;
  };
  unique_ptr<Info> info_;

  Status(int code, string message) : info_(make_unique<Info>(Info{code, std::move(message)})) {
  }
};

std::ostream &operator<<(std::ostream &os, const Status &status);

template <class T = Unit>
class CELLKIT_WARN_UNUSED_RESULT Result {
 public:
  using ValueT = T;

  Result() : status_(Status::Error(-1, "uninitialized Result")) {
  }
  template <class S, std::enable_if_t<!std::is_same<std::decay_t<S>, Result>::value &&
                                          !std::is_same<std::decay_t<S>, Status>::value &&
                                          std::is_constructible<T, S &&>::value,
                                      int> = 0>
  Result(S &&x) : value_(std::in_place, std::forward<S>(x)) {
  }
  Result(Status &&status) : status_(std::move(status)) {
    CHECK(status_.is_error());
  }
  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;
  ~Result() = default;

  bool is_ok() const {
    return status_.is_ok();
  }
  bool is_error() const {
    return status_.is_error();
  }

  const Status &error() const {
    CHECK(is_error());
    return status_;
  }
  Status move_as_error() {
    CHECK(is_error());
    value_.reset();
    return std::move(status_);
  }
  Status move_as_error_prefix(Slice prefix) const {
    CHECK(is_error());
    return status_.move_as_error_prefix(prefix);
  }

  const T &ok() const {
    LOG_IF(FATAL, status_.is_error()) << status_;
    return *value_;
  }
  T &ok_ref() {
    LOG_IF(FATAL, status_.is_error()) << status_;
    return *value_;
  }
  T move_as_ok() {
    LOG_IF(FATAL, status_.is_error()) << status_;
    return std::move(*value_);
  }
  void ensure() const {
    status_.ensure();
  }

 private:
  Status status_;
  std::optional<T> value_;
};

}  // namespace cellkit
