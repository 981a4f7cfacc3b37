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

#include "cellkit/excno.hpp"
#include "cellkit/utils/Status.h"

namespace cellkit {

struct GasLimits {
  static constexpr long long infty = (1ULL << 63) - 1;
  enum {
    cell_load_gas_price = 100,
    cell_reload_gas_price = 25,
    cell_create_gas_price = 500,
  };
  long long gas_max, gas_limit, gas_credit, gas_remaining, gas_base;
  GasLimits() : gas_max(infty), gas_limit(infty), gas_credit(0), gas_remaining(infty), gas_base(infty) {
  }
  GasLimits(long long _limit, long long _max = infty, long long _credit = 0)
      : gas_max(_max)
      , gas_limit(_limit)
      , gas_credit(_credit)
      , gas_remaining(_limit + _credit)
      , gas_base(gas_remaining) {
  }
  long long gas_consumed() const {
    return gas_base - gas_remaining;
  }
  void consume(long long amount) {
    gas_remaining -= amount;
  }
  bool try_consume(long long amount) {
    return (gas_remaining -= amount) >= 0;
  }
  Status consume_chk(long long amount) {
    if (!try_consume(amount)) {
      return excno_error(Excno::out_of_gas,
                         PSLICE() << "out of gas: consumed " << gas_consumed() << ", limit " << gas_limit);
    }
    return Status::OK();
  }
  bool final_ok() const {
    return gas_remaining >= gas_credit;
  }
};

}  // namespace cellkit
