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
#include "cellkit/utils/tests.h"

#include <chrono>

namespace cellkit {

TestsRunner &TestsRunner::get_default() {
  static TestsRunner default_runner;
  return default_runner;
}

void TestsRunner::add_test(string name, unique_ptr<Test> test) {
  for (auto &it : tests_) {
    if (it.first == name) {
      LOG(FATAL) << "Test name collision " << name;
    }
  }
  tests_.emplace_back(std::move(name), std::move(test));
}

void TestsRunner::add_substr_filter(string str) {
  if (str[0] != '+' && str[0] != '-') {
    str = "+" + str;
  }
  substr_filters_.push_back(std::move(str));
}

void TestsRunner::run_all() {
  size_t run_count = 0;
  for (auto &test : tests_) {
    auto &name = test.first;
    bool ok = true;
    for (const auto &filter : substr_filters_) {
      bool is_match = name.find(filter.substr(1)) != string::npos;
      if (is_match != (filter[0] == '+')) {
        ok = false;
        break;
      }
    }
    if (!ok) {
      continue;
    }
    LOG(ERROR) << "Run " << name;
    auto start = std::chrono::steady_clock::now();
    test.second->run();
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    LOG_IF(ERROR, elapsed > 5) << "Test " << name << " took " << elapsed << "s";
    run_count++;
  }
  LOG(ERROR) << "Ran " << run_count << " test(s)";
}

}  // namespace cellkit
