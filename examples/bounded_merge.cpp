/*
 * Copyright (c) 2026 NVIDIA Corporation
 *
 * Licensed under the Apache License Version 2.0 with LLVM Exceptions
 * (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 *   https://llvm.org/LICENSE.txt
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include <iostream>
#include <numeric>
#include <vector>

#include <stdexec/execution.hpp>

#include "exec/static_thread_pool.hpp"
#include "junction/junction.hpp"

using namespace stdexec;

// Merges a hundred ranges on a thread pool while keeping at most four of
// them open, then sums what came out.
auto main() -> int {
  exec::static_thread_pool pool{4};
  scheduler auto sch = pool.get_scheduler();

  std::vector<junction::iterate_source<long>> ranges;
  for (long r = 0; r < 100; ++r) {
    std::vector<long> values(1000);
    std::iota(values.begin(), values.end(), r * 1000);
    ranges.push_back(junction::iterate(values));
  }

  auto merged = junction::merge(
    junction::iterate_source{std::move(ranges)}, junction::merge_options{.max_open = 4}, sch);

  long sum = 0;
  long count = 0;
  while (auto value = std::get<0>(sync_wait(merged.next()).value())) {
    sum += *value;
    ++count;
  }
  sync_wait(merged.close());

  auto stats = merged.stats();
  std::cout << "values: " << count << ", sum: " << sum << '\n';
  std::cout << "peak open: " << stats.peak_open << ", peak buffered: " << stats.peak_buffered
            << '\n';
}
