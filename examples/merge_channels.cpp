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
#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <stdexec/execution.hpp>

#include "junction/junction.hpp"

using namespace stdexec;

// Three producer threads push into their own channel; the consumer sees
// one stream with each producer's values in order.
auto main() -> int {
  std::vector<junction::channel<std::string>> feeds(3);
  auto merged = junction::merge(junction::iterate(feeds));

  std::vector<std::thread> producers;
  for (std::size_t p = 0; p < feeds.size(); ++p) {
    producers.emplace_back([feed = feeds[p], p]() mutable {
      for (int i = 0; i < 5; ++i) {
        if (!feed.push("producer " + std::to_string(p) + ": message " + std::to_string(i))) {
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(p + 1));
      }
      static_cast<void>(feed.finish());
    });
  }

  while (true) {
    auto [message] = sync_wait(merged.next()).value();
    if (!message) {
      break;
    }
    std::cout << *message << '\n';
  }
  sync_wait(merged.close());

  for (auto& producer: producers) {
    producer.join();
  }

  auto stats = merged.stats();
  std::cout << "merged " << stats.admitted << " feeds, " << junction::to_string(stats.outcome)
            << '\n';
}
