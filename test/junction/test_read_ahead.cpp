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

#include <junction/channel.hpp>
#include <junction/iterate.hpp>
#include <junction/merge.hpp>

#include <test_common/receivers.hpp>
#include <test_common/schedulers.hpp>
#include <test_common/sources.hpp>

#include <catch2/catch.hpp>
#include <stdexec/execution.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ex = stdexec;

namespace {
  TEST_CASE("a source is held back while the buffer is full", "[read_ahead]") {
    impulse_scheduler sched;
    junction::channel<int> fast, slow;
    auto merged = junction::merge(junction::sources_of(fast, slow), 0, sched);

    pull_record<int> first;
    auto op = ex::connect(merged.next(), pull_receiver<int>{&first});
    ex::start(op);
    sched.run_all();
    CHECK(fast.push(1));
    REQUIRE(first.kind_ == pull_kind::value);

    // Two live sources: two values are read ahead, the third is held.
    for (int value: {2, 3, 4, 5}) {
      sched.run_all();
      CHECK(fast.push(value));
    }
    sched.run_all();
    auto stats = merged.stats();
    CHECK(stats.buffered == 2);
    CHECK(stats.live == 2);
    CHECK(fast.pushed() == 5);
    CHECK(fast.pulled() == 4);

    std::vector<int> values;
    for (int i = 0; i < 4; ++i) {
      auto record = pull_stepping(merged, sched);
      REQUIRE(record.kind_ == pull_kind::value);
      values.push_back(*record.value_);
      sched.run_all();
      CHECK(merged.stats().buffered <= merged.stats().live);
    }
    CHECK(values == std::vector{2, 3, 4, 5});
    CHECK(merged.stats().peak_buffered == 2);

    CHECK(fast.finish());
    CHECK(slow.finish());
    CHECK(drain_stepping(merged, sched).empty());
  }

  TEST_CASE("held values are released in the order they became ready", "[read_ahead]") {
    impulse_scheduler sched;
    junction::channel<std::string> c1, c2, c3;
    auto merged = junction::merge(junction::sources_of(c1, c2, c3), 0, sched);

    pull_record<std::string> first;
    auto op = ex::connect(merged.next(), pull_receiver<std::string>{&first});
    ex::start(op);
    sched.run_all();
    CHECK(c3.push("first"));
    REQUIRE(first.kind_ == pull_kind::value);

    for (const char* value: {"a", "b", "c"}) {
      sched.run_all();
      CHECK(c3.push(value));
    }
    sched.run_all();
    REQUIRE(merged.stats().buffered == 3);

    // The buffer is full: both values are held, c1's first.
    CHECK(c1.push("x"));
    CHECK(c2.push("y"));
    CHECK(merged.stats().buffered == 3);

    std::vector<std::string> values;
    for (int i = 0; i < 5; ++i) {
      auto record = pull_stepping(merged, sched);
      REQUIRE(record.kind_ == pull_kind::value);
      values.push_back(*record.value_);
    }
    CHECK(values == std::vector<std::string>{"a", "b", "c", "x", "y"});

    CHECK(c1.finish());
    CHECK(c2.finish());
    CHECK(c3.finish());
    CHECK(drain_stepping(merged, sched).empty());
  }

  TEST_CASE("sources producing at the same rate share the output", "[read_ahead][fairness]") {
    impulse_scheduler sched;
    constexpr int sources = 4;
    constexpr int per_source = 50;
    std::vector<junction::iterate_source<int>> inputs;
    for (int s = 0; s < sources; ++s) {
      std::vector<int> values(per_source, s);
      inputs.push_back(junction::iterate(values));
    }
    auto merged = junction::merge(junction::iterate_source{std::move(inputs)}, 0, sched);

    auto values = drain_stepping(merged, sched);
    REQUIRE(values.size() == sources * per_source);

    // No source is starved during the first half of the run.
    std::map<int, int> share;
    for (std::size_t i = 0; i < values.size() / 2; ++i) {
      ++share[values[i]];
    }
    REQUIRE(share.size() == sources);
    for (auto [source, count]: share) {
      CAPTURE(source);
      CHECK(count >= per_source / 4);
    }
    CHECK(merged.stats().peak_buffered <= sources);
  }

  TEST_CASE("values are read ahead only while the buffer is smaller than the live sources", "[read_ahead]") {
    impulse_scheduler sched;
    std::vector<junction::iterate_source<int>> inputs;
    for (int s = 0; s < 6; ++s) {
      inputs.push_back(junction::iterate(std::vector<int>(20, s)));
    }
    auto merged = junction::merge(junction::iterate_source{std::move(inputs)}, 3, sched);

    pull_record<int> first;
    auto op = ex::connect(merged.next(), pull_receiver<int>{&first});
    ex::start(op);
    // Let the sources run ahead of a consumer that does not pull.
    while (sched.try_start_next()) {
      auto stats = merged.stats();
      CHECK(stats.buffered <= stats.live);
    }
    REQUIRE(first.kind_ == pull_kind::value);
    CHECK(merged.stats().buffered == 3);

    std::size_t count = 1;
    while (true) {
      auto record = pull_stepping(merged, sched);
      // A retired source's values stay buffered after live dropped, so the
      // lasting bound is the cap.
      CHECK(merged.stats().buffered <= 3);
      if (record.kind_ != pull_kind::value) {
        break;
      }
      ++count;
    }
    CHECK(count == 120);
    CHECK(merged.stats().peak_buffered <= 3);
  }
} // namespace
