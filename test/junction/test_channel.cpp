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

#include <test_common/receivers.hpp>

#include <catch2/catch.hpp>
#include <stdexec/execution.hpp>

#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace ex = stdexec;

namespace {
  template <class T>
  auto pull_now(junction::channel<T>& channel) -> std::optional<T> {
    auto result = ex::sync_wait(channel.next());
    REQUIRE(result.has_value());
    return std::get<0>(std::move(*result));
  }

  TEST_CASE("channel is a source", "[channel]") {
    STATIC_REQUIRE(junction::source<junction::channel<int>>);
    STATIC_REQUIRE(ex::sender<junction::channel<int>::next_sender>);
    STATIC_REQUIRE(ex::sender<junction::channel<int>::close_sender>);
  }

  TEST_CASE("channel hands out pushed values in order and then ends", "[channel]") {
    junction::channel<std::string> channel;
    CHECK(channel.push("one"));
    CHECK(channel.push("two"));
    CHECK(channel.finish());

    CHECK(pull_now(channel) == "one");
    CHECK(pull_now(channel) == "two");
    CHECK(pull_now(channel) == std::nullopt);
    CHECK(pull_now(channel) == std::nullopt);
    CHECK(channel.pushed() == 2);
    CHECK(channel.pulled() == 2);
  }

  TEST_CASE("a finished channel refuses more values", "[channel]") {
    junction::channel<int> channel;
    CHECK(channel.finish());
    CHECK_FALSE(channel.finish());
    CHECK_FALSE(channel.push(1));
    CHECK_FALSE(channel.fail(std::runtime_error("late")));
  }

  TEST_CASE("a failed channel reports the failure after the pushed values", "[channel]") {
    junction::channel<int> channel;
    CHECK(channel.push(1));
    CHECK(channel.fail(std::make_error_code(std::errc::io_error)));

    CHECK(pull_now(channel) == 1);
    CHECK_THROWS_AS(pull_now(channel), std::system_error);
  }

  TEST_CASE("a waiting pull receives the next pushed value", "[channel]") {
    junction::channel<int> channel;
    pull_record<int> record;
    auto op = ex::connect(channel.next(), pull_receiver<int>{&record});
    ex::start(op);
    CHECK_FALSE(record.done());

    CHECK(channel.push(5));
    REQUIRE(record.kind_ == pull_kind::value);
    CHECK(*record.value_ == 5);
  }

  TEST_CASE("a waiting pull completes with stopped when cancelled", "[channel]") {
    junction::channel<int> channel;
    ex::inplace_stop_source stop;
    pull_record<int> record;
    auto op = ex::connect(channel.next(), pull_receiver<int, stop_env>{&record, stop_env{stop.get_token()}});
    ex::start(op);
    CHECK_FALSE(record.done());

    stop.request_stop();
    CHECK(record.kind_ == pull_kind::stopped);

    // The value goes to the next pull instead.
    CHECK(channel.push(6));
    CHECK(pull_now(channel) == 6);
  }

  TEST_CASE("closing a channel drops its values and ends waiting pulls", "[channel]") {
    junction::channel<int> channel;
    pull_record<int> record;
    auto op = ex::connect(channel.next(), pull_receiver<int>{&record});
    ex::start(op);

    ex::sync_wait(channel.close());
    CHECK(channel.closed());
    CHECK(record.kind_ == pull_kind::end);
    CHECK_FALSE(channel.push(1));
    CHECK(pull_now(channel) == std::nullopt);
  }

  TEST_CASE("values pushed from another thread reach a waiting pull", "[channel]") {
    junction::channel<int> channel;
    std::atomic<int> accepted{0};
    std::thread producer{[channel, &accepted]() mutable {
      for (int i = 0; i < 100; ++i) {
        accepted += channel.push(i) ? 1 : 0;
      }
      accepted += channel.finish() ? 1 : 0;
    }};

    int expected = 0;
    while (auto value = pull_now(channel)) {
      CHECK(*value == expected);
      ++expected;
    }
    producer.join();
    CHECK(expected == 100);
    CHECK(accepted.load() == 101);
  }
} // namespace
