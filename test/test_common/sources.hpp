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

#pragma once

#include <junction/channel.hpp>
#include <junction/iterate.hpp>
#include <junction/source.hpp>
#include <test_common/receivers.hpp>
#include <test_common/schedulers.hpp>

#include <catch2/catch.hpp>
#include <stdexec/execution.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ex = stdexec;

namespace {
  //! What happened to a group of probe sources, in order.
  class probe_log {
   public:
    std::atomic<int> pulls_{0};
    std::atomic<int> exhausted_{0};
    std::atomic<int> stopped_{0};

    void on_open(const std::string& name) {
      std::unique_lock lock{mutex_};
      ++open_;
      peak_open_ = (std::max)(peak_open_, open_);
      events_.push_back("open " + name);
    }

    void on_close(const std::string& name, bool opened) {
      std::unique_lock lock{mutex_};
      if (opened) {
        --open_;
      }
      ++closes_;
      events_.push_back("close " + name);
    }

    [[nodiscard]]
    auto events() const -> std::vector<std::string> {
      std::unique_lock lock{mutex_};
      return events_;
    }

    //! Position of `event` in the log, or -1.
    [[nodiscard]]
    auto index_of(const std::string& event) const -> std::ptrdiff_t {
      std::unique_lock lock{mutex_};
      auto it = std::find(events_.begin(), events_.end(), event);
      return it == events_.end() ? -1 : it - events_.begin();
    }

    [[nodiscard]]
    auto count(const std::string& event) const -> std::ptrdiff_t {
      std::unique_lock lock{mutex_};
      return std::count(events_.begin(), events_.end(), event);
    }

    [[nodiscard]]
    auto open() const -> int {
      std::unique_lock lock{mutex_};
      return open_;
    }

    [[nodiscard]]
    auto peak_open() const -> int {
      std::unique_lock lock{mutex_};
      return peak_open_;
    }

    [[nodiscard]]
    auto closes() const -> int {
      std::unique_lock lock{mutex_};
      return closes_;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
    int open_{0};
    int peak_open_{0};
    int closes_{0};
  };

  //! Wraps a source and logs its first pull ("open <name>"), every pull,
  //! how its pulls ended and its cleanup ("close <name>"). A cancelled pull
  //! is reported to the merge as the end of the source.
  template <junction::source S>
  class probe_source {
   public:
    using value_type = junction::source_value_t<S>;

    probe_source(std::string name, S inner, std::shared_ptr<probe_log> log, bool fail_close = false)
      : name_(std::move(name))
      , inner_(std::move(inner))
      , log_(std::move(log))
      , fail_close_(fail_close) {
    }

    auto next() {
      if (!opened_) {
        opened_ = true;
        log_->on_open(name_);
      }
      log_->pulls_.fetch_add(1);
      return inner_.next()
           | ex::then([log = log_](std::optional<value_type> value) {
               if (!value) {
                 log->exhausted_.fetch_add(1);
               }
               return value;
             })
           | ex::upon_stopped([log = log_] {
               log->stopped_.fetch_add(1);
               return std::optional<value_type>{};
             });
    }

    auto close() {
      return inner_.close()
           | ex::then([log = log_, name = name_, opened = opened_, fail = fail_close_] {
               log->on_close(name, opened);
               if (fail) {
                 throw std::runtime_error("cleanup of " + name + " failed");
               }
             });
    }

   private:
    std::string name_;
    S inner_;
    std::shared_ptr<probe_log> log_;
    bool fail_close_{false};
    bool opened_{false};
  };

  template <class T>
  auto probe_values(std::string name, std::vector<T> values, std::shared_ptr<probe_log> log)
    -> probe_source<junction::iterate_source<T>> {
    return {std::move(name), junction::iterate_source<T>{std::move(values)}, std::move(log)};
  }

  template <class T>
  auto probe_channel(std::string name, junction::channel<T> channel, std::shared_ptr<probe_log> log)
    -> probe_source<junction::channel<T>> {
    return {std::move(name), std::move(channel), std::move(log)};
  }

  ////////////////////////////////////////////////////////////////////////////
  // Driving a merge whose work runs on an impulse_scheduler

  //! Pulls once, stepping the scheduler until the pull completed.
  template <class Merged>
  auto pull_stepping(Merged& merged, impulse_scheduler& sched)
    -> pull_record<typename Merged::value_type> {
    using value_t = typename Merged::value_type;
    pull_record<value_t> record;
    auto op = ex::connect(merged.next(), pull_receiver<value_t>{&record});
    ex::start(op);
    while (!record.done() && sched.try_start_next()) {
    }
    REQUIRE(record.done());
    return record;
  }

  //! Pulls until the end of the stream and returns the values.
  template <class Merged>
  auto drain_stepping(Merged& merged, impulse_scheduler& sched)
    -> std::vector<typename Merged::value_type> {
    std::vector<typename Merged::value_type> values;
    while (true) {
      auto record = pull_stepping(merged, sched);
      if (record.kind_ != pull_kind::value) {
        REQUIRE(record.kind_ == pull_kind::end);
        break;
      }
      values.push_back(std::move(*record.value_));
    }
    return values;
  }

  template <class Merged>
  void close_stepping(Merged& merged, impulse_scheduler& sched) {
    close_record record;
    auto op = ex::connect(merged.close(), close_receiver{&record});
    ex::start(op);
    while (!record.done_ && sched.try_start_next()) {
    }
    REQUIRE(record.done_);
  }

  ////////////////////////////////////////////////////////////////////////////
  // Driving a merge whose work runs on a thread pool

  //! Pulls with sync_wait until the end of the stream. A failure of the
  //! merge is rethrown.
  template <class Merged>
  auto drain(Merged& merged) -> std::vector<typename Merged::value_type> {
    std::vector<typename Merged::value_type> values;
    while (true) {
      auto result = ex::sync_wait(merged.next());
      REQUIRE(result.has_value());
      auto& [value] = *result;
      if (!value) {
        break;
      }
      values.push_back(std::move(*value));
    }
    return values;
  }
} // namespace
