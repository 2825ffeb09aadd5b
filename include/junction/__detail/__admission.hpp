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

#include "__config.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

namespace junction {
  namespace __merge {
    ////////////////////////////////////////////////////////////////////////////
    // Decides when a source handed out by the source of sources may start.
    // A slot is taken on admission and given back once the source's cleanup
    // completed. Sources arriving while every slot is taken wait in FIFO
    // order. The source of sources is only asked for more while nothing is
    // waiting, so at most one source is read beyond the limit.
    template <class _Source>
    class __admission {
     public:
      explicit __admission(int __max_open) noexcept
        : __max_open_{__max_open} {
      }

      [[nodiscard]]
      auto __unbounded() const noexcept -> bool {
        return __max_open_ <= 0;
      }

      [[nodiscard]]
      auto __has_capacity() const noexcept -> bool {
        return __unbounded() || __open_ < static_cast<std::size_t>(__max_open_);
      }

      //! Whether the source of sources should be pulled for another source.
      [[nodiscard]]
      auto __wants_source() const noexcept -> bool {
        return __pending_.empty();
      }

      void __enqueue(_Source&& __source) {
        __pending_.push_back(static_cast<_Source&&>(__source));
      }

      //! The oldest waiting source, if a slot is free for it.
      auto __dequeue() -> std::optional<_Source> {
        if (__pending_.empty() || !__has_capacity()) {
          return std::nullopt;
        }
        std::optional<_Source> __source{std::move(__pending_.front())};
        __pending_.pop_front();
        return __source;
      }

      void __on_admitted() noexcept {
        ++__admitted_;
        ++__open_;
        __peak_open_ = (std::max)(__peak_open_, __open_);
      }

      void __on_slot_freed() noexcept {
        JUNCTION_ASSERT(__open_ > 0);
        --__open_;
      }

      //! Drops every source that never started; returns how many there were.
      auto __clear_pending() noexcept -> std::size_t {
        const std::size_t __count = __pending_.size();
        __pending_.clear();
        return __count;
      }

      [[nodiscard]]
      auto __max_open() const noexcept -> int {
        return __max_open_;
      }

      [[nodiscard]]
      auto __open() const noexcept -> std::size_t {
        return __open_;
      }

      [[nodiscard]]
      auto __pending() const noexcept -> std::size_t {
        return __pending_.size();
      }

      [[nodiscard]]
      auto __admitted() const noexcept -> std::size_t {
        return __admitted_;
      }

      [[nodiscard]]
      auto __peak_open() const noexcept -> std::size_t {
        return __peak_open_;
      }

     private:
      int __max_open_;
      std::deque<_Source> __pending_{};
      std::size_t __open_ = 0;
      std::size_t __admitted_ = 0;
      std::size_t __peak_open_ = 0;
    };
  } // namespace __merge
} // namespace junction
