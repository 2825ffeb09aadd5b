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
#include <utility>

namespace junction {
  namespace __merge {
    ////////////////////////////////////////////////////////////////////////////
    // Values pulled ahead of the consumer, plus the sources that produced a
    // value while the buffer was full. Both are kept in the order the values
    // became ready; that order is the only fairness the merge promises.
    template <class _Value>
    class __read_ahead {
     public:
      //! The buffer never holds more values than there are live sources.
      [[nodiscard]]
      auto __can_accept(std::size_t __live) const noexcept -> bool {
        return __values_.size() < __live;
      }

      void __push(_Value&& __value) {
        __values_.push_back(static_cast<_Value&&>(__value));
        __peak_ = (std::max)(__peak_, __values_.size());
      }

      auto __pop() -> _Value {
        JUNCTION_ASSERT(!__values_.empty());
        _Value __value = std::move(__values_.front());
        __values_.pop_front();
        return __value;
      }

      void __hold(std::size_t __id) {
        __held_.push_back(__id);
      }

      [[nodiscard]]
      auto __has_held() const noexcept -> bool {
        return !__held_.empty();
      }

      auto __pop_held() noexcept -> std::size_t {
        JUNCTION_ASSERT(!__held_.empty());
        const std::size_t __id = __held_.front();
        __held_.pop_front();
        return __id;
      }

      //! Drops every buffered value and forgets every held source.
      auto __clear() noexcept -> std::size_t {
        const std::size_t __dropped = __values_.size();
        __values_.clear();
        __held_.clear();
        return __dropped;
      }

      [[nodiscard]]
      auto __empty() const noexcept -> bool {
        return __values_.empty();
      }

      [[nodiscard]]
      auto __size() const noexcept -> std::size_t {
        return __values_.size();
      }

      [[nodiscard]]
      auto __held() const noexcept -> std::size_t {
        return __held_.size();
      }

      [[nodiscard]]
      auto __peak() const noexcept -> std::size_t {
        return __peak_;
      }

     private:
      std::deque<_Value> __values_{};
      std::deque<std::size_t> __held_{};
      std::size_t __peak_ = 0;
    };
  } // namespace __merge
} // namespace junction
