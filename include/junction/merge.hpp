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

#include "__detail/__merge_state.hpp"
#include "__detail/__parked_pull.hpp"
#include "default_scheduler.hpp"
#include "merge_options.hpp"
#include "source.hpp"

#include <stdexec/execution.hpp>

#include <memory>
#include <type_traits>

namespace junction {
  //! The stream of every value produced by every source of a source of
  //! sources, in the order the values became ready.
  //!
  //! Nothing is pulled before the first next(). After that the merge has to
  //! be driven to its end, either by pulling until next() reports the end of
  //! the stream (or the failure) or by close(), before it is destroyed.
  //! merged_source is itself a source, so merges nest.
  template <source_of_sources _Outer, stdexec::scheduler _Scheduler = default_scheduler_t>
  class merged_source {
    using __state_t = __merge::__state<_Outer, _Scheduler>;

   public:
    using value_type = typename __state_t::value_type;
    using next_sender = __detail::__pull_sender<__state_t, value_type>;
    using close_sender = __detail::__close_sender<__state_t>;

    merged_source(_Outer __outer, merge_options __opts, _Scheduler __sched)
      : __state_{std::make_unique<__state_t>(
          static_cast<_Outer&&>(__outer),
          __opts,
          static_cast<_Scheduler&&>(__sched))} {
    }

    merged_source(merged_source&&) noexcept = default;
    auto operator=(merged_source&&) noexcept -> merged_source& = default;

    //! Completes with the next value, with an empty optional at the end of
    //! the stream, or with the failure that ended the merge (reported to
    //! one pull only). Completes with stopped if the receiver's stop token
    //! is triggered while the pull waits.
    [[nodiscard]]
    auto next() noexcept -> next_sender {
      return {__state_.get()};
    }

    //! Cancels every source and completes once all cleanups finished.
    [[nodiscard]]
    auto close() noexcept -> close_sender {
      return {__state_.get()};
    }

    [[nodiscard]]
    auto stats() const -> merge_stats {
      return __state_->__stats();
    }

   private:
    std::unique_ptr<__state_t> __state_;
  };

  struct merge_t {
    template <source_of_sources _Outer>
    auto operator()(_Outer __outer) const -> merged_source<_Outer> {
      return {static_cast<_Outer&&>(__outer), merge_options{}, default_scheduler()};
    }

    //! `max_open <= 0` admits every source as soon as it arrives.
    template <source_of_sources _Outer>
    auto operator()(_Outer __outer, int __max_open) const -> merged_source<_Outer> {
      return {static_cast<_Outer&&>(__outer), merge_options{__max_open}, default_scheduler()};
    }

    template <source_of_sources _Outer, stdexec::scheduler _Scheduler>
    auto operator()(_Outer __outer, int __max_open, _Scheduler __sched) const
      -> merged_source<_Outer, _Scheduler> {
      return {
        static_cast<_Outer&&>(__outer),
        merge_options{__max_open},
        static_cast<_Scheduler&&>(__sched)};
    }

    template <source_of_sources _Outer, stdexec::scheduler _Scheduler>
    auto operator()(_Outer __outer, merge_options __opts, _Scheduler __sched) const
      -> merged_source<_Outer, _Scheduler> {
      return {static_cast<_Outer&&>(__outer), __opts, static_cast<_Scheduler&&>(__sched)};
    }
  };

  inline constexpr merge_t merge{};
} // namespace junction
