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

#include "../log.hpp"
#include "../merge_options.hpp"
#include "../source.hpp"
#include "__admission.hpp"
#include "__parked_pull.hpp"
#include "__read_ahead.hpp"
#include "__source_arena.hpp"
#include "__source_handle.hpp"
#include "__termination.hpp"
#include "__utility.hpp"

#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace junction {
  namespace __merge {
    ////////////////////////////////////////////////////////////////////////////
    // The coordination point of one merge.
    //
    // Every event (a pull or a cleanup of a source completed, the consumer
    // pulled, closed or withdrew a pull) is handled under __mutex_. Handling
    // an event only updates bookkeeping and records what has to happen next
    // in an __actions list; the list is executed by __run once the lock is
    // released, so no operation is ever started or completed under the lock.
    //
    // Lifetime: the consumer may destroy the merge as soon as it is done.
    // Until then every action still to be executed keeps the merge from
    // being done: pulls and cleanups belong to entries that are not closed
    // yet, and cancellations pin their entry. Completing the consumer's
    // operations comes last and does not touch the state any more.
    template <class _Outer, class _Scheduler>
    struct __state : __immovable {
      using __inner_t = source_value_t<_Outer>;
      using value_type = source_value_t<__inner_t>;
      using __entry_t = __source_handle<__state, __inner_t, _Scheduler>;
      using __outer_t = __source_handle<__state, _Outer, _Scheduler>;
      using __puller_t = __detail::__pull_task<value_type>;
      using __closer_t = __detail::__close_task;
      using __result_t = __detail::__pull_result<value_type>;

      static constexpr std::size_t __outer_id = static_cast<std::size_t>(-1);

      struct __delivery {
        __puller_t* __puller_;
        __result_t __result_;
      };

      struct __actions {
        std::vector<__entry_t*> __pulls_{};
        std::vector<__entry_t*> __cleanups_{};
        std::vector<__entry_t*> __cancels_{}; // pinned
        bool __pull_outer_ = false;
        bool __cleanup_outer_ = false;
        bool __cancel_outer_ = false;         // pinned
        std::vector<__delivery> __deliveries_{};
        std::vector<__closer_t*> __closers_{};
      };

      __state(_Outer __outer, merge_options __opts, _Scheduler __sched)
        : __sched_{__sched}
        , __admission_{__opts.max_open}
        , __outer_{__outer_id, this, static_cast<_Scheduler&&>(__sched), static_cast<_Outer&&>(__outer)} {
      }

      ~__state() {
        // A started merge must be driven to completion (by draining it or by
        // closing it) before it is destroyed.
        JUNCTION_ASSERT(!__started_ || __termination_.__done());
      }

      ////////////////////////////////////////////////////////////////////////
      // Consumer side

      void __request(__puller_t* __puller) noexcept {
        __actions __acts;
        {
          std::unique_lock __guard{__mutex_};
          if (!__started_) {
            __started_ = true;
            JUNCTION_LOG_DEBUG("junction: merge started (max_open = {})", __admission_.__max_open());
            __fill_outer_locked(__acts);
          }
          if (__puller->__stop_requested_) {
            __acts.__deliveries_.push_back({__puller, __result_t{std::in_place_index<2>}});
          } else if (__termination_.__done()) {
            __acts.__deliveries_.push_back({__puller, __terminal_result_locked()});
          } else if (!__buffer_.__empty()) {
            STDEXEC_TRY {
              __acts.__deliveries_.push_back(
                {__puller, __result_t{std::in_place_index<0>, __buffer_.__pop()}});
              __refill_locked(__acts);
            }
            STDEXEC_CATCH_ALL {
              __fail_locked(std::current_exception(), __acts);
            }
            __check_done_locked(__acts);
          } else {
            __pullers_.push_back(__puller);
          }
        }
        __run(this, __acts);
      }

      void __cancel_request(__puller_t* __puller) noexcept {
        __actions __acts;
        {
          std::unique_lock __guard{__mutex_};
          if (!__remove_puller_locked(__puller)) {
            // Not parked (yet, or any more). __request checks the flag.
            __puller->__stop_requested_ = true;
          } else {
            __acts.__deliveries_.push_back({__puller, __result_t{std::in_place_index<2>}});
          }
        }
        __run(this, __acts);
      }

      void __close(__closer_t* __closer) noexcept {
        __actions __acts;
        {
          std::unique_lock __guard{__mutex_};
          if (__termination_.__done()) {
            __acts.__closers_.push_back(__closer);
          } else {
            __closers_.push_back(__closer);
            if (__termination_.__kill()) {
              __started_ = true;
              JUNCTION_LOG_DEBUG("junction: closed by the consumer, state -> {}", to_string(__termination_.__state()));
              __shutdown_locked(__acts);
            }
            __check_done_locked(__acts);
          }
        }
        __run(this, __acts);
      }

      [[nodiscard]]
      auto __stats() -> merge_stats {
        std::unique_lock __guard{__mutex_};
        merge_stats __snapshot;
        __snapshot.state = __termination_.__state();
        __snapshot.outcome = __termination_.__outcome();
        __snapshot.admitted = __admission_.__admitted();
        __snapshot.finished = __finished_;
        __snapshot.open = __admission_.__open();
        __snapshot.live = __live_;
        __snapshot.pending = __admission_.__pending();
        __snapshot.buffered = __buffer_.__size();
        __snapshot.peak_open = __admission_.__peak_open();
        __snapshot.peak_buffered = __buffer_.__peak();
        return __snapshot;
      }

      ////////////////////////////////////////////////////////////////////////
      // Events of admitted sources

      void __on_next(__entry_t& __entry, std::optional<value_type>&& __value) noexcept {
        __actions __acts;
        {
          std::unique_lock __guard{__mutex_};
          JUNCTION_ASSERT(__entry.__state_ == __handle_state::__requesting);
          if (!__termination_.__running()) {
            __retire_locked(__entry, __acts);
          } else if (__value) {
            STDEXEC_TRY {
              __accept_locked(__entry, std::move(*__value), __acts);
            }
            STDEXEC_CATCH_ALL {
              __retire_locked(__entry, __acts);
              __fail_locked(std::current_exception(), __acts);
            }
          } else {
            JUNCTION_LOG_TRACE("junction: source #{} is exhausted", __entry.__id_);
            __retire_locked(__entry, __acts);
          }
          __check_done_locked(__acts);
        }
        __run(this, __acts);
      }

      void __on_failure(__entry_t& __entry, std::exception_ptr __error) noexcept {
        __actions __acts;
        {
          std::unique_lock __guard{__mutex_};
          JUNCTION_ASSERT(__entry.__state_ == __handle_state::__requesting);
          __retire_locked(__entry, __acts);
          if (__termination_.__running()) {
            JUNCTION_LOG_DEBUG(
              "junction: source #{} failed: {}", __entry.__id_, __detail::__what(__error));
          }
          __fail_locked(std::move(__error), __acts);
          __check_done_locked(__acts);
        }
        __run(this, __acts);
      }

      void __on_cleaned(__entry_t& __entry) noexcept {
        __actions __acts;
        {
          std::unique_lock __guard{__mutex_};
          JUNCTION_ASSERT(__entry.__state_ == __handle_state::__closing);
          __entry.__state_ = __handle_state::__closed;
          ++__finished_;
          __admission_.__on_slot_freed();
          JUNCTION_LOG_TRACE(
            "junction: source #{} cleaned up ({} open)", __entry.__id_, __admission_.__open());
          if (__termination_.__running()) {
            STDEXEC_TRY {
              __admit_pending_locked(__acts);
            }
            STDEXEC_CATCH_ALL {
              __fail_locked(std::current_exception(), __acts);
            }
            __fill_outer_locked(__acts);
          }
          // May destroy __entry.
          __compact_locked();
          __check_done_locked(__acts);
        }
        __run(this, __acts);
      }

      ////////////////////////////////////////////////////////////////////////
      // Events of the source of sources

      void __on_next(__outer_t&, std::optional<__inner_t>&& __source) noexcept {
        __actions __acts;
        {
          std::unique_lock __guard{__mutex_};
          JUNCTION_ASSERT(__outer_.__state_ == __handle_state::__requesting);
          __outer_.__state_ = __handle_state::__idle;
          if (!__termination_.__running()) {
            // A source delivered while shutting down is never admitted.
            __outer_.__state_ = __handle_state::__closing;
            __acts.__cleanup_outer_ = true;
          } else if (__source) {
            STDEXEC_TRY {
              if (__admission_.__has_capacity() && __admission_.__wants_source()) {
                __admit_locked(std::move(*__source), __acts);
              } else {
                __admission_.__enqueue(std::move(*__source));
                JUNCTION_LOG_DEBUG(
                  "junction: source queued, {} open, {} waiting",
                  __admission_.__open(),
                  __admission_.__pending());
              }
            }
            STDEXEC_CATCH_ALL {
              __fail_locked(std::current_exception(), __acts);
            }
            __fill_outer_locked(__acts);
          } else {
            JUNCTION_LOG_DEBUG(
              "junction: source of sources exhausted after {} sources",
              __admission_.__admitted() + __admission_.__pending());
            __outer_.__state_ = __handle_state::__closing;
            __acts.__cleanup_outer_ = true;
          }
          __check_done_locked(__acts);
        }
        __run(this, __acts);
      }

      void __on_failure(__outer_t&, std::exception_ptr __error) noexcept {
        __actions __acts;
        {
          std::unique_lock __guard{__mutex_};
          JUNCTION_ASSERT(__outer_.__state_ == __handle_state::__requesting);
          __outer_.__state_ = __handle_state::__closing;
          __acts.__cleanup_outer_ = true;
          if (__termination_.__running()) {
            JUNCTION_LOG_DEBUG("junction: source of sources failed: {}", __detail::__what(__error));
          }
          __fail_locked(std::move(__error), __acts);
          __check_done_locked(__acts);
        }
        __run(this, __acts);
      }

      void __on_cleaned(__outer_t&) noexcept {
        __actions __acts;
        {
          std::unique_lock __guard{__mutex_};
          JUNCTION_ASSERT(__outer_.__state_ == __handle_state::__closing);
          __outer_.__state_ = __handle_state::__closed;
          __check_done_locked(__acts);
        }
        __run(this, __acts);
      }

     private:
      ////////////////////////////////////////////////////////////////////////
      // Under the lock

      void __admit_locked(__inner_t&& __source, __actions& __acts) {
        auto& __entry = __arena_.__emplace(this, __sched_, static_cast<__inner_t&&>(__source));
        __admission_.__on_admitted();
        ++__live_;
        __entry.__state_ = __handle_state::__requesting;
        JUNCTION_LOG_DEBUG(
          "junction: admitted source #{} ({} open)", __entry.__id_, __admission_.__open());
        __acts.__pulls_.push_back(&__entry);
      }

      void __admit_pending_locked(__actions& __acts) {
        while (auto __source = __admission_.__dequeue()) {
          __admit_locked(std::move(*__source), __acts);
        }
      }

      void __fill_outer_locked(__actions& __acts) noexcept {
        if (
          __termination_.__running() && __outer_.__state_ == __handle_state::__idle
          && __admission_.__wants_source()) {
          __outer_.__state_ = __handle_state::__requesting;
          __acts.__pull_outer_ = true;
        }
      }

      // A value arrived from a running source: hand it to a waiting consumer,
      // buffer it, or hold it back together with its source.
      void __accept_locked(__entry_t& __entry, value_type&& __value, __actions& __acts) {
        if (!__pullers_.empty()) {
          JUNCTION_ASSERT(__buffer_.__empty());
          __acts.__deliveries_.push_back(
            {__pullers_.front(), __result_t{std::in_place_index<0>, static_cast<value_type&&>(__value)}});
          __pullers_.pop_front();
          __acts.__pulls_.push_back(&__entry);
        } else if (__buffer_.__can_accept(__live_)) {
          __buffer_.__push(static_cast<value_type&&>(__value));
          __acts.__pulls_.push_back(&__entry);
        } else {
          __entry.__held_.emplace(static_cast<value_type&&>(__value));
          __buffer_.__hold(__entry.__id_);
          __entry.__state_ = __handle_state::__has_value;
          JUNCTION_LOG_TRACE(
            "junction: buffer full ({} values), holding back source #{}",
            __buffer_.__size(),
            __entry.__id_);
        }
      }

      // The consumer took a value: move held-back values into the buffer in
      // the order they arrived and let their sources continue.
      void __refill_locked(__actions& __acts) {
        while (__buffer_.__has_held() && __buffer_.__can_accept(__live_)) {
          __entry_t* __entry = __arena_.__find(__buffer_.__pop_held());
          if (__entry == nullptr || __entry->__state_ != __handle_state::__has_value) {
            continue;
          }
          __buffer_.__push(std::move(*__entry->__held_));
          __entry->__held_.reset();
          __entry->__state_ = __handle_state::__requesting;
          __acts.__pulls_.push_back(__entry);
        }
      }

      // The entry will not produce any more; run its cleanup.
      void __retire_locked(__entry_t& __entry, __actions& __acts) noexcept {
        JUNCTION_ASSERT(!__entry.__terminal());
        __entry.__state_ = __handle_state::__closing;
        __entry.__held_.reset();
        --__live_;
        __acts.__cleanups_.push_back(&__entry);
      }

      void __fail_locked(std::exception_ptr __error, __actions& __acts) noexcept {
        if (__termination_.__fail(std::move(__error))) {
          JUNCTION_LOG_DEBUG("junction: state -> {}", to_string(__termination_.__state()));
          __shutdown_locked(__acts);
        } else {
          JUNCTION_LOG_DEBUG(
            "junction: failure discarded, merge is already {}", to_string(__termination_.__state()));
        }
      }

      // Cancels everything that may still produce and drops what was read
      // ahead. Sources that never started are dropped as they are.
      void __shutdown_locked(__actions& __acts) noexcept {
        const std::size_t __dropped = __buffer_.__clear();
        const std::size_t __never_started = __admission_.__clear_pending();
        if (__dropped != 0 || __never_started != 0) {
          JUNCTION_LOG_DEBUG(
            "junction: dropped {} buffered values and {} waiting sources", __dropped, __never_started);
        }
        __arena_.__for_each([&](__entry_t& __entry) {
          if (__entry.__terminal() || __entry.__cancel_requested_) {
            return;
          }
          if (__entry.__state_ == __handle_state::__has_value) {
            __retire_locked(__entry, __acts);
          }
          __entry.__cancel_requested_ = true;
          ++__entry.__pins_;
          __acts.__cancels_.push_back(&__entry);
        });
        if (__outer_.__state_ == __handle_state::__idle) {
          __outer_.__state_ = __handle_state::__closing;
          __acts.__cleanup_outer_ = true;
        } else if (__outer_.__state_ == __handle_state::__requesting && !__outer_.__cancel_requested_) {
          __outer_.__cancel_requested_ = true;
          ++__outer_.__pins_;
          __acts.__cancel_outer_ = true;
        }
      }

      void __compact_locked() noexcept {
        __arena_.__compact([](const __entry_t& __entry) noexcept {
          return __entry.__state_ == __handle_state::__closed && __entry.__pins_ == 0;
        });
      }

      void __check_done_locked(__actions& __acts) noexcept {
        if (__termination_.__done() || !__started_) {
          return;
        }
        const bool __quiescent = __outer_.__state_ == __handle_state::__closed
                              && __outer_.__pins_ == 0 && __arena_.__empty();
        if (__termination_.__running()) {
          if (!__quiescent || __admission_.__pending() != 0 || !__buffer_.__empty()) {
            return;
          }
          __termination_.__complete();
        } else {
          if (!__quiescent) {
            return;
          }
          __termination_.__finish();
        }
        JUNCTION_LOG_DEBUG(
          "junction: merge done ({}), {} sources admitted",
          to_string(__termination_.__outcome()),
          __admission_.__admitted());
        __flush_waiters_locked(__acts);
      }

      void __flush_waiters_locked(__actions& __acts) noexcept {
        while (!__pullers_.empty()) {
          __acts.__deliveries_.push_back({__pullers_.front(), __terminal_result_locked()});
          __pullers_.pop_front();
        }
        __acts.__closers_.insert(__acts.__closers_.end(), __closers_.begin(), __closers_.end());
        __closers_.clear();
      }

      // What a pull observes once the merge is done: the failure, once, and
      // the end of the stream after that.
      auto __terminal_result_locked() noexcept -> __result_t {
        if (auto __error = __termination_.__take_error()) {
          return __result_t{std::in_place_index<1>, std::move(*__error)};
        }
        return __result_t{std::in_place_index<0>, std::nullopt};
      }

      auto __remove_puller_locked(__puller_t* __puller) noexcept -> bool {
        for (auto __it = __pullers_.begin(); __it != __pullers_.end(); ++__it) {
          if (*__it == __puller) {
            __pullers_.erase(__it);
            return true;
          }
        }
        return false;
      }

      ////////////////////////////////////////////////////////////////////////
      // Outside the lock

      static void __run(__state* __self, __actions& __acts) noexcept {
        for (__entry_t* __entry: __acts.__pulls_) {
          __entry->__pull();
        }
        if (__acts.__pull_outer_) {
          __self->__outer_.__pull();
        }
        for (__entry_t* __entry: __acts.__cleanups_) {
          __entry->__cleanup();
        }
        if (__acts.__cleanup_outer_) {
          __self->__outer_.__cleanup();
        }
        if (!__acts.__cancels_.empty() || __acts.__cancel_outer_) {
          for (__entry_t* __entry: __acts.__cancels_) {
            __entry->__cancel();
          }
          if (__acts.__cancel_outer_) {
            __self->__outer_.__cancel();
          }
          std::unique_lock __guard{__self->__mutex_};
          for (__entry_t* __entry: __acts.__cancels_) {
            --__entry->__pins_;
          }
          if (__acts.__cancel_outer_) {
            --__self->__outer_.__pins_;
          }
          __self->__compact_locked();
          __self->__check_done_locked(__acts);
        }
        // The merge may be destroyed as soon as the first of these completes.
        for (auto& __delivery: __acts.__deliveries_) {
          __delivery.__puller_->__complete(std::move(__delivery.__result_));
        }
        for (__closer_t* __closer: __acts.__closers_) {
          __closer->__complete();
        }
      }

      std::mutex __mutex_{};
      _Scheduler __sched_;
      __admission<__inner_t> __admission_;
      __read_ahead<value_type> __buffer_{};
      __termination __termination_{};
      __source_arena<__entry_t> __arena_{};
      __outer_t __outer_;
      std::deque<__puller_t*> __pullers_{};
      std::vector<__closer_t*> __closers_{};
      std::size_t __live_ = 0;
      std::size_t __finished_ = 0;
      bool __started_ = false;
    };
  } // namespace __merge
} // namespace junction
