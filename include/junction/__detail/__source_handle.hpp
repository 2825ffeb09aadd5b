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
#include "../source.hpp"
#include "__utility.hpp"

#include <exec/sequence.hpp>
#include <exec/trampoline_scheduler.hpp>
#include <stdexec/execution.hpp>

#include <cstddef>
#include <exception>
#include <optional>
#include <utility>

namespace junction {
  namespace __merge {
    using namespace stdexec;

    enum class __handle_state : unsigned char {
      __idle,       // not pulled yet, or between two pulls of the source of sources
      __requesting, // a pull is in flight (or about to be started)
      __has_value,  // holds a value the read-ahead buffer had no room for
      __closing,    // terminal; its cleanup is running
      __closed
    };

    template <class _Source>
    struct __next_fn {
      _Source* __source_;

      auto operator()() const -> next_sender_t<_Source> {
        return __source_->next();
      }
    };

    template <class _Source>
    struct __close_fn {
      _Source* __source_;

      auto operator()() const -> close_sender_t<_Source> {
        return __source_->close();
      }
    };

    template <class _Handle, class _Value>
    struct __next_receiver {
      using receiver_concept = stdexec::receiver_t;
      using __value_t = _Value;

      template <class _Opt>
        requires std::constructible_from<std::optional<__value_t>, _Opt>
      void set_value(_Opt&& __opt) noexcept {
        _Handle* __handle = __handle_;
        STDEXEC_TRY {
          std::optional<__value_t> __value{static_cast<_Opt&&>(__opt)};
          __handle->__sink_->__on_next(*__handle, std::move(__value));
        }
        STDEXEC_CATCH_ALL {
          __handle->__sink_->__on_failure(*__handle, std::current_exception());
        }
      }

      template <class _Error>
      void set_error(_Error&& __err) noexcept {
        __handle_->__sink_->__on_failure(
          *__handle_, __detail::__as_exception_ptr(static_cast<_Error&&>(__err)));
      }

      void set_stopped() noexcept {
        __handle_->__sink_->__on_next(*__handle_, std::optional<__value_t>{});
      }

      [[nodiscard]]
      auto get_env() const noexcept -> prop<get_stop_token_t, inplace_stop_token> {
        return prop{get_stop_token, __handle_->__stop_source_.get_token()};
      }

      _Handle* __handle_;
    };

    template <class _Handle>
    struct __close_receiver {
      using receiver_concept = stdexec::receiver_t;

      template <class... _As>
      void set_value(_As&&...) noexcept {
        __handle_->__sink_->__on_cleaned(*__handle_);
      }

      template <class _Error>
      void set_error(_Error&& __err) noexcept {
        auto __eptr = __detail::__as_exception_ptr(static_cast<_Error&&>(__err));
        JUNCTION_LOG_WARN(
          "junction: cleanup of source #{} failed and was suppressed: {}",
          __handle_->__id_,
          __detail::__what(__eptr));
        __handle_->__sink_->__on_cleaned(*__handle_);
      }

      void set_stopped() noexcept {
        __handle_->__sink_->__on_cleaned(*__handle_);
      }

      [[nodiscard]]
      auto get_env() const noexcept -> env<> {
        return {};
      }

      _Handle* __handle_;
    };

    ////////////////////////////////////////////////////////////////////////////
    // One producer, as the merge sees it: the source itself, its
    // cancellation token, and the storage for its in-flight pull and cleanup.
    // Every pull and every cleanup is started on _Scheduler, behind a
    // trampoline: a source that completes inline on an inline scheduler
    // re-pulls from inside its own completion, and the trampoline bounds
    // that recursion. Completions are reported to the _Sink, which owns all
    // of the bookkeeping fields below and only touches them under its own
    // lock.
    template <class _Sink, class _Source, class _Scheduler>
    struct __source_handle : __immovable {
      using value_type = source_value_t<_Source>;

      template <class _Fn>
      using __bouncy_sender_t = decltype(exec::sequence(
        stdexec::schedule(std::declval<exec::trampoline_scheduler&>()),
        stdexec::let_value(stdexec::schedule(std::declval<_Scheduler&>()), std::declval<_Fn>())));

      using __next_sender_t = __bouncy_sender_t<__next_fn<_Source>>;
      using __close_sender_t = __bouncy_sender_t<__close_fn<_Source>>;

      using __next_receiver_t = __next_receiver<__source_handle, value_type>;
      using __close_receiver_t = __close_receiver<__source_handle>;

      __source_handle(std::size_t __id, _Sink* __sink, _Scheduler __sched, _Source __source)
        : __id_{__id}
        , __sink_{__sink}
        , __sched_{static_cast<_Scheduler&&>(__sched)}
        , __source_{static_cast<_Source&&>(__source)} {
      }

      //! Starts the next pull. The sink guarantees the previous one completed.
      void __pull() noexcept {
        STDEXEC_TRY {
          auto& __op = __next_op_.emplace(stdexec::__emplace_from{[this] {
            return stdexec::connect(
              exec::sequence(
                stdexec::schedule(__trampoline_),
                stdexec::let_value(stdexec::schedule(__sched_), __next_fn<_Source>{&__source_})),
              __next_receiver_t{this});
          }});
          stdexec::start(__op);
        }
        STDEXEC_CATCH_ALL {
          auto __error = std::current_exception();
          JUNCTION_LOG_ERROR(
            "junction: could not start a pull of source #{}: {}", __id_, __detail::__what(__error));
          __sink_->__on_failure(*this, std::move(__error));
        }
      }

      //! Runs the source's cleanup action. Called once, after the last pull.
      void __cleanup() noexcept {
        STDEXEC_TRY {
          auto& __op = __close_op_.emplace(stdexec::__emplace_from{[this] {
            return stdexec::connect(
              exec::sequence(
                stdexec::schedule(__trampoline_),
                stdexec::let_value(stdexec::schedule(__sched_), __close_fn<_Source>{&__source_})),
              __close_receiver_t{this});
          }});
          stdexec::start(__op);
        }
        STDEXEC_CATCH_ALL {
          JUNCTION_LOG_ERROR(
            "junction: could not start the cleanup of source #{}: {}",
            __id_,
            __detail::__what(std::current_exception()));
          __sink_->__on_cleaned(*this);
        }
      }

      void __cancel() noexcept {
        __stop_source_.request_stop();
      }

      [[nodiscard]]
      auto __terminal() const noexcept -> bool {
        return __state_ == __handle_state::__closing || __state_ == __handle_state::__closed;
      }

      const std::size_t __id_;
      _Sink* const __sink_;
      _Scheduler __sched_;
      exec::trampoline_scheduler __trampoline_{};
      _Source __source_;
      inplace_stop_source __stop_source_{};

      // Guarded by the sink's lock.
      __handle_state __state_{__handle_state::__idle};
      bool __cancel_requested_ = false;
      std::size_t __pins_ = 0;
      std::optional<value_type> __held_{};

      std::optional<connect_result_t<__next_sender_t, __next_receiver_t>> __next_op_{};
      std::optional<connect_result_t<__close_sender_t, __close_receiver_t>> __close_op_{};
    };
  } // namespace __merge
} // namespace junction
