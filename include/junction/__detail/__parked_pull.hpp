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

#include "__utility.hpp"

#include <stdexec/execution.hpp>

#include <exception>
#include <optional>

namespace junction {
  namespace __detail {
    using namespace stdexec;

    ////////////////////////////////////////////////////////////////////////////
    // A pull that an owner (a channel, a merge) may park until it has
    // something to hand out. The owner serializes __request/__cancel_request
    // with its own lock; __stop_requested_ is guarded by that lock as well.
    template <class _Value>
    struct __pull_task : __immovable {
      void (*__complete_)(__pull_task*, __pull_result<_Value>&&) noexcept;
      bool __stop_requested_ = false;

      void __complete(__pull_result<_Value>&& __result) noexcept {
        __complete_(this, static_cast<__pull_result<_Value>&&>(__result));
      }
    };

    template <class _Owner, class _Value, class _Receiver>
    struct __pull_op : __pull_task<_Value> {
      struct __on_stop {
        __pull_op* __self_;

        void operator()() const noexcept {
          __self_->__owner_->__cancel_request(__self_);
        }
      };

      using __stop_token_t = stop_token_of_t<env_of_t<_Receiver>>;
      using __on_stop_t = stop_callback_for_t<__stop_token_t, __on_stop>;

      __pull_op(_Owner* __owner, _Receiver __rcvr) noexcept(__nothrow_move_constructible<_Receiver>)
        : __pull_task<_Value>{{}, &__complete_impl}
        , __owner_{__owner}
        , __rcvr_{static_cast<_Receiver&&>(__rcvr)} {
      }

      void start() & noexcept {
        auto __token = stdexec::get_stop_token(stdexec::get_env(__rcvr_));
        if (__token.stop_requested()) {
          stdexec::set_stopped(static_cast<_Receiver&&>(__rcvr_));
          return;
        }
        __on_stop_.emplace(__token, __on_stop{this});
        __owner_->__request(this);
      }

     private:
      static void __complete_impl(__pull_task<_Value>* __task, __pull_result<_Value>&& __result) noexcept {
        auto* __self = static_cast<__pull_op*>(__task);
        __self->__on_stop_.reset();
        __detail::__complete_pull(__self->__rcvr_, static_cast<__pull_result<_Value>&&>(__result));
      }

      _Owner* __owner_;
      _Receiver __rcvr_;
      std::optional<__on_stop_t> __on_stop_{};
    };

    template <class _Owner, class _Value>
    struct __pull_sender {
      using sender_concept = stdexec::sender_t;
      using completion_signatures = stdexec::completion_signatures<
        set_value_t(std::optional<_Value>),
        set_error_t(std::exception_ptr),
        set_stopped_t()
      >;

      template <receiver_of<completion_signatures> _Receiver>
      auto connect(_Receiver __rcvr) const noexcept(__nothrow_move_constructible<_Receiver>)
        -> __pull_op<_Owner, _Value, _Receiver> {
        return {__owner_, static_cast<_Receiver&&>(__rcvr)};
      }

      _Owner* __owner_;
    };

    ////////////////////////////////////////////////////////////////////////////
    // A close request that completes once the owner finished its shutdown.
    struct __close_task : __immovable {
      void (*__complete_)(__close_task*) noexcept;

      void __complete() noexcept {
        __complete_(this);
      }
    };

    template <class _Owner, class _Receiver>
    struct __close_op : __close_task {
      __close_op(_Owner* __owner, _Receiver __rcvr) noexcept(__nothrow_move_constructible<_Receiver>)
        : __close_task{{}, &__complete_impl}
        , __owner_{__owner}
        , __rcvr_{static_cast<_Receiver&&>(__rcvr)} {
      }

      void start() & noexcept {
        __owner_->__close(this);
      }

     private:
      static void __complete_impl(__close_task* __task) noexcept {
        auto* __self = static_cast<__close_op*>(__task);
        stdexec::set_value(static_cast<_Receiver&&>(__self->__rcvr_));
      }

      _Owner* __owner_;
      _Receiver __rcvr_;
    };

    template <class _Owner>
    struct __close_sender {
      using sender_concept = stdexec::sender_t;
      using completion_signatures = stdexec::completion_signatures<set_value_t()>;

      template <receiver_of<completion_signatures> _Receiver>
      auto connect(_Receiver __rcvr) const noexcept(__nothrow_move_constructible<_Receiver>)
        -> __close_op<_Owner, _Receiver> {
        return {__owner_, static_cast<_Receiver&&>(__rcvr)};
      }

      _Owner* __owner_;
    };
  } // namespace __detail
} // namespace junction
