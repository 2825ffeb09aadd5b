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

#include "__detail/__parked_pull.hpp"
#include "__detail/__utility.hpp"

#include <stdexec/execution.hpp>

#include <algorithm>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace junction {
  namespace __channel {
    using namespace stdexec;

    template <class _Value>
    struct __impl : __immovable {
      using __task_t = __detail::__pull_task<_Value>;
      using __result_t = __detail::__pull_result<_Value>;

      // Called with the lock held. Hands out the oldest value, then the
      // failure, then the end of the stream.
      auto __take_locked() -> std::optional<__result_t> {
        if (!__values_.empty()) {
          __result_t __result{std::in_place_index<0>, std::move(__values_.front())};
          __values_.pop_front();
          ++__pulled_;
          return __result;
        }
        if (__error_) {
          return __result_t{std::in_place_index<1>, __error_};
        }
        if (__finished_ || __closed_) {
          return __result_t{std::in_place_index<0>, std::nullopt};
        }
        return std::nullopt;
      }

      void __request(__task_t* __task) noexcept {
        std::optional<__result_t> __result;
        {
          std::unique_lock __guard{__mutex_};
          if (__task->__stop_requested_) {
            __result.emplace(std::in_place_index<2>);
          } else {
            STDEXEC_TRY {
              __result = __take_locked();
              if (!__result) {
                __waiters_.push_back(__task);
              }
            }
            STDEXEC_CATCH_ALL {
              __result.emplace(std::in_place_index<1>, std::current_exception());
            }
          }
        }
        if (__result) {
          __task->__complete(std::move(*__result));
        }
      }

      void __cancel_request(__task_t* __task) noexcept {
        {
          std::unique_lock __guard{__mutex_};
          auto __it = std::find(__waiters_.begin(), __waiters_.end(), __task);
          if (__it == __waiters_.end()) {
            __task->__stop_requested_ = true;
            return;
          }
          __waiters_.erase(__it);
        }
        __task->__complete(__result_t{std::in_place_index<2>});
      }

      auto __push(_Value&& __value) -> bool {
        __task_t* __waiter = nullptr;
        {
          std::unique_lock __guard{__mutex_};
          if (__finished_ || __closed_ || __error_) {
            return false;
          }
          ++__pushed_;
          if (__waiters_.empty()) {
            __values_.push_back(static_cast<_Value&&>(__value));
            return true;
          }
          __waiter = __waiters_.front();
          __waiters_.pop_front();
          ++__pulled_;
        }
        __waiter->__complete(__result_t{std::in_place_index<0>, static_cast<_Value&&>(__value)});
        return true;
      }

      // Ends the stream, or fails it when __error is set. Waiting pulls see
      // the end (or the failure) right away.
      auto __end(std::exception_ptr __error) -> bool {
        std::deque<__task_t*> __waiters;
        {
          std::unique_lock __guard{__mutex_};
          if (__finished_ || __closed_ || __error_) {
            return false;
          }
          if (__error) {
            __error_ = __error;
          } else {
            __finished_ = true;
          }
          __waiters.swap(__waiters_);
        }
        __release(__waiters, __error);
        return true;
      }

      void __close() {
        std::deque<__task_t*> __waiters;
        {
          std::unique_lock __guard{__mutex_};
          __closed_ = true;
          __values_.clear();
          __waiters.swap(__waiters_);
        }
        __release(__waiters, nullptr);
      }

      static void __release(std::deque<__task_t*>& __waiters, const std::exception_ptr& __error) noexcept {
        for (__task_t* __waiter: __waiters) {
          if (__error) {
            __waiter->__complete(__result_t{std::in_place_index<1>, __error});
          } else {
            __waiter->__complete(__result_t{std::in_place_index<0>, std::nullopt});
          }
        }
      }

      std::mutex __mutex_{};
      std::deque<_Value> __values_{};
      std::deque<__task_t*> __waiters_{};
      std::exception_ptr __error_{};
      bool __finished_ = false;
      bool __closed_ = false;
      std::size_t __pushed_ = 0;
      std::size_t __pulled_ = 0;
    };

    template <class _Value>
    struct __close_fn {
      std::shared_ptr<__impl<_Value>> __impl_;

      void operator()() const {
        __impl_->__close();
      }
    };
  } // namespace __channel

  //! A source fed from the outside. Copies share the same stream: hand one
  //! copy to the consumer (for instance as one of the sources of a merge)
  //! and keep others for the producers.
  //!
  //! Pulls wait until a value is pushed or the stream ends, and complete
  //! with stopped when their receiver's stop token is triggered meanwhile.
  template <class _Value>
  class channel {
    using __impl_t = __channel::__impl<_Value>;

   public:
    using value_type = _Value;
    using next_sender = __detail::__pull_sender<__impl_t, _Value>;
    using close_sender = decltype(stdexec::then(stdexec::just(), __channel::__close_fn<_Value>{}));

    channel()
      : __impl_{std::make_shared<__impl_t>()} {
    }

    //! Returns false when the stream already ended or was closed.
    auto push(_Value __value) -> bool {
      return __impl_->__push(std::move(__value));
    }

    //! Ends the stream once the values pushed so far are consumed.
    auto finish() -> bool {
      return __impl_->__end(nullptr);
    }

    //! Fails the stream once the values pushed so far are consumed.
    template <class _Error>
    auto fail(_Error&& __error) -> bool {
      return __impl_->__end(__detail::__as_exception_ptr(static_cast<_Error&&>(__error)));
    }

    [[nodiscard]]
    auto next() const noexcept -> next_sender {
      return {__impl_.get()};
    }

    //! Drops unconsumed values; later pushes are refused.
    [[nodiscard]]
    auto close() const -> close_sender {
      return stdexec::then(stdexec::just(), __channel::__close_fn<_Value>{__impl_});
    }

    [[nodiscard]]
    auto closed() const -> bool {
      std::unique_lock __guard{__impl_->__mutex_};
      return __impl_->__closed_;
    }

    [[nodiscard]]
    auto pushed() const -> std::size_t {
      std::unique_lock __guard{__impl_->__mutex_};
      return __impl_->__pushed_;
    }

    [[nodiscard]]
    auto pulled() const -> std::size_t {
      std::unique_lock __guard{__impl_->__mutex_};
      return __impl_->__pulled_;
    }

   private:
    std::shared_ptr<__impl_t> __impl_;
  };
} // namespace junction
