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

#include "../merge_options.hpp"
#include "__config.hpp"

#include <exception>
#include <optional>

namespace junction {
  namespace __merge {
    ////////////////////////////////////////////////////////////////////////////
    // running --kill--> downstream_closing --finish--> done(killed)
    // running --fail--> source_closing     --finish--> done(failed)
    // running --complete--> done(completed)
    //
    // The first failure wins; a failure that arrives once the merge left
    // running is reported as discarded. done is terminal.
    class __termination {
     public:
      [[nodiscard]]
      auto __state() const noexcept -> junction_state {
        return __state_;
      }

      [[nodiscard]]
      auto __outcome() const noexcept -> merge_outcome {
        return __outcome_;
      }

      [[nodiscard]]
      auto __running() const noexcept -> bool {
        return __state_ == junction_state::running;
      }

      [[nodiscard]]
      auto __closing() const noexcept -> bool {
        return __state_ == junction_state::downstream_closing
            || __state_ == junction_state::source_closing;
      }

      [[nodiscard]]
      auto __done() const noexcept -> bool {
        return __state_ == junction_state::done;
      }

      //! Returns false when the failure is discarded.
      auto __fail(std::exception_ptr __error) noexcept -> bool {
        if (!__running()) {
          return false;
        }
        __state_ = junction_state::source_closing;
        __error_ = static_cast<std::exception_ptr&&>(__error);
        return true;
      }

      //! Returns false when the merge already left running.
      auto __kill() noexcept -> bool {
        if (!__running()) {
          return false;
        }
        __state_ = junction_state::downstream_closing;
        return true;
      }

      void __complete() noexcept {
        JUNCTION_ASSERT(__running());
        __state_ = junction_state::done;
        __outcome_ = merge_outcome::completed;
      }

      //! Every cleanup of a closing merge finished.
      void __finish() noexcept {
        JUNCTION_ASSERT(__closing());
        __outcome_ = __state_ == junction_state::source_closing ? merge_outcome::failed
                                                                 : merge_outcome::killed;
        __state_ = junction_state::done;
      }

      //! The failure of a done merge, handed out exactly once.
      auto __take_error() noexcept -> std::optional<std::exception_ptr> {
        if (__outcome_ != merge_outcome::failed || __error_delivered_) {
          return std::nullopt;
        }
        __error_delivered_ = true;
        return __error_;
      }

     private:
      junction_state __state_{junction_state::running};
      merge_outcome __outcome_{merge_outcome::none};
      std::exception_ptr __error_{};
      bool __error_delivered_ = false;
    };
  } // namespace __merge
} // namespace junction
