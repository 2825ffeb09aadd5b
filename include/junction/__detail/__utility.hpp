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

#include <stdexec/execution.hpp>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace junction {
  namespace __detail {
    template <class _Error>
    auto __as_exception_ptr(_Error&& __err) noexcept -> std::exception_ptr {
      using __error_t = std::remove_cvref_t<_Error>;
      if constexpr (std::is_same_v<__error_t, std::exception_ptr>) {
        return static_cast<_Error&&>(__err);
      } else {
        STDEXEC_TRY {
          if constexpr (std::is_same_v<__error_t, std::error_code>) {
            return std::make_exception_ptr(std::system_error(__err));
          } else {
            return std::make_exception_ptr(static_cast<_Error&&>(__err));
          }
        }
        STDEXEC_CATCH_ALL {
          return std::current_exception();
        }
      }
    }

    // Message of a failure, for diagnostics only.
    inline auto __what(const std::exception_ptr& __eptr) -> std::string {
      if (!__eptr) {
        return "no error";
      }
      STDEXEC_TRY {
        std::rethrow_exception(__eptr);
      }
      STDEXEC_CATCH(const std::exception& __ex) {
        return __ex.what();
      }
      STDEXEC_CATCH_ALL {
        return "unknown error";
      }
    }

    // The three ways a pull can end, as seen by whoever parked it.
    template <class _Value>
    using __pull_result = std::variant<std::optional<_Value>, std::exception_ptr, stdexec::set_stopped_t>;

    template <class _Receiver, class _Value>
    void __complete_pull(_Receiver& __rcvr, __pull_result<_Value>&& __result) noexcept {
      switch (__result.index()) {
      case 0:
        stdexec::set_value(
          static_cast<_Receiver&&>(__rcvr), std::move(*std::get_if<0>(&__result)));
        break;
      case 1:
        stdexec::set_error(
          static_cast<_Receiver&&>(__rcvr), std::move(*std::get_if<1>(&__result)));
        break;
      default:
        stdexec::set_stopped(static_cast<_Receiver&&>(__rcvr));
        break;
      }
    }
  } // namespace __detail
} // namespace junction
