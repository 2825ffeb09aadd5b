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

#include "__detail/__utility.hpp"

#include <stdexec/execution.hpp>

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace junction {
  //! A source that is exhausted from the start.
  template <class _Value>
  struct empty_source {
    using value_type = _Value;

    auto next() const noexcept -> decltype(stdexec::just(std::optional<_Value>{})) {
      return stdexec::just(std::optional<_Value>{});
    }

    auto close() const noexcept -> decltype(stdexec::just()) {
      return stdexec::just();
    }
  };

  //! A source whose first pull fails with `__error`.
  template <class _Value>
  class failing_source {
   public:
    using value_type = _Value;

    explicit failing_source(std::exception_ptr __error) noexcept
      : __error_{std::move(__error)} {
    }

    auto next() const noexcept -> decltype(stdexec::just_error(std::exception_ptr{})) {
      return stdexec::just_error(__error_);
    }

    auto close() const noexcept -> decltype(stdexec::just()) {
      return stdexec::just();
    }

   private:
    std::exception_ptr __error_;
  };

  template <class _Value, class _Error>
  auto fail_source(_Error&& __error) -> failing_source<_Value> {
    return failing_source<_Value>{__detail::__as_exception_ptr(static_cast<_Error&&>(__error))};
  }
} // namespace junction
