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

#include "source.hpp"

#include <stdexec/execution.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

namespace junction {
  //! A source over values it owns. Each value is handed out once, moved.
  template <class _Value>
  class iterate_source {
   public:
    using value_type = _Value;

    iterate_source() = default;

    explicit iterate_source(std::vector<_Value> __values) noexcept
      : __values_{std::move(__values)} {
    }

    auto next() -> decltype(stdexec::just(std::optional<_Value>{})) {
      std::optional<_Value> __value;
      if (__pos_ < __values_.size()) {
        __value.emplace(std::move(__values_[__pos_++]));
      }
      return stdexec::just(std::move(__value));
    }

    auto close() noexcept -> decltype(stdexec::just()) {
      return stdexec::just();
    }

    [[nodiscard]]
    auto remaining() const noexcept -> std::size_t {
      return __values_.size() - __pos_;
    }

   private:
    std::vector<_Value> __values_{};
    std::size_t __pos_ = 0;
  };

  //! A source over a copy of the elements of `__range`.
  template <std::ranges::input_range _Range>
  auto iterate(_Range&& __range) -> iterate_source<std::ranges::range_value_t<_Range>> {
    std::vector<std::ranges::range_value_t<_Range>> __values;
    if constexpr (std::ranges::sized_range<_Range>) {
      __values.reserve(std::ranges::size(__range));
    }
    for (auto&& __value: __range) {
      __values.emplace_back(static_cast<decltype(__value)&&>(__value));
    }
    return iterate_source<std::ranges::range_value_t<_Range>>{std::move(__values)};
  }

  //! A source of sources over a fixed list of sources of the same type.
  template <source _First, std::same_as<_First>... _Rest>
  auto sources_of(_First __first, _Rest... __rest) -> iterate_source<_First> {
    std::vector<_First> __sources;
    __sources.reserve(1 + sizeof...(_Rest));
    __sources.push_back(std::move(__first));
    (__sources.push_back(std::move(__rest)), ...);
    return iterate_source<_First>{std::move(__sources)};
  }
} // namespace junction
