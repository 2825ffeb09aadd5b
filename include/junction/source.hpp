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

#include <stdexec/execution.hpp>

#include <concepts>
#include <utility>

namespace junction {
  //! A pull-driven asynchronous stream of `value_type`.
  //!
  //! `next()` returns a sender that completes with `std::optional<value_type>`
  //! (an empty optional once the source is exhausted), with an error when the
  //! source failed, or stopped when the pull was cancelled through the stop
  //! token of its receiver. At most one pull is in flight at any time.
  //!
  //! `close()` returns a sender that releases the source's resources. It is
  //! called once, after the last pull completed.
  template <class _Source>
  concept source =                       //
    std::move_constructible<_Source> &&  //
    requires(_Source& __src) {
      typename _Source::value_type;
      { __src.next() } -> stdexec::sender;
      { __src.close() } -> stdexec::sender;
    };

  template <source _Source>
  using source_value_t = typename _Source::value_type;

  template <source _Source>
  using next_sender_t = decltype(std::declval<_Source&>().next());

  template <source _Source>
  using close_sender_t = decltype(std::declval<_Source&>().close());

  //! A source whose values are themselves sources.
  template <class _Outer>
  concept source_of_sources = source<_Outer> && source<source_value_t<_Outer>>;
} // namespace junction
