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

#include "__detail/__config.hpp"

#include <exec/static_thread_pool.hpp>

#include <utility>

namespace junction {
  //! The pool behind default_scheduler(). Created on first use with
  //! JUNCTION_DEFAULT_POOL_THREADS workers and kept for the rest of the
  //! process.
  inline auto default_pool() -> exec::static_thread_pool& {
    static exec::static_thread_pool __pool{JUNCTION_DEFAULT_POOL_THREADS};
    return __pool;
  }

  using default_scheduler_t = decltype(std::declval<exec::static_thread_pool&>().get_scheduler());

  //! Where merge() runs pulls and cleanups when no scheduler is given.
  inline auto default_scheduler() noexcept -> default_scheduler_t {
    return default_pool().get_scheduler();
  }
} // namespace junction
