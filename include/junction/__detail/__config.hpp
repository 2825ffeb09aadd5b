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

#include <stdexec/__detail/__config.hpp>

#include <algorithm>
#include <cstdint>
#include <thread>

// Number of worker threads of the process-wide pool behind
// junction::default_scheduler().
#if !defined(JUNCTION_DEFAULT_POOL_THREADS)
#  define JUNCTION_DEFAULT_POOL_THREADS                                                            \
    (std::max)(std::uint32_t{2}, static_cast<std::uint32_t>(std::thread::hardware_concurrency()))
#endif

// Level of the "junction" logger when the library creates it itself.
#if !defined(JUNCTION_DEFAULT_LOG_LEVEL)
#  define JUNCTION_DEFAULT_LOG_LEVEL ::spdlog::level::warn
#endif

#if defined(JUNCTION_DISABLE_LOGGING)
#  define JUNCTION_LOGGING_ENABLED() 0
#else
#  define JUNCTION_LOGGING_ENABLED() 1
#endif

#define JUNCTION_ASSERT(...) STDEXEC_ASSERT(__VA_ARGS__)
