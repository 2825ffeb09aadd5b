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

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <utility>

namespace junction {
  namespace __log {
    inline constexpr const char* __logger_name = "junction";

    struct __registry {
      std::mutex __mutex_{};
      std::shared_ptr<spdlog::logger> __logger_{};
    };

    inline auto __instance() noexcept -> __registry& {
      static __registry __reg{};
      return __reg;
    }
  } // namespace __log

  //! The logger the library writes to. An application may register its own
  //! logger named "junction" with spdlog, or call set_logger(), before the
  //! first use; otherwise a stderr logger at JUNCTION_DEFAULT_LOG_LEVEL is
  //! created on demand.
  inline auto logger() -> std::shared_ptr<spdlog::logger> {
    auto& __reg = __log::__instance();
    std::unique_lock __guard{__reg.__mutex_};
    if (!__reg.__logger_) {
      __reg.__logger_ = spdlog::get(__log::__logger_name);
      if (!__reg.__logger_) {
        STDEXEC_TRY {
          __reg.__logger_ = spdlog::stderr_color_mt(__log::__logger_name);
          __reg.__logger_->set_level(JUNCTION_DEFAULT_LOG_LEVEL);
        }
        STDEXEC_CATCH_ALL {
          // Registration raced with the application or the sink could not
          // be created; fall back to spdlog's default logger.
          __reg.__logger_ = spdlog::default_logger();
        }
      }
    }
    return __reg.__logger_;
  }

  inline void set_logger(std::shared_ptr<spdlog::logger> __logger) {
    auto& __reg = __log::__instance();
    std::unique_lock __guard{__reg.__mutex_};
    __reg.__logger_ = std::move(__logger);
  }
} // namespace junction

#if JUNCTION_LOGGING_ENABLED()
#  define JUNCTION_LOG_(_LEVEL, ...)                                                               \
    do {                                                                                           \
      if (auto __junction_logger = ::junction::logger();                                          \
          __junction_logger->should_log(::spdlog::level::_LEVEL)) {                                \
        __junction_logger->log(::spdlog::level::_LEVEL, __VA_ARGS__);                              \
      }                                                                                            \
    } while (false)
#else
#  define JUNCTION_LOG_(_LEVEL, ...)                                                               \
    do {                                                                                           \
    } while (false)
#endif

#define JUNCTION_LOG_TRACE(...) JUNCTION_LOG_(trace, __VA_ARGS__)
#define JUNCTION_LOG_DEBUG(...) JUNCTION_LOG_(debug, __VA_ARGS__)
#define JUNCTION_LOG_WARN(...)  JUNCTION_LOG_(warn, __VA_ARGS__)
#define JUNCTION_LOG_ERROR(...) JUNCTION_LOG_(err, __VA_ARGS__)
