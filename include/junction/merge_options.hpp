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

#include <cstddef>
#include <string_view>

namespace junction {
  struct merge_options {
    //! Maximum number of sources running at the same time; zero or a
    //! negative value means no limit.
    int max_open = 0;
  };

  //! Lifecycle of a merge. A merge leaves `running` either because the
  //! consumer closed it (`downstream_closing`) or because a source or the
  //! source of sources failed (`source_closing`); it is `done` once every
  //! cleanup finished.
  enum class junction_state : unsigned char {
    running,
    downstream_closing,
    source_closing,
    done
  };

  enum class merge_outcome : unsigned char {
    none,
    completed,
    failed,
    killed
  };

  constexpr auto to_string(junction_state __state) noexcept -> std::string_view {
    switch (__state) {
    case junction_state::running:
      return "running";
    case junction_state::downstream_closing:
      return "downstream_closing";
    case junction_state::source_closing:
      return "source_closing";
    case junction_state::done:
      return "done";
    }
    return "unknown";
  }

  constexpr auto to_string(merge_outcome __outcome) noexcept -> std::string_view {
    switch (__outcome) {
    case merge_outcome::none:
      return "none";
    case merge_outcome::completed:
      return "completed";
    case merge_outcome::failed:
      return "failed";
    case merge_outcome::killed:
      return "killed";
    }
    return "unknown";
  }

  //! A consistent snapshot of a merge's bookkeeping.
  struct merge_stats {
    junction_state state = junction_state::running;
    merge_outcome outcome = merge_outcome::none;
    std::size_t admitted = 0;      // sources started so far
    std::size_t finished = 0;      // sources whose cleanup completed
    std::size_t open = 0;          // admitted and not yet cleaned up
    std::size_t live = 0;          // may still produce a value
    std::size_t pending = 0;       // waiting for a free slot
    std::size_t buffered = 0;      // values read ahead of the consumer
    std::size_t peak_open = 0;
    std::size_t peak_buffered = 0;
  };
} // namespace junction
