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

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace junction {
  namespace __merge {
    ////////////////////////////////////////////////////////////////////////////
    // Owns the entries of all admitted sources. Ids are handed out in
    // increasing order, so the vector stays sorted by id and lookups are a
    // binary search. Entries are never unlinked on their own: the owner marks
    // them closed and __compact() drops every closed entry nobody pins.
    // Entry addresses are stable for as long as the entry is in the arena.
    template <class _Entry>
    class __source_arena {
     public:
      template <class... _Args>
      auto __emplace(_Args&&... __args) -> _Entry& {
        const std::size_t __id = __next_id_;
        __entries_.reserve(__entries_.size() + 1);
        auto& __entry =
          __entries_.emplace_back(std::make_unique<_Entry>(__id, static_cast<_Args&&>(__args)...));
        ++__next_id_;
        return *__entry;
      }

      [[nodiscard]]
      auto __find(std::size_t __id) const noexcept -> _Entry* {
        auto __it = std::lower_bound(
          __entries_.begin(),
          __entries_.end(),
          __id,
          [](const std::unique_ptr<_Entry>& __entry, std::size_t __key) noexcept {
            return __entry->__id_ < __key;
          });
        if (__it == __entries_.end() || (*__it)->__id_ != __id) {
          return nullptr;
        }
        return __it->get();
      }

      template <class _Pred>
      auto __compact(_Pred __is_dead) noexcept -> std::size_t {
        return std::erase_if(__entries_, [&](const std::unique_ptr<_Entry>& __entry) noexcept {
          return __is_dead(*__entry);
        });
      }

      template <class _Fn>
      void __for_each(_Fn __fn) {
        for (auto& __entry: __entries_) {
          __fn(*__entry);
        }
      }

      [[nodiscard]]
      auto __empty() const noexcept -> bool {
        return __entries_.empty();
      }

      [[nodiscard]]
      auto __size() const noexcept -> std::size_t {
        return __entries_.size();
      }

     private:
      std::vector<std::unique_ptr<_Entry>> __entries_{};
      std::size_t __next_id_ = 0;
    };
  } // namespace __merge
} // namespace junction
