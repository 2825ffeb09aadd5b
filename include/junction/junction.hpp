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

// IWYU pragma: begin_exports
#include "channel.hpp"
#include "default_scheduler.hpp"
#include "empty_source.hpp"
#include "iterate.hpp"
#include "log.hpp"
#include "merge.hpp"
#include "merge_options.hpp"
#include "source.hpp"
// IWYU pragma: end_exports
