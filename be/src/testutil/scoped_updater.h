// Copyright 2021-present StarRocks, Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <utility>

#include "common/compiler_util.h"

namespace vshred {

// Assigns `value` to a global (usually a config::xxx field) and restores the old value when the
// scope ends.
template <typename T>
class ScopedUpdater {
public:
    template <typename U>
    ScopedUpdater(T& target, U&& value) : _target(target), _saved(std::exchange(target, std::forward<U>(value))) {}
    ~ScopedUpdater() { _target = std::move(_saved); }

    ScopedUpdater(const ScopedUpdater&) = delete;
    ScopedUpdater& operator=(const ScopedUpdater&) = delete;

private:
    T& _target;
    T _saved;
};

#define SCOPED_UPDATE(type, param, value) ::vshred::ScopedUpdater<type> VARNAME_LINENUM(scoped_updater)(param, value)

} // namespace vshred
