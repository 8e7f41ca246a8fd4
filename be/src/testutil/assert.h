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

#include <gtest/gtest.h>

#include "common/compiler_util.h"
#include "common/logging.h"
#include "common/status.h"

// All macros accept either a Status or a StatusOr<T>.

#define ASSERT_OK(stmt)                                      \
    do {                                                     \
        auto&& st__ = (stmt);                                \
        ASSERT_TRUE(st__.ok()) << ::vshred::to_status(st__); \
    } while (0)

#define EXPECT_OK(stmt)                                      \
    do {                                                     \
        auto&& st__ = (stmt);                                \
        EXPECT_TRUE(st__.ok()) << ::vshred::to_status(st__); \
    } while (0)

#define EXPECT_ERROR(stmt)                              \
    do {                                                \
        auto&& st__ = (stmt);                           \
        EXPECT_FALSE(st__.ok()) << "expected an error"; \
    } while (0)

// Compares status codes only, messages are free text.
#define EXPECT_STATUS(expect, stmt)                                                           \
    do {                                                                                      \
        const ::vshred::Status exp__ = (expect);                                              \
        const ::vshred::Status real__ = ::vshred::to_status(stmt);                            \
        EXPECT_EQ(exp__.code(), real__.code()) << "expected " << exp__ << ", got " << real__; \
    } while (0)

// Unwraps a StatusOr into `lhs`, aborting the test binary on error.
#define ASSIGN_OR_ABORT_IMPL(varname, lhs, rhs) \
    auto&& varname = (rhs);                     \
    CHECK(varname.ok()) << varname.status();    \
    lhs = std::move(varname).value();

#define ASSIGN_OR_ABORT(lhs, rhs) ASSIGN_OR_ABORT_IMPL(VARNAME_LINENUM(value_or_err), lhs, rhs)
