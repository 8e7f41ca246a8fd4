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

// This file is based on code available under the Apache license here:
//   https://github.com/apache/incubator-doris/blob/master/be/test/common/status_test.cpp

// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include "common/status.h"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <limits>

#include "common/statusor.h"
#include "testutil/assert.h"
#include "util/logging.h"

namespace vshred {

class StatusTest : public testing::Test {};

TEST_F(StatusTest, OK) {
    // default
    Status st;
    ASSERT_TRUE(st.ok());
    ASSERT_EQ("", st.message());
    ASSERT_EQ("OK", st.to_string());
    // copy
    {
        const Status& other = st;
        ASSERT_TRUE(other.ok());
    }
    // move assign
    st = Status();
    ASSERT_TRUE(st.ok());
    // move construct
    {
        Status other = std::move(st);
        ASSERT_TRUE(other.ok());
    }
}

TEST_F(StatusTest, Error) {
    // default
    Status st = Status::InternalError("123");
    ASSERT_FALSE(st.ok());
    ASSERT_EQ("123", st.message());
    ASSERT_EQ("123", st.detailed_message());
    ASSERT_EQ("Internal error: 123", st.to_string());
    // copy
    {
        Status other = st;
        ASSERT_FALSE(other.ok());
        ASSERT_EQ("123", other.message());
        ASSERT_EQ("123", other.detailed_message());
    }
    // move assign
    st = Status::InternalError("456");
    ASSERT_FALSE(st.ok());
    ASSERT_EQ("456", st.message());
    // move construct
    {
        Status other = std::move(st);
        ASSERT_FALSE(other.ok());
        ASSERT_EQ("456", other.message());
        ASSERT_EQ("456", other.detailed_message());
        ASSERT_EQ("Internal error: 456", other.to_string());
        ASSERT_FALSE(st.ok());
        ASSERT_EQ(StatusCode::INTERNAL_ERROR, st.code());
    }
}

TEST_F(StatusTest, ErrorWithContext) {
    Status st = Status::InternalError("123");
    ASSERT_EQ("Internal error: 123", st.to_string(true));
    ASSERT_EQ("Internal error: 123", st.to_string(false));

    Status st1 = st.clone_and_append_context("a.cpp", 10, "expr1");
    ASSERT_EQ("123", st1.message());
    ASSERT_EQ("123\na.cpp:10 expr1", st1.detailed_message());
    ASSERT_EQ("Internal error: 123\na.cpp:10 expr1", st1.to_string());
    ASSERT_EQ("Internal error: 123", st1.to_string(false));

    Status st2 = st1.clone_and_append_context("b.cpp", 11, "expr2");
    ASSERT_EQ("123", st2.message());
    ASSERT_EQ("123\na.cpp:10 expr1\nb.cpp:11 expr2", st2.detailed_message());
    ASSERT_EQ("Internal error: 123\na.cpp:10 expr1\nb.cpp:11 expr2", st2.to_string());
    ASSERT_EQ("Internal error: 123", st2.to_string(false));
}

TEST_F(StatusTest, LongContext) {
    std::string message(std::numeric_limits<uint16_t>::max(), 'x');
    std::string context(std::numeric_limits<uint16_t>::max() - 10, 'y');
    Status st = Status::InternalError(message);
    ASSERT_EQ(message, st.message());
    ASSERT_EQ(fmt::format("Internal error: {}", message), st.to_string());

    Status st1 = st.clone_and_append_context("a.cpp", 10, context.data());
    ASSERT_EQ(message, st1.message());
    ASSERT_EQ(fmt::format("{}\na.cpp:10 {}", message, context), st1.detailed_message());
}

TEST_F(StatusTest, update) {
    Status st;
    st.update(Status::NotFound(""));
    ASSERT_TRUE(st.is_not_found());

    st.update(Status::InternalError(""));
    ASSERT_TRUE(st.is_not_found());

    Status st1 = Status::InvalidArgument("");
    st.update(st1);
    ASSERT_TRUE(st.is_not_found());

    st.update(std::move(st1));
    ASSERT_TRUE(st.is_not_found());
}

TEST_F(StatusTest, shredding_codes) {
    Status st = Status::InvalidSchema("duplicate object field 'x'");
    ASSERT_TRUE(st.is_invalid_schema());
    ASSERT_FALSE(st.is_variant_error());
    ASSERT_EQ("Invalid schema: duplicate object field 'x'", st.to_string());

    st = Status::VariantError("bad key");
    ASSERT_TRUE(st.is_variant_error());
    ASSERT_EQ("Variant error: bad key", st.to_string());

    st = Status::Uninitialized("not computed");
    ASSERT_TRUE(st.is_uninitialized());
    ASSERT_EQ("Uninitialized: not computed", st.to_string());
}

TEST_F(StatusTest, clone_and_prepend_append) {
    Status st = Status::NotFound("key");
    ASSERT_EQ("Not found: lookup: key", st.clone_and_prepend("lookup").to_string());
    ASSERT_EQ("Not found: key: in dictionary", st.clone_and_append("in dictionary").to_string());
    ASSERT_TRUE(Status::OK().clone_and_prepend("lookup").ok());
}

static Status return_if_error_helper(const Status& st, int* reached) {
    RETURN_IF_ERROR(st);
    ++*reached;
    return Status::OK();
}

TEST_F(StatusTest, return_if_error) {
    int reached = 0;
    ASSERT_OK(return_if_error_helper(Status::OK(), &reached));
    ASSERT_EQ(1, reached);

    Status st = return_if_error_helper(Status::NotFound("broken"), &reached);
    ASSERT_TRUE(st.is_not_found());
    ASSERT_EQ(1, reached);
    ASSERT_EQ("broken", st.message());
    // the failing expression is appended as context
    ASSERT_NE(std::string_view::npos, st.detailed_message().find("status_test.cpp"));
}

static StatusOr<int> parse_positive(int v) {
    if (v <= 0) {
        return Status::InvalidArgument(fmt::format("{} is not positive", v));
    }
    return v;
}

static StatusOr<int> twice_positive(int v) {
    ASSIGN_OR_RETURN(auto x, parse_positive(v));
    return 2 * x;
}

TEST_F(StatusTest, status_or) {
    auto res = twice_positive(21);
    ASSERT_OK(res);
    ASSERT_EQ(42, res.value());
    ASSERT_EQ(42, *res);

    res = twice_positive(-1);
    ASSERT_TRUE(res.status().is_invalid_argument());
    ASSERT_EQ("-1 is not positive", res.status().message());
    ASSERT_EQ(7, res.value_or(7));
    ASSERT_THROW(res.value(), BadStatusOrAccess);

    // an OK status is not a valid error
    StatusOr<int> from_ok(Status::OK());
    ASSERT_FALSE(from_ok.ok());
    ASSERT_EQ(StatusCode::INTERNAL_ERROR, from_ok.status().code());
}

} // namespace vshred
