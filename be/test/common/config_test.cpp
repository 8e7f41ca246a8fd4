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

#define __IN_CONFIGBASE_CPP__
#include "common/configbase.h"
#undef __IN_CONFIGBASE_CPP__

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <streambuf>

#include "common/status.h"
#include "testutil/assert.h"

namespace vshred {
using namespace config;

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace {

// Captures everything written to std::cerr while alive.
class CerrCapture {
public:
    CerrCapture() : _saved(std::cerr.rdbuf(_captured.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(_saved); }

    std::string text() const { return _captured.str(); }

private:
    std::stringstream _captured;
    std::streambuf* _saved;
};

bool init_from(const std::string& text) {
    std::stringstream ss(text);
    return config::init(ss);
}

} // namespace

class ConfigTest : public testing::Test {
    void SetUp() override { config::TEST_clear_configs(); }
};

TEST_F(ConfigTest, defaults_and_overrides) {
    CONF_Bool(cfg_bool, "false");
    CONF_mDouble(cfg_ratio, "0.5");
    CONF_Int16(cfg_int16, "2561");
    CONF_mInt32(cfg_depth, "50");
    CONF_Int64(cfg_int64, "-4294967296123");
    CONF_String(cfg_dir, "/tmp/vshred");
    CONF_Strings(cfg_modules, "variant_schema");

    ASSERT_TRUE(init_from(R"DEL(
        # shredding limits
        cfg_depth = 8

        cfg_ratio=0.75
        cfg_bool = TRUE
        cfg_modules = variant_schema, variant_metadata ,configbase
        # cfg_int16 = 12
        cfg_dir = /data/vshred dir
        )DEL"));

    EXPECT_TRUE(cfg_bool);
    EXPECT_EQ(0.75, cfg_ratio);
    EXPECT_EQ(2561, cfg_int16);
    EXPECT_EQ(8, cfg_depth);
    EXPECT_EQ(-4294967296123, cfg_int64);
    EXPECT_EQ("/data/vshred dir", cfg_dir);
    EXPECT_THAT(cfg_modules, ElementsAre("variant_schema", "variant_metadata", "configbase"));

    // every init starts over from the defaults
    ASSERT_TRUE(config::init(nullptr));
    EXPECT_FALSE(cfg_bool);
    EXPECT_EQ(50, cfg_depth);
    EXPECT_THAT(cfg_modules, ElementsAre("variant_schema"));
}

TEST_F(ConfigTest, rejects_bad_values) {
    CONF_Bool(cfg_bool, "false");
    CONF_Int16(cfg_int16, "1");
    CONF_Int32(cfg_int32, "1");
    CONF_Double(cfg_double, "1.0");

    EXPECT_FALSE(config::init("/path/to/nonexist/file"));
    EXPECT_FALSE(init_from("cfg_bool = yes\n"));
    EXPECT_FALSE(init_from("cfg_int32 = 0xAB\n"));
    EXPECT_FALSE(init_from("cfg_int32 = 12abc\n"));
    EXPECT_FALSE(init_from("cfg_int32 = 4294967296\n"));
    EXPECT_FALSE(init_from("cfg_int16 = 65536\n"));
    EXPECT_FALSE(init_from("cfg_double = 1.5.2\n"));
    EXPECT_FALSE(init_from("cfg_double =\n"));
}

TEST_F(ConfigTest, invalid_default_value) {
    CONF_Int32(cfg_a_int32, "fifty");
    CONF_Int32(cfg_b_int32, "7");
    CONF_String(cfg_c_dir, "/tmp/vshred");

    CerrCapture capture;
    ASSERT_FALSE(config::init(nullptr));
    EXPECT_THAT(capture.text(), HasSubstr("cfg_a_int32"));
    // fields after the broken one still get their defaults
    EXPECT_EQ(7, cfg_b_int32);
    EXPECT_EQ("/tmp/vshred", cfg_c_dir);
}

TEST_F(ConfigTest, env_substitution) {
    CONF_String(cfg_home, "${VshredConfigTestHome}/log");
    CONF_Bool(cfg_flag, "false");
    CONF_String(cfg_plain, "");

    ASSERT_EQ(0, ::unsetenv("VshredConfigTestHome"));
    EXPECT_FALSE(config::init(nullptr));

    ASSERT_EQ(0, ::setenv("VshredConfigTestHome", "/opt/vshred", 1));
    ASSERT_EQ(0, ::setenv("VshredConfigTestFlag", " true", 1));
    ASSERT_TRUE(init_from("cfg_flag = ${VshredConfigTestFlag}\n"
                          "cfg_plain = a${VshredConfigTestHome}b${VshredConfigTestHome}\n"));
    EXPECT_EQ("/opt/vshred/log", cfg_home);
    EXPECT_TRUE(cfg_flag);
    EXPECT_EQ("a/opt/vshredb/opt/vshred", cfg_plain);

    EXPECT_FALSE(init_from("cfg_plain = ${VshredConfigTestHome\n"));
}

TEST_F(ConfigTest, unknown_keys) {
    CONF_Int32(cfg_int32, "10");
    {
        CerrCapture capture;
        ASSERT_TRUE(init_from("VSHRED_OPTS = -v\n"));
        EXPECT_THAT(capture.text(), IsEmpty());
    }
    {
        CerrCapture capture;
        ASSERT_TRUE(init_from("cfg_unknown = 3\n"));
        EXPECT_THAT(capture.text(), HasSubstr("cfg_unknown"));
    }
    EXPECT_EQ(10, cfg_int32);
}

TEST_F(ConfigTest, empty_and_missing_values) {
    CONF_String(cfg_string, "10");
    CONF_Strings(cfg_strings, "a,b");

    ASSERT_TRUE(init_from("cfg_string=\n"));
    EXPECT_EQ("", cfg_string);

    ASSERT_TRUE(init_from("cfg_string\ncfg_strings = ,, ,\n"));
    EXPECT_EQ("", cfg_string);
    EXPECT_THAT(cfg_strings, IsEmpty());

    ASSERT_TRUE(init_from("cfg_strings=,s1,,s2, s3,s4 \n"));
    EXPECT_THAT(cfg_strings, ElementsAre("s1", "s2", "s3", "s4"));
}

TEST_F(ConfigTest, last_assignment_wins) {
    CONF_Int32(cfg_int32, "10");
    CerrCapture capture;
    ASSERT_TRUE(init_from("cfg_int32 = 1\ncfg_int32 = 2\n"));
    EXPECT_EQ(2, cfg_int32);
    EXPECT_THAT(capture.text(), HasSubstr("Duplicate assignment to config 'cfg_int32'"));
}

TEST_F(ConfigTest, list_configs) {
    CONF_Bool(cfg_bool, "false");
    CONF_mInt32(cfg_width, "300");
    CONF_Int64(cfg_int64, "4294967296123");
    CONF_String(cfg_string, "vshred");
    CONF_Strings(cfg_strings, "s1,s2");

    ASSERT_TRUE(init_from("cfg_width = 12\n"));

    std::vector<ConfigInfo> expected = {
            // name,value,type,default,mutable
            {"cfg_bool", "false", "bool", "false", false},
            {"cfg_int64", "4294967296123", "int64_t", "4294967296123", false},
            {"cfg_string", "vshred", "std::string", "vshred", false},
            {"cfg_strings", "s1,s2", "std::vector<std::string>", "s1,s2", false},
            {"cfg_width", "12", "int32_t", "300", true},
    };
    std::vector<ConfigInfo> configs = config::list_configs();
    std::sort(configs.begin(), configs.end());
    ASSERT_EQ(expected.size(), configs.size());
    for (size_t i = 0; i < configs.size(); ++i) {
        EXPECT_EQ(expected[i], configs[i]) << configs[i];
    }
}

TEST_F(ConfigTest, set_and_rollback) {
    CONF_Bool(cfg_immutable, "true");
    CONF_mBool(cfg_bool, "false");
    CONF_mDouble(cfg_double, "123.456");
    CONF_mInt16(cfg_int16, "2561");
    CONF_mInt32(cfg_depth, "50");
    CONF_mInt64(cfg_int64, "4294967296123");

    ASSERT_TRUE(config::init(nullptr));

    ASSERT_OK(config::set_config("cfg_bool", "true"));
    EXPECT_TRUE(cfg_bool);
    ASSERT_OK(config::rollback_config("cfg_bool"));
    EXPECT_FALSE(cfg_bool);

    ASSERT_OK(config::set_config("cfg_double", " 654.321 "));
    EXPECT_EQ(654.321, cfg_double);
    ASSERT_OK(config::rollback_config("cfg_double"));
    EXPECT_EQ(123.456, cfg_double);

    ASSERT_OK(config::set_config("cfg_int16", "-2"));
    EXPECT_EQ(-2, cfg_int16);

    ASSERT_OK(config::set_config("cfg_depth", "10"));
    ASSERT_OK(config::set_config("cfg_depth", "20"));
    EXPECT_EQ(20, cfg_depth);
    // only the previous value is remembered
    ASSERT_OK(config::rollback_config("cfg_depth"));
    EXPECT_EQ(10, cfg_depth);
    EXPECT_ERROR(config::rollback_config("cfg_depth"));
    EXPECT_EQ(10, cfg_depth);

    ASSERT_OK(config::set_config("cfg_int64", "-1"));
    EXPECT_EQ(-1, cfg_int64);

    Status st = config::set_config("cfg_not_exist", "1");
    EXPECT_TRUE(st.is_not_found()) << st;
    st = config::rollback_config("cfg_not_exist");
    EXPECT_TRUE(st.is_not_found()) << st;

    st = config::set_config("cfg_immutable", "false");
    EXPECT_TRUE(st.is_not_supported()) << st;
    EXPECT_TRUE(cfg_immutable);

    // a failed conversion keeps the old value
    st = config::set_config("cfg_bool", "falseeee");
    EXPECT_TRUE(st.is_invalid_argument()) << st;
    EXPECT_FALSE(cfg_bool);
    st = config::set_config("cfg_depth", "4294967296124");
    EXPECT_TRUE(st.is_invalid_argument()) << st;
    EXPECT_EQ(10, cfg_depth);
    st = config::set_config("cfg_double", "");
    EXPECT_TRUE(st.is_invalid_argument()) << st;
    EXPECT_EQ(123.456, cfg_double);
}

} // namespace vshred
