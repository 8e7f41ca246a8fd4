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

#pragma once

#include <boost/algorithm/string/trim.hpp>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace vshred {
class Status;

namespace config {

struct ConfigInfo {
    std::string name;
    std::string value;
    std::string type;
    std::string defval;
    bool valmutable;

    bool operator<(const ConfigInfo& rhs) const { return name < rhs.name; }

    bool operator==(const ConfigInfo& rhs) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const ConfigInfo& info) {
    os << "ConfigInfo{"
       << "name=\"" << info.name << "\","
       << "value=\"" << info.value << "\","
       << "type=" << info.type << ","
       << "default=\"" << info.defval << "\","
       << "mutable=" << info.valmutable << "}";
    return os;
}

bool strtox(const std::string& valstr, bool& retval);
bool strtox(const std::string& valstr, int16_t& retval);
bool strtox(const std::string& valstr, int32_t& retval);
bool strtox(const std::string& valstr, int64_t& retval);
bool strtox(const std::string& valstr, double& retval);
bool strtox(const std::string& valstr, std::string& retval);

// Parses a comma separated list, each element by the scalar strtox above. Blank elements are skipped.
template <typename T>
bool strtox(const std::string& valstr, std::vector<T>& retval);

// A registered configuration item. Every CONF_xxx macro expanded inside
// configbase.cpp defines one global variable and one Field describing it.
class Field {
public:
    Field(const char* type, const char* name, void* storage, const char* defval, bool valmutable)
            : _type(type), _name(name), _storage(storage), _defval(defval), _valmutable(valmutable) {
        fields().emplace(name, this);
    }

    virtual ~Field() = default;

    static std::map<std::string, Field*>& fields() {
        static std::map<std::string, Field*> s_fields;
        return s_fields;
    }

    static std::optional<Field*> get(const std::string& name_or_alias);

    static void clear_fields() { fields().clear(); }

    const char* type() const { return _type; }
    const char* name() const { return _name; }
    const char* defval() const { return _defval; }
    bool valmutable() const { return _valmutable; }

    // The last successfully parsed text of this field.
    const std::string& value() const { return _current_set_val; }

    bool set_value(std::string value);

    bool rollback();

protected:
    virtual bool parse_value(const std::string& valstr) = 0;

    const char* _type;
    const char* _name;
    void* _storage;
    const char* _defval;
    bool _valmutable;
    std::string _current_set_val;
    std::string _last_set_val;
};

template <typename T>
class TypedField final : public Field {
public:
    TypedField(const char* type, const char* name, T* storage, const char* defval, bool valmutable)
            : Field(type, name, storage, defval, valmutable) {}

protected:
    bool parse_value(const std::string& valstr) override {
        T tmp{};
        if (!strtox(valstr, tmp)) {
            return false;
        }
        *static_cast<T*>(_storage) = std::move(tmp);
        return true;
    }
};

template <typename T>
bool strtox(const std::string& valstr, std::vector<T>& retval) {
    std::vector<T> parsed;
    std::stringstream ss(valstr);
    std::string item;
    while (std::getline(ss, item, ',')) {
        boost::algorithm::trim(item);
        if (item.empty()) {
            continue;
        }
        T value{};
        if (!strtox(item, value)) {
            return false;
        }
        parsed.emplace_back(std::move(value));
    }
    retval = std::move(parsed);
    return true;
}

#ifdef __IN_CONFIGBASE_CPP__

#define DEFINE_FIELD(FIELD_TYPE, FIELD_NAME, FIELD_DEFAULT, VALMUTABLE)                                    \
    FIELD_TYPE FIELD_NAME;                                                                                 \
    static TypedField<FIELD_TYPE> field_##FIELD_NAME(#FIELD_TYPE, #FIELD_NAME, &FIELD_NAME, FIELD_DEFAULT, \
                                                     VALMUTABLE);

#define CONF_Bool(name, defaultstr) DEFINE_FIELD(bool, name, defaultstr, false)
#define CONF_Int16(name, defaultstr) DEFINE_FIELD(int16_t, name, defaultstr, false)
#define CONF_Int32(name, defaultstr) DEFINE_FIELD(int32_t, name, defaultstr, false)
#define CONF_Int64(name, defaultstr) DEFINE_FIELD(int64_t, name, defaultstr, false)
#define CONF_Double(name, defaultstr) DEFINE_FIELD(double, name, defaultstr, false)
#define CONF_String(name, defaultstr) DEFINE_FIELD(std::string, name, defaultstr, false)
#define CONF_Strings(name, defaultstr) DEFINE_FIELD(std::vector<std::string>, name, defaultstr, false)
#define CONF_mBool(name, defaultstr) DEFINE_FIELD(bool, name, defaultstr, true)
#define CONF_mInt16(name, defaultstr) DEFINE_FIELD(int16_t, name, defaultstr, true)
#define CONF_mInt32(name, defaultstr) DEFINE_FIELD(int32_t, name, defaultstr, true)
#define CONF_mInt64(name, defaultstr) DEFINE_FIELD(int64_t, name, defaultstr, true)
#define CONF_mDouble(name, defaultstr) DEFINE_FIELD(double, name, defaultstr, true)

#else

#define DECLARE_FIELD(FIELD_TYPE, FIELD_NAME) extern FIELD_TYPE FIELD_NAME;

#define CONF_Bool(name, defaultstr) DECLARE_FIELD(bool, name)
#define CONF_Int16(name, defaultstr) DECLARE_FIELD(int16_t, name)
#define CONF_Int32(name, defaultstr) DECLARE_FIELD(int32_t, name)
#define CONF_Int64(name, defaultstr) DECLARE_FIELD(int64_t, name)
#define CONF_Double(name, defaultstr) DECLARE_FIELD(double, name)
#define CONF_String(name, defaultstr) DECLARE_FIELD(std::string, name)
#define CONF_Strings(name, defaultstr) DECLARE_FIELD(std::vector<std::string>, name)
#define CONF_mBool(name, defaultstr) DECLARE_FIELD(bool, name)
#define CONF_mInt16(name, defaultstr) DECLARE_FIELD(int16_t, name)
#define CONF_mInt32(name, defaultstr) DECLARE_FIELD(int32_t, name)
#define CONF_mInt64(name, defaultstr) DECLARE_FIELD(int64_t, name)
#define CONF_mDouble(name, defaultstr) DECLARE_FIELD(double, name)

#endif // __IN_CONFIGBASE_CPP__

// Initialize configurations from a config file.
bool init(const char* filename);

// Initialize configurations from a input stream.
bool init(std::istream& input);

Status set_config(const std::string& field, const std::string& value);

Status rollback_config(const std::string& field);

std::vector<ConfigInfo> list_configs();

void TEST_clear_configs();

} // namespace config
} // namespace vshred
