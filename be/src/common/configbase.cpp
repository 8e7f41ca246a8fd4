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

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <string_view>

#define __IN_CONFIGBASE_CPP__
#include "common/config.h"
#undef __IN_CONFIGBASE_CPP__

#include <fmt/format.h>

#include "common/logging.h"
#include "common/status.h"
#include "common/statusor.h"

namespace vshred::config {

namespace {

// Expands every ${NAME} in `text` with the value of the environment variable NAME.
StatusOr<std::string> expand_env(std::string_view text) {
    std::string expanded;
    expanded.reserve(text.size());
    size_t cursor = 0;
    while (cursor < text.size()) {
        size_t open = text.find("${", cursor);
        if (open == std::string_view::npos) {
            expanded.append(text.substr(cursor));
            break;
        }
        size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            return Status::InvalidArgument(fmt::format("Unterminated environment variable in '{}'", text));
        }
        expanded.append(text.substr(cursor, open - cursor));
        std::string name(text.substr(open + 2, close - open - 2));
        const char* env = std::getenv(name.c_str());
        if (env == nullptr) {
            return Status::InvalidArgument(fmt::format("Non-existent environment variable: {}", name));
        }
        expanded.append(env);
        cursor = close + 1;
    }
    return expanded;
}

template <typename T>
bool parse_integer(const std::string& valstr, T& retval) {
    // empty-string is only allowed for string type.
    if (valstr.empty()) {
        return false;
    }
    const char* last = valstr.data() + valstr.size();
    T parsed{};
    auto [ptr, ec] = std::from_chars(valstr.data(), last, parsed);
    if (ec != std::errc() || ptr != last) {
        return false;
    }
    retval = parsed;
    return true;
}

struct ConfigLine {
    std::string key;
    std::string value;
};

// Splits "key = value". Blank lines and '#' comments yield nothing, a line without '='
// assigns the empty string.
std::optional<ConfigLine> split_line(std::string line) {
    boost::algorithm::trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }
    ConfigLine kv;
    size_t eq = line.find('=');
    kv.key = boost::algorithm::trim_copy(line.substr(0, eq));
    if (eq != std::string::npos) {
        kv.value = line.substr(eq + 1);
    }
    return kv;
}

// Upper case names such as JAVA_OPTS belong to the start scripts sharing the conf file.
bool is_env_var_name(const std::string& key) {
    return std::all_of(key.begin(), key.end(),
                       [](unsigned char c) { return std::isupper(c) || std::isdigit(c) || c == '_'; });
}

bool load_lines(std::istream& input) {
    std::set<std::string> assigned;
    std::string line;
    while (std::getline(input, line)) {
        auto kv = split_line(std::move(line));
        if (!kv.has_value()) {
            continue;
        }
        auto field = Field::get(kv->key);
        if (!field.has_value()) {
            if (!is_env_var_name(kv->key)) {
                std::cerr << fmt::format("Ignored unknown config: {}\n", kv->key);
            }
            continue;
        }
        if (!assigned.insert(kv->key).second) {
            std::cerr << fmt::format("Duplicate assignment to config '{}', previous assignment will be ignored\n",
                                     kv->key);
        }
        if (!(*field)->set_value(kv->value)) {
            std::cerr << fmt::format("Invalid value of config '{}': '{}'\n", kv->key, kv->value);
            return false;
        }
    }
    return true;
}

// Every field gets its default even if an earlier one fails to parse.
bool load_defaults() {
    bool ok = true;
    for (const auto& [name, field] : Field::fields()) {
        if (!field->set_value(field->defval())) {
            std::cerr << fmt::format("Invalid default value of config '{}': '{}'\n", name, field->defval());
            ok = false;
        }
    }
    return ok;
}

StatusOr<Field*> find_field(const std::string& name) {
    auto field = Field::get(name);
    if (!field.has_value()) {
        return Status::NotFound(fmt::format("'{}' is not found", name));
    }
    return *field;
}

} // namespace

bool strtox(const std::string& valstr, bool& retval) {
    if (boost::algorithm::iequals(valstr, "true") || valstr == "1") {
        retval = true;
    } else if (boost::algorithm::iequals(valstr, "false") || valstr == "0") {
        retval = false;
    } else {
        return false;
    }
    return true;
}

bool strtox(const std::string& valstr, int16_t& retval) {
    return parse_integer(valstr, retval);
}

bool strtox(const std::string& valstr, int32_t& retval) {
    return parse_integer(valstr, retval);
}

bool strtox(const std::string& valstr, int64_t& retval) {
    return parse_integer(valstr, retval);
}

bool strtox(const std::string& valstr, double& retval) {
    if (valstr.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double parsed = strtod(valstr.c_str(), &end);
    if (errno != 0 || end != valstr.c_str() + valstr.size()) {
        return false;
    }
    retval = parsed;
    return true;
}

bool strtox(const std::string& valstr, std::string& retval) {
    retval = valstr;
    return true;
}

std::optional<Field*> Field::get(const std::string& name_or_alias) {
    auto it = fields().find(name_or_alias);
    if (it == fields().end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Field::set_value(std::string value) {
    auto expanded = expand_env(value);
    if (!expanded.ok()) {
        VLOG_CONFIG << "config " << _name << ": " << expanded.status();
        return false;
    }
    std::string text = boost::algorithm::trim_copy(expanded.value());
    if (!parse_value(text)) {
        return false;
    }
    _last_set_val = std::exchange(_current_set_val, std::move(text));
    VLOG_CONFIG << "config " << _name << " = " << _current_set_val;
    return true;
}

bool Field::rollback() {
    if (!parse_value(_last_set_val)) {
        return false;
    }
    _current_set_val = std::exchange(_last_set_val, std::string());
    return true;
}

bool init(const char* filename) {
    std::ifstream input;
    if (filename != nullptr) {
        input.open(filename);
        if (!input.is_open()) {
            std::cerr << "Fail to open " << filename << std::endl;
            return false;
        }
    }
    return init(input);
}

bool init(std::istream& input) {
    return load_defaults() && load_lines(input);
}

Status set_config(const std::string& field, const std::string& value) {
    ASSIGN_OR_RETURN(Field * target, find_field(field));
    if (!target->valmutable()) {
        return Status::NotSupported(fmt::format("'{}' is immutable", field));
    }
    if (!target->set_value(value)) {
        return Status::InvalidArgument(fmt::format("Invalid value of config '{}': '{}'", field, value));
    }
    return Status::OK();
}

Status rollback_config(const std::string& field) {
    ASSIGN_OR_RETURN(Field * target, find_field(field));
    if (!target->rollback()) {
        return Status::InvalidArgument(fmt::format("Invalid value of config '{}' in rollback", field));
    }
    return Status::OK();
}

std::vector<ConfigInfo> list_configs() {
    std::vector<ConfigInfo> infos;
    infos.reserve(Field::fields().size());
    for (const auto& [name, field] : Field::fields()) {
        infos.push_back(ConfigInfo{name, field->value(), field->type(), field->defval(), field->valmutable()});
    }
    return infos;
}

void TEST_clear_configs() {
    Field::clear_fields();
}

} // namespace vshred::config
