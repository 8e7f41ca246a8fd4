// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "common/status.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <limits>

namespace vshred {

// See 'Status::_state' for details.
static const char g_moved_from_state[5] = {'\x00', '\x00', '\x00', '\x00',
                                           static_cast<char>(StatusCode::INTERNAL_ERROR)};

inline const char* assemble_state(StatusCode code, std::string_view msg, std::string_view ctx) {
    DCHECK(code != StatusCode::OK);

    const auto len1 = static_cast<uint16_t>(std::min<size_t>(msg.size(), std::numeric_limits<uint16_t>::max()));
    const auto len2 = static_cast<uint16_t>(std::min<size_t>(ctx.size(), std::numeric_limits<uint16_t>::max()));
    const uint32_t size = static_cast<uint32_t>(len1) + len2;
    auto result = new char[size + 5];
    memcpy(result, &len1, sizeof(len1));
    memcpy(result + 2, &len2, sizeof(len2));
    result[4] = static_cast<char>(code);
    memcpy(result + 5, msg.data(), len1);
    memcpy(result + 5 + len1, ctx.data(), len2);
    return result;
}

const char* Status::copy_state(const char* state) {
    uint16_t len1;
    uint16_t len2;
    memcpy(&len1, state, sizeof(len1));
    memcpy(&len2, state + sizeof(len1), sizeof(len2));
    uint32_t length = static_cast<uint32_t>(len1) + len2 + 5;
    auto result = new char[length];
    memcpy(result, state, length);
    return result;
}

const char* Status::copy_state_with_extra_ctx(const char* state, std::string_view ctx) {
    uint16_t len1;
    uint16_t len2;
    memcpy(&len1, state, sizeof(len1));
    memcpy(&len2, state + sizeof(len1), sizeof(len2));
    uint32_t old_length = static_cast<uint32_t>(len1) + len2 + 5;
    size_t ctx_size = std::min<size_t>(ctx.size(), std::numeric_limits<uint16_t>::max() - len2);
    auto new_length = static_cast<uint32_t>(old_length + ctx_size);
    auto result = new char[new_length];
    memcpy(result, state, old_length);
    memcpy(result + old_length, ctx.data(), ctx_size);
    auto new_len2 = static_cast<uint16_t>(len2 + ctx_size);
    memcpy(result + 2, &new_len2, sizeof(new_len2));
    return result;
}

Status::Status(StatusCode code, std::string_view msg, std::string_view ctx)
        : _state(assemble_state(code, msg, ctx)) {}

std::string Status::code_as_string() const {
    if (_state == nullptr) {
        return "OK";
    }
    switch (code()) {
    case StatusCode::OK:
        return "OK";
    case StatusCode::NOT_IMPLEMENTED_ERROR:
        return "Not supported";
    case StatusCode::INTERNAL_ERROR:
        return "Internal error";
    case StatusCode::NOT_FOUND:
        return "Not found";
    case StatusCode::INVALID_ARGUMENT:
        return "Invalid argument";
    case StatusCode::UNINITIALIZED:
        return "Uninitialized";
    case StatusCode::INVALID_SCHEMA:
        return "Invalid schema";
    case StatusCode::VARIANT_ERROR:
        return "Variant error";
    }
    char tmp[30];
    snprintf(tmp, sizeof(tmp), "Unknown code(%d): ", static_cast<int>(code()));
    return tmp;
}

std::string Status::to_string(bool with_context_info) const {
    std::string result(code_as_string());
    if (_state == nullptr) {
        return result;
    }

    result.append(": ");
    std::string_view msg = with_context_info ? detailed_message() : message();
    result.append(msg.data(), msg.size());
    return result;
}

std::string_view Status::message() const {
    if (_state == nullptr) {
        return {};
    }

    uint16_t len1;
    memcpy(&len1, _state, sizeof(len1));
    return {_state + 5, len1};
}

std::string_view Status::detailed_message() const {
    if (_state == nullptr) {
        return {};
    }

    uint16_t len1;
    uint16_t len2;
    memcpy(&len1, _state, sizeof(len1));
    memcpy(&len2, _state + 2, sizeof(len2));
    uint32_t length = static_cast<uint32_t>(len1) + len2;
    return {_state + 5, length};
}

Status Status::clone_and_prepend(std::string_view msg) const {
    if (ok()) {
        return *this;
    }
    return {code(), fmt::format("{}: {}", msg, message())};
}

Status Status::clone_and_append(std::string_view msg) const {
    if (ok()) {
        return *this;
    }
    return {code(), fmt::format("{}: {}", message(), msg)};
}

Status Status::clone_and_append_context(const char* filename, int line, const char* expr) const {
    if (UNLIKELY(ok())) {
        return *this;
    }
    Status ret;
    ret._state = copy_state_with_extra_ctx(_state, fmt::format("\n{}:{} {}", filename, line, expr));
    return ret;
}

const char* Status::moved_from_state() {
    return g_moved_from_state;
}

bool Status::is_moved_from(const char* state) {
    return state == moved_from_state();
}

} // namespace vshred
