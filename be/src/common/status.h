// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "common/compiler_util.h"
#include "common/logging.h"

namespace vshred {

template <typename T>
class StatusOr;

enum class StatusCode : int8_t {
    OK = 0,
    NOT_IMPLEMENTED_ERROR = 1,
    INTERNAL_ERROR = 2,
    NOT_FOUND = 3,
    INVALID_ARGUMENT = 4,
    UNINITIALIZED = 5,
    INVALID_SCHEMA = 6,
    VARIANT_ERROR = 7,
};

class [[nodiscard]] Status {
public:
    Status() = default;

    ~Status() noexcept {
        if (!is_moved_from(_state)) {
            delete[] _state;
        }
    }

    // Copy c'tor makes copy of error detail so Status can be returned by value
    Status(const Status& s) : _state(s._state == nullptr ? nullptr : copy_state(s._state)) {}

    // Move c'tor
    Status(Status&& s) noexcept : _state(s._state) { s._state = moved_from_state(); }

    // Same as copy c'tor
    Status& operator=(const Status& s) {
        if (this != &s) {
            Status tmp(s);
            std::swap(this->_state, tmp._state);
        }
        return *this;
    }

    // Move assign.
    Status& operator=(Status&& s) noexcept {
        if (this != &s) {
            Status tmp(std::move(s));
            std::swap(this->_state, tmp._state);
        }
        return *this;
    }

    // Inspired by absl::Status::Update()
    //
    // Updates the existing status with `new_status` provided that `this->ok()`.
    // If the existing status already contains a non-OK error, this update has no
    // effect and preserves the current data.
    void update(const Status& new_status);
    void update(Status&& new_status);

    static Status OK() { return Status(); }

    static Status NotSupported(std::string_view msg) { return Status(StatusCode::NOT_IMPLEMENTED_ERROR, msg); }
    static Status InternalError(std::string_view msg) { return Status(StatusCode::INTERNAL_ERROR, msg); }
    static Status NotFound(std::string_view msg) { return Status(StatusCode::NOT_FOUND, msg); }
    static Status InvalidArgument(std::string_view msg) { return Status(StatusCode::INVALID_ARGUMENT, msg); }
    static Status Uninitialized(std::string_view msg) { return Status(StatusCode::UNINITIALIZED, msg); }

    // A shredding schema violates one of its structural rules.
    static Status InvalidSchema(std::string_view msg) { return Status(StatusCode::INVALID_SCHEMA, msg); }

    // Variant binary data (metadata or value) could not be produced or decoded.
    static Status VariantError(std::string_view msg) { return Status(StatusCode::VARIANT_ERROR, msg); }

    bool ok() const { return _state == nullptr; }

    bool is_not_found() const { return code() == StatusCode::NOT_FOUND; }

    bool is_not_supported() const { return code() == StatusCode::NOT_IMPLEMENTED_ERROR; }

    /// @return @c true if the status indicates Uninitialized.
    bool is_uninitialized() const { return code() == StatusCode::UNINITIALIZED; }

    /// @return @c true if the status indicates an InvalidArgument error.
    bool is_invalid_argument() const { return code() == StatusCode::INVALID_ARGUMENT; }

    bool is_invalid_schema() const { return code() == StatusCode::INVALID_SCHEMA; }

    bool is_variant_error() const { return code() == StatusCode::VARIANT_ERROR; }

    /// @return A string representation of this status suitable for printing.
    ///   Returns the string "OK" for success.
    std::string to_string(bool with_context_info = true) const;

    /// @return A string representation of the status code, without the message
    ///   text or sub code information.
    std::string code_as_string() const;

    // This is similar to to_string, except that it does not include
    // the context info.
    //
    // @note The returned std::string_view is only valid as long as this Status object
    //   remains live and unchanged.
    //
    // @return The message portion of the Status. For @c OK statuses,
    //   this returns an empty string.
    std::string_view message() const;

    // Error message with extra context info, like file name, line number.
    std::string_view detailed_message() const;

    StatusCode code() const { return _state == nullptr ? StatusCode::OK : static_cast<StatusCode>(_state[4]); }

    /// Clone this status and add the specified prefix to the message.
    ///
    /// If this status is OK, then an OK status will be returned.
    Status clone_and_prepend(std::string_view msg) const;

    /// Clone this status and add the specified suffix to the message.
    ///
    /// If this status is OK, then an OK status will be returned.
    Status clone_and_append(std::string_view msg) const;

    Status clone_and_append_context(const char* filename, int line, const char* expr) const;

private:
    static const char* copy_state(const char* state);
    static const char* copy_state_with_extra_ctx(const char* state, std::string_view ctx);

    // Indicates whether this Status was the rhs of a move operation.
    static bool is_moved_from(const char* state);
    static const char* moved_from_state();

    Status(StatusCode code, std::string_view msg) : Status(code, msg, {}) {}
    Status(StatusCode code, std::string_view msg, std::string_view ctx);

private:
    // OK status has a nullptr _state.  Otherwise, _state is a new[] array
    // of the following form:
    //    _state[0..1]                        == len1: length of message
    //    _state[2..3]                        == len2: length of context
    //    _state[4]                           == code
    //    _state[5.. 5 + len1]                == message
    //    _state[5 + len1 .. 5 + len1 + len2] == context
    const char* _state = nullptr;
};

inline void Status::update(const Status& new_status) {
    if (ok()) {
        *this = new_status;
    }
}

inline void Status::update(Status&& new_status) {
    if (ok()) {
        *this = std::move(new_status);
    }
}

inline std::ostream& operator<<(std::ostream& os, const Status& st) {
    return os << st.to_string();
}

inline const Status& to_status(const Status& st) {
    return st;
}

template <typename T>
inline const Status& to_status(const StatusOr<T>& st) {
    return st.status();
}

#ifndef AS_STRING
#define AS_STRING(x) AS_STRING_INTERNAL(x)
#define AS_STRING_INTERNAL(x) #x
#endif

#define RETURN_IF_ERROR(stmt)                                                                         \
    do {                                                                                              \
        auto&& status__ = (stmt);                                                                     \
        if (UNLIKELY(!status__.ok())) {                                                               \
            return to_status(status__).clone_and_append_context(__FILE__, __LINE__, AS_STRING(stmt)); \
        }                                                                                             \
    } while (false)

} // namespace vshred
