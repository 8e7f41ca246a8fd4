// Copyright 2020 The Abseil Authors.
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

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include "common/status.h"

namespace vshred {

// Thrown by StatusOr<T>::value() when the StatusOr holds an error.
class BadStatusOrAccess : public std::exception {
public:
    explicit BadStatusOrAccess(Status status);
    ~BadStatusOrAccess() override;

    const char* what() const noexcept override;

    const Status& status() const;

private:
    Status status_;
};

namespace internal_statusor {

void HandleInvalidStatusCtorArg(Status* status);

[[noreturn]] void ThrowBadStatusOrAccess(Status status);

} // namespace internal_statusor

// StatusOr<T> holds either a usable value of type T or a non-OK Status
// explaining why the value is not present.
//
// Example:
//
//   StatusOr<std::string> result = VariantMetadataBuilder::build(names);
//   if (result.ok()) {
//       consume(*result);
//   } else {
//       LOG(WARNING) << result.status();
//   }
template <typename T>
class [[nodiscard]] StatusOr {
    template <typename U>
    friend class StatusOr;

public:
    typedef T value_type;

    // Constructs a new StatusOr with an Unknown error.
    StatusOr() : status_(Status::InternalError("uninitialized StatusOr")) {}

    StatusOr(const StatusOr&) = default;
    StatusOr& operator=(const StatusOr&) = default;
    StatusOr(StatusOr&&) noexcept = default;
    StatusOr& operator=(StatusOr&&) noexcept = default;

    // Constructs from a non-OK status. An OK status is not a valid argument and
    // is converted into an internal error.
    StatusOr(const Status& status) : status_(status) { // NOLINT
        if (UNLIKELY(status_.ok())) internal_statusor::HandleInvalidStatusCtorArg(&status_);
    }
    StatusOr(Status&& status) : status_(std::move(status)) { // NOLINT
        if (UNLIKELY(status_.ok())) internal_statusor::HandleInvalidStatusCtorArg(&status_);
    }

    template <typename U = T,
              typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                          !std::is_same_v<std::decay_t<U>, StatusOr<T>> &&
                                          !std::is_same_v<std::decay_t<U>, Status>>>
    StatusOr(U&& value) : value_(std::forward<U>(value)) {} // NOLINT

    // Converting constructor from StatusOr<U>, e.g. StatusOr<std::unique_ptr<Derived>>.
    template <typename U, typename = std::enable_if_t<!std::is_same_v<T, U> && std::is_constructible_v<T, U&&>>>
    StatusOr(StatusOr<U>&& other) : status_(std::move(other.status_)) { // NOLINT
        if (other.value_.has_value()) {
            value_.emplace(std::move(*other.value_));
        }
    }

    bool ok() const { return status_.ok(); }

    const Status& status() const& { return status_; }
    Status status() && { return ok() ? Status::OK() : std::move(status_); }

    const T& value() const& {
        if (UNLIKELY(!ok())) internal_statusor::ThrowBadStatusOrAccess(status_);
        return *value_;
    }
    T& value() & {
        if (UNLIKELY(!ok())) internal_statusor::ThrowBadStatusOrAccess(status_);
        return *value_;
    }
    T&& value() && {
        if (UNLIKELY(!ok())) internal_statusor::ThrowBadStatusOrAccess(std::move(status_));
        return std::move(*value_);
    }

    // Dereferencing an error StatusOr is undefined behavior, check ok() first.
    const T& operator*() const& {
        DCHECK(ok()) << status_;
        return *value_;
    }
    T& operator*() & {
        DCHECK(ok()) << status_;
        return *value_;
    }
    T&& operator*() && {
        DCHECK(ok()) << status_;
        return std::move(*value_);
    }

    const T* operator->() const {
        DCHECK(ok()) << status_;
        return &*value_;
    }
    T* operator->() {
        DCHECK(ok()) << status_;
        return &*value_;
    }

    template <typename U>
    T value_or(U&& default_value) const& {
        return ok() ? *value_ : static_cast<T>(std::forward<U>(default_value));
    }

private:
    Status status_;
    std::optional<T> value_;
};

#define ASSIGN_OR_RETURN_IMPL(varname, lhs, rhs) \
    auto&& varname = (rhs);                      \
    if (UNLIKELY(!varname.ok())) {               \
        return std::move(varname).status();      \
    }                                            \
    lhs = std::move(varname).value();

#define ASSIGN_OR_RETURN(lhs, rhs) ASSIGN_OR_RETURN_IMPL(VARNAME_LINENUM(value_or_err), lhs, rhs)

} // namespace vshred
