#ifndef AMQPTX_COMPLETION_HPP
#define AMQPTX_COMPLETION_HPP

/*
 *
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include "./internal/export.hpp"
#include "./tx_error.hpp"

#include <proton/binary.hpp>
#include <proton/error.hpp>

#include <functional>
#include <memory>
#include <utility>

/// @file
/// @copybrief amqptx::basic_completion

namespace amqptx {

/// @cond INTERNAL
namespace internal {
/// Throws proton::error for a second resolution of the same outcome.
[[noreturn]] AMQPTX_EXTERN void already_resolved();
}
/// @endcond

/// A pending asynchronous outcome.
///
/// A completion is a handle: copies refer to the same outcome. The
/// outcome is resolved at most once, by succeed() or fail(); resolving
/// it again throws proton::error. Every asynchronous exchange in
/// amqptx (link build, declare, discharge, send acknowledgment) reports
/// through a completion, always on the thread driving the connection.
///
/// A default constructed completion has no callbacks; resolving it only
/// records the outcome.
template <class T>
class basic_completion {
  public:
    typedef std::function<void(const T&)> success_function;
    typedef std::function<void(const tx_error&)> failure_function;

    basic_completion() : state_(std::make_shared<state>()) {}

    basic_completion(success_function on_success, failure_function on_failure) :
        state_(std::make_shared<state>(std::move(on_success), std::move(on_failure))) {}

    /// Signal success with a value.
    void succeed(const T& value) const {
        state s = std::move(take());
        if (s.on_success) s.on_success(value);
    }

    /// Signal failure with a cause.
    void fail(const tx_error& cause) const {
        state s = std::move(take());
        if (s.on_failure) s.on_failure(cause);
    }

    /// True once succeed() or fail() has been called on any copy.
    bool resolved() const { return state_->resolved; }

  private:
    struct state {
        state() : resolved(false) {}
        state(success_function s, failure_function f) :
            on_success(std::move(s)), on_failure(std::move(f)), resolved(false) {}

        success_function on_success;
        failure_function on_failure;
        bool resolved;
    };

    state& take() const {
        if (state_->resolved) internal::already_resolved();
        state_->resolved = true;
        return *state_;
    }

    std::shared_ptr<state> state_;
};

/// A pending outcome that carries no value.
template <>
class basic_completion<void> {
  public:
    typedef std::function<void()> success_function;
    typedef std::function<void(const tx_error&)> failure_function;

    basic_completion() : state_(std::make_shared<state>()) {}

    basic_completion(success_function on_success, failure_function on_failure) :
        state_(std::make_shared<state>(std::move(on_success), std::move(on_failure))) {}

    /// Signal success.
    void succeed() const {
        state s = std::move(take());
        if (s.on_success) s.on_success();
    }

    /// Signal failure with a cause.
    void fail(const tx_error& cause) const {
        state s = std::move(take());
        if (s.on_failure) s.on_failure(cause);
    }

    /// True once succeed() or fail() has been called on any copy.
    bool resolved() const { return state_->resolved; }

  private:
    struct state {
        state() : resolved(false) {}
        state(success_function s, failure_function f) :
            on_success(std::move(s)), on_failure(std::move(f)), resolved(false) {}

        success_function on_success;
        failure_function on_failure;
        bool resolved;
    };

    state& take() const {
        if (state_->resolved) internal::already_resolved();
        state_->resolved = true;
        return *state_;
    }

    std::shared_ptr<state> state_;
};

/// Completion of an operation with no result.
typedef basic_completion<void> completion;

/// Completion of a declare: carries the coordinator's transaction id.
typedef basic_completion<proton::binary> declare_completion;

} // namespace amqptx

#endif // AMQPTX_COMPLETION_HPP
