#ifndef AMQPTX_TX_ERROR_HPP
#define AMQPTX_TX_ERROR_HPP

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

#include <proton/error.hpp>
#include <proton/error_condition.hpp>

#include <iosfwd>
#include <string>

/// @file
/// @copybrief amqptx::tx_error

namespace amqptx {

/// The failure reported to a @ref completion.
///
/// A tx_error is a value, not an exception: callers branch on kind()
/// instead of on a type hierarchy. Failures that came from the remote
/// coordinator also carry its error condition.
class tx_error {
  public:
    /// The kinds of failure a transaction operation can report.
    enum kind {
        /// The operation is not legal in the current state; a caller bug.
        ILLEGAL_STATE,
        /// The transaction did not commit and was, or must be, rolled back.
        ROLLED_BACK,
        /// The coordinator refused the declare, or went away during it.
        DECLARE_FAILED,
        /// The coordinator refused the discharge, or went away during it.
        DISCHARGE_FAILED,
        /// The coordinator link could not be opened.
        LINK_FAILED
    };

    AMQPTX_EXTERN tx_error(enum kind k, std::string description);

    AMQPTX_EXTERN tx_error(enum kind k, std::string description, proton::error_condition remote);

    enum kind kind() const { return kind_; }

    const std::string& description() const { return description_; }

    /// The condition sent by the remote peer, empty if the failure
    /// was detected locally.
    const proton::error_condition& remote_condition() const { return remote_; }

    /// Simple printable string for the error.
    AMQPTX_EXTERN std::string what() const;

    /// Convert to an exception, for callers that prefer to throw.
    AMQPTX_EXTERN proton::error to_error() const;

  private:
    enum kind kind_;
    std::string description_;
    proton::error_condition remote_;
};

/// Name of an error kind, e.g. "illegal-state".
AMQPTX_EXTERN const char* kind_name(enum tx_error::kind);

AMQPTX_EXTERN std::ostream& operator<<(std::ostream&, const tx_error&);

} // namespace amqptx

#endif // AMQPTX_TX_ERROR_HPP
