#ifndef AMQPTX_LOG_HPP
#define AMQPTX_LOG_HPP

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

#include <string>

// Logging goes to the Proton default logger, and its sink, under the
// binding subsystem. Levels are enabled with the PN_LOG environment
// variable as for Proton itself, e.g. PN_LOG=trace+ or PN_LOG=warn.

namespace amqptx {

void log_trace(const std::string& text);
void log_debug(const std::string& text);
void log_warning(const std::string& text);

} // namespace amqptx

#endif // AMQPTX_LOG_HPP
