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

#include "log.hpp"

#include <proton/logger.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <strings.h>

namespace amqptx {

namespace {

struct level_name {
    const char* name;
    uint16_t level;
    // Enabled by a trailing '+'
    uint16_t plus;
};

const level_name LEVELS[] = {
    {"err", PN_LEVEL_ERROR, PN_LEVEL_ERROR | PN_LEVEL_CRITICAL},
    {"warn", PN_LEVEL_WARNING, PN_LEVEL_WARNING | PN_LEVEL_ERROR | PN_LEVEL_CRITICAL},
    {"info", PN_LEVEL_INFO, PN_LEVEL_INFO | PN_LEVEL_WARNING | PN_LEVEL_ERROR | PN_LEVEL_CRITICAL},
    {"debug", PN_LEVEL_DEBUG,
     PN_LEVEL_DEBUG | PN_LEVEL_INFO | PN_LEVEL_WARNING | PN_LEVEL_ERROR | PN_LEVEL_CRITICAL},
    {"trace", PN_LEVEL_TRACE,
     PN_LEVEL_TRACE | PN_LEVEL_DEBUG | PN_LEVEL_INFO | PN_LEVEL_WARNING | PN_LEVEL_ERROR | PN_LEVEL_CRITICAL},
    {"all", PN_LEVEL_ALL, PN_LEVEL_ALL}
};

uint16_t decode_levels(const char* env) {
    uint16_t mask = PN_LEVEL_CRITICAL;
    if (!env) return mask;
    for (const char* p = env; *p;) {
        bool matched = false;
        for (const level_name& l : LEVELS) {
            size_t n = std::strlen(l.name);
            if (strncasecmp(p, l.name, n) == 0) {
                p += n;
                if (*p == '+') {
                    mask |= l.plus;
                    ++p;
                } else {
                    mask |= l.level;
                }
                matched = true;
                break;
            }
        }
        if (!matched) ++p;
    }
    return mask;
}

bool enabled(pn_log_level_t level) {
    static const uint16_t mask = decode_levels(std::getenv("PN_LOG"));
    return mask & level;
}

void log(pn_log_level_t level, const std::string& text) {
    if (!enabled(level)) return;
    pn_logger_logf(pn_default_logger(), PN_SUBSYSTEM_BINDING, level, "%s", text.c_str());
}

} // namespace

void log_trace(const std::string& text) { log(PN_LEVEL_TRACE, text); }
void log_debug(const std::string& text) { log(PN_LEVEL_DEBUG, text); }
void log_warning(const std::string& text) { log(PN_LEVEL_WARNING, text); }

} // namespace amqptx
