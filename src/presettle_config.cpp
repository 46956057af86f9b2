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

#include "amqptx/presettle_policy.hpp"

#include "msg.hpp"

#include <proton/error.hpp>

#include <json/value.h>
#include <json/reader.h>

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace Json;
using std::string;

namespace amqptx {

namespace {

const char *type_name(ValueType t) {
    switch (t) {
      case nullValue: return "null";
      case intValue: return "int";
      case uintValue: return "uint";
      case realValue: return "real";
      case stringValue: return "string";
      case booleanValue: return "boolean";
      case arrayValue: return "array";
      case objectValue: return "object";
      default: return "unknown";
    }
}

proton::error err(const string& message) {
    return proton::error("presettle configuration: " + message);
}

void validate(ValueType t, const Value& v, const string& name) {
    if (v.type() != t)
        throw err(msg() << "'" << name << "' expected " << type_name(t) << ", found " << type_name(v.type()));
}

bool get_bool(const Value& obj, const char *key, bool dflt) {
    Value v = obj.get(key, Value());
    if (v.isNull()) return dflt;
    validate(booleanValue, v, key);
    return v.asBool();
}

const string HOME("HOME");
const string ENV_VAR("MESSAGING_PRESETTLE_FILE");
const string FILE_NAME("presettle.json");
const string HOME_FILE_NAME("/.config/messaging/" + FILE_NAME);
const string ETC_FILE_NAME("/etc/messaging/" + FILE_NAME);

presettle_policy parse(const Value& root) {
    validate(objectValue, root, "configuration");
    presettle_policy p;
    p.presettle_all(get_bool(root, "presettle_all", false))
        .presettle_producers(get_bool(root, "presettle_producers", false))
        .presettle_topic_producers(get_bool(root, "presettle_topic_producers", false))
        .presettle_queue_producers(get_bool(root, "presettle_queue_producers", false))
        .presettle_transacted_producers(get_bool(root, "presettle_transacted_producers", false))
        .presettle_consumers(get_bool(root, "presettle_consumers", false))
        .presettle_topic_consumers(get_bool(root, "presettle_topic_consumers", false))
        .presettle_queue_consumers(get_bool(root, "presettle_queue_consumers", false));
    return p;
}

bool config_file(std::ifstream& f, string& name) {
    const char *env_path = getenv(ENV_VAR.c_str());
    const char *home = getenv(HOME.c_str());

    if (env_path) {
        name = env_path;
        f.open(name.c_str());
        return f.good();
    }

    std::vector<string> path;
    path.push_back(FILE_NAME);
    if (home) path.push_back(home + HOME_FILE_NAME);
    path.push_back(ETC_FILE_NAME);

    for (unsigned i = 0; i < path.size(); ++i) {
        name = path[i];
        f.open(name.c_str());
        if (f.good()) return true;
        f.close();
    }
    return false;
}

presettle_policy parse_stream(std::istream& is, const string& name) {
    try {
        Value root;
        is >> root;
        return parse(root);
    } catch (const proton::error&) {
        throw;
    } catch (const std::exception& e) {
        throw err(msg() << "error parsing '" << name << "': " << e.what());
    }
}

} // namespace

namespace presettle_config {

presettle_policy parse(std::istream& is) {
    return parse_stream(is, "stream");
}

string default_file() {
    string name;
    std::ifstream f;
    if (config_file(f, name)) return name;
    throw err("no default configuration, last tried: " + name);
}

presettle_policy parse_default() {
    string name;
    std::ifstream f;
    if (!config_file(f, name)) {
        throw err("no default configuration, last tried: " + name);
    }
    return parse_stream(f, name);
}

} // namespace presettle_config

} // namespace amqptx
