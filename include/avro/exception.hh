/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */
/*
 * Copyright (C) 2020 ScyllaDB
 */

#pragma once

#include <seastar/core/print.hh>
#include <exception>
#include <string>

namespace avro {

class avro_exception : public std::exception {
    std::string _msg;
public:
    ~avro_exception() throw() override {}

    static avro_exception corrupted_file(const std::string& msg) {
        return avro_exception(seastar::format("Invalid or corrupted avro container file: {}", msg));
    }

    static avro_exception missing_schema(const std::string& path) {
        return avro_exception(seastar::format("No writer schema in avro container file {}", path));
    }

    static avro_exception not_implemented(const std::string& msg) {
        return avro_exception(seastar::format("Not implemented: {}", msg));
    }

    explicit avro_exception(const char* msg) : _msg(msg) {}

    explicit avro_exception(std::string msg) : _msg(std::move(msg)) {}

    const char* what() const throw() override { return _msg.c_str(); }
};

// Raised while parsing or compiling a schema. A plan is never partially built.
class schema_exception : public avro_exception {
public:
    static schema_exception invalid_schema(const std::string& msg) {
        return schema_exception(seastar::format("Invalid avro schema: {}", msg));
    }

    explicit schema_exception(std::string msg) : avro_exception(std::move(msg)) {}
};

// Raised while decoding a value. The byte source position is unspecified afterwards.
class decode_exception : public avro_exception {
    bool _end_of_input = false;
public:
    static decode_exception corrupted_data(const std::string& msg) {
        return decode_exception(seastar::format("Invalid or corrupted avro data: {}", msg));
    }

    static decode_exception unexpected_end(size_t needed, size_t remaining) {
        decode_exception e(seastar::format(
                "Unexpected end of avro data (needed {}B, got {}B)", needed, remaining));
        e._end_of_input = true;
        return e;
    }

    explicit decode_exception(std::string msg) : avro_exception(std::move(msg)) {}

    bool end_of_input() const { return _end_of_input; }
};

} // namespace avro
