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

#include <avro/byte_source.hh>
#include <avro/schema.hh>
#include <avro/value.hh>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace avro {

// Decodes one value from the source, advancing it past the value.
using decode_fn = std::function<value(byte_source&)>;

// One shared procedure per recursive named type, keyed by full name.
using procedure_table = std::unordered_map<std::string, decode_fn>;

/* The result of compiling a schema: a root procedure and the shared procedures of the
 * recursive named types, which the root (and each other) call by reference into the table.
 * A plan is immutable. It may be copied (copies share the procedure table) and used from
 * any number of threads at once, as long as each decode gets its own byte_source.
 */
class decoding_plan {
    decode_fn _root;
    std::shared_ptr<const procedure_table> _procedures;
    std::vector<std::string> _recursive_types;
public:
    decoding_plan(decode_fn root, std::shared_ptr<const procedure_table> procedures,
            std::vector<std::string> recursive_types)
        : _root(std::move(root))
        , _procedures(std::move(procedures))
        , _recursive_types(std::move(recursive_types)) {}

    value decode(byte_source& src) const { return _root(src); }

    // Decodes with the shared procedure of a recursive named type.
    // Throws avro_exception if the type has no shared procedure.
    value decode_named(const std::string& name, byte_source& src) const;

    const std::vector<std::string>& recursive_types() const { return _recursive_types; }
};

// Compiles the schema, finding its recursive types with schema::find_recursive_types.
decoding_plan compile(const schema::schema& s);

// Compiles the schema with a precomputed set of recursive types. A named type that
// is referenced from within itself but missing from the set is a schema_exception.
decoding_plan compile(const schema::schema& s, std::vector<std::string> recursive_types);

} // namespace avro
