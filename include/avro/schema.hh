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

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace avro::schema {

enum class primitive_type { NULL_, BOOLEAN, INT, LONG, FLOAT, DOUBLE, BYTES, STRING };

const char* primitive_type_name(primitive_type t);
std::optional<primitive_type> primitive_type_from_name(std::string_view name);

// A resolved avro schema tree. The first occurrence of a named type (record, enum, fixed)
// holds its definition; every later occurrence is a named_ref_node.
using node = std::variant<
    struct primitive_node,
    struct named_ref_node,
    struct union_node,
    struct record_node,
    struct array_node,
    struct map_node,
    struct fixed_node,
    struct enum_node,
    struct logical_node
>;

struct primitive_node {
    primitive_type type;
};

struct named_ref_node {
    std::string name;
};

struct union_node {
    std::vector<node> branches;
};

struct field {
    std::string name;
    std::unique_ptr<node> type;
};

struct record_node {
    std::string name;
    std::vector<field> fields;
};

struct array_node {
    std::unique_ptr<node> items;
};

struct map_node {
    std::unique_ptr<node> values;
};

struct fixed_node {
    std::string name;
    size_t size;
};

struct enum_node {
    std::string name;
    std::vector<std::string> symbols;
    std::optional<std::string> default_symbol;
};

// An annotation on top of a physical type. precision and scale are only
// recorded when the schema gives them as integers; validity is checked by the compiler.
struct logical_node {
    std::string logical_type;
    std::unique_ptr<node> underlying;
    std::optional<int32_t> precision;
    std::optional<int32_t> scale;
};

struct schema {
    std::unique_ptr<node> root;
    // Full name -> defining node. For a named type carrying a logical type the
    // entry points at the enclosing logical_node.
    std::unordered_map<std::string, const node*> named_types;
};

// The full name of a named type definition, or nullptr if the node does not define one.
const std::string* defined_name(const node& n);

// Rebuilds schema::named_types from the tree. Throws schema_exception on a duplicate definition.
void index_named_types(schema& s);

// Throws schema_exception if the name is not defined in the schema.
const node& resolve(const schema& s, const std::string& name);

schema make_schema(node root);

} // namespace avro::schema
