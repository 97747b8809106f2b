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

#include <avro/schema.hh>
#include <avro/exception.hh>
#include <avro/overloaded.hh>

namespace avro::schema {

const char* primitive_type_name(primitive_type t) {
    switch (t) {
    case primitive_type::NULL_: return "null";
    case primitive_type::BOOLEAN: return "boolean";
    case primitive_type::INT: return "int";
    case primitive_type::LONG: return "long";
    case primitive_type::FLOAT: return "float";
    case primitive_type::DOUBLE: return "double";
    case primitive_type::BYTES: return "bytes";
    case primitive_type::STRING: return "string";
    }
    return "unknown";
}

std::optional<primitive_type> primitive_type_from_name(std::string_view name) {
    static const std::pair<std::string_view, primitive_type> names[] = {
        {"null", primitive_type::NULL_},
        {"boolean", primitive_type::BOOLEAN},
        {"int", primitive_type::INT},
        {"long", primitive_type::LONG},
        {"float", primitive_type::FLOAT},
        {"double", primitive_type::DOUBLE},
        {"bytes", primitive_type::BYTES},
        {"string", primitive_type::STRING},
    };
    for (const auto& [n, t] : names) {
        if (n == name) {
            return t;
        }
    }
    return std::nullopt;
}

const std::string* defined_name(const node& n) {
    return std::visit(overloaded {
        [] (const record_node& x) -> const std::string* { return &x.name; },
        [] (const fixed_node& x) -> const std::string* { return &x.name; },
        [] (const enum_node& x) -> const std::string* { return &x.name; },
        [] (const logical_node& x) -> const std::string* { return defined_name(*x.underlying); },
        [] (const auto&) -> const std::string* { return nullptr; }
    }, n);
}

void index_named_types(schema& s) {
    s.named_types.clear();
    y_combinator{[&] (auto&& index, const node& n) -> void {
        if (const std::string* name = defined_name(n)) {
            auto [it, inserted] = s.named_types.emplace(*name, &n);
            if (!inserted) {
                throw schema_exception::invalid_schema("duplicate definition of " + *name);
            }
        }
        std::visit(overloaded {
            [&] (const union_node& x) {
                for (const node& branch : x.branches) {
                    index(branch);
                }
            },
            [&] (const record_node& x) {
                for (const field& f : x.fields) {
                    index(*f.type);
                }
            },
            [&] (const array_node& x) { index(*x.items); },
            [&] (const map_node& x) { index(*x.values); },
            // The definition was registered under the enclosing logical node.
            [&] (const logical_node& x) {
                std::visit(overloaded {
                    [&] (const record_node& r) {
                        for (const field& f : r.fields) {
                            index(*f.type);
                        }
                    },
                    [&] (const auto&) {
                        if (!defined_name(*x.underlying)) {
                            index(*x.underlying);
                        }
                    }
                }, *x.underlying);
            },
            [] (const auto&) {}
        }, n);
    }}(*s.root);
}

const node& resolve(const schema& s, const std::string& name) {
    auto it = s.named_types.find(name);
    if (it == s.named_types.end()) {
        throw schema_exception::invalid_schema("unknown named type " + name);
    }
    return *it->second;
}

schema make_schema(node root) {
    schema s{std::make_unique<node>(std::move(root)), {}};
    index_named_types(s);
    return s;
}

} // namespace avro::schema
