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

#include <avro/compiler.hh>
#include <avro/binary_decoder.hh>
#include <avro/blocks.hh>
#include <avro/logical.hh>
#include <avro/overloaded.hh>
#include <avro/recursion.hh>
#include <seastar/util/log.hh>
#include <algorithm>
#include <optional>
#include <unordered_set>

namespace avro {

namespace {

seastar::logger clogger("avro_compiler");

using primitive_reader = value (*)(byte_source&);

primitive_reader reader_for(schema::primitive_type t) {
    using schema::primitive_type;
    switch (t) {
    case primitive_type::NULL_:
        return [] (byte_source&) -> value { return value{}; };
    case primitive_type::BOOLEAN:
        return [] (byte_source& src) -> value { return binary::read_boolean(src); };
    case primitive_type::INT:
        return [] (byte_source& src) -> value { return binary::read_int(src); };
    case primitive_type::LONG:
        return [] (byte_source& src) -> value { return binary::read_long(src); };
    case primitive_type::FLOAT:
        return [] (byte_source& src) -> value { return binary::read_float(src); };
    case primitive_type::DOUBLE:
        return [] (byte_source& src) -> value { return binary::read_double(src); };
    case primitive_type::BYTES:
        return [] (byte_source& src) -> value { return binary::read_bytes(src); };
    case primitive_type::STRING:
        return [] (byte_source& src) -> value { return binary::read_string(src); };
    }
    throw schema_exception::invalid_schema(
            seastar::format("unknown primitive type ({})", static_cast<int>(t)));
}

bool is_null_type(const schema::node& n) {
    auto p = std::get_if<schema::primitive_node>(&n);
    return p && p->type == schema::primitive_type::NULL_;
}

[[noreturn]] void throw_bad_union_index(int64_t index, size_t branches) {
    throw decode_exception::corrupted_data(
            seastar::format("union branch index {} out of range [0, {})", index, branches));
}

// Any index other than the two branches is an error, as for general unions,
// rather than being read as null.
value null_branch(int64_t index, int64_t null_index) {
    if (index != null_index) {
        throw_bad_union_index(index, 2);
    }
    return value{};
}

class plan_compiler {
    const schema::schema& _schema;
    procedure_table& _procedures;
    // Names of the non-recursive named types being inlined right now.
    std::unordered_set<std::string> _inlining;
public:
    plan_compiler(const schema::schema& s, procedure_table& procedures)
        : _schema(s)
        , _procedures(procedures) {}

    decode_fn compile(const schema::node& n) {
        return std::visit(overloaded {
            [] (const schema::primitive_node& x) { return decode_fn{reader_for(x.type)}; },
            [this] (const schema::named_ref_node& x) { return compile_named_ref(x); },
            [this] (const schema::union_node& x) { return compile_union(x); },
            [this] (const schema::record_node& x) { return compile_record(x); },
            [this] (const schema::array_node& x) { return compile_array(x); },
            [this] (const schema::map_node& x) { return compile_map(x); },
            [this] (const schema::fixed_node& x) { return compile_fixed(x); },
            [this] (const schema::enum_node& x) { return compile_enum(x); },
            [this] (const schema::logical_node& x) { return compile_logical(x); }
        }, n);
    }

private:
    decode_fn compile_named_ref(const schema::named_ref_node& x) {
        auto it = _procedures.find(x.name);
        if (it != _procedures.end()) {
            const decode_fn* shared = &it->second;
            return [shared] (byte_source& src) { return (*shared)(src); };
        }
        if (!_inlining.insert(x.name).second) {
            throw schema_exception::invalid_schema(
                    seastar::format("{} refers to itself but is not in the recursive type set", x.name));
        }
        decode_fn inlined = compile(schema::resolve(_schema, x.name));
        _inlining.erase(x.name);
        return inlined;
    }

    decode_fn compile_union(const schema::union_node& x) {
        if (x.branches.empty()) {
            throw schema_exception::invalid_schema("union without branches");
        }
        if (x.branches.size() == 2) {
            for (int64_t null_index : {0, 1}) {
                if (is_null_type(x.branches[null_index])) {
                    return compile_optional(null_index, x.branches[1 - null_index]);
                }
            }
        }
        std::vector<decode_fn> branches;
        branches.reserve(x.branches.size());
        for (const schema::node& branch : x.branches) {
            branches.push_back(compile(branch));
        }
        return [branches = std::move(branches)] (byte_source& src) {
            int64_t index = binary::read_long(src);
            if (index < 0 || static_cast<uint64_t>(index) >= branches.size()) {
                throw_bad_union_index(index, branches.size());
            }
            return branches[index](src);
        };
    }

    // ["null", T] or [T, "null"]. An index naming neither branch throws in null_branch.
    decode_fn compile_optional(int64_t null_index, const schema::node& branch) {
        int64_t value_index = 1 - null_index;
        if (auto p = std::get_if<schema::primitive_node>(&branch)) {
            primitive_reader read = reader_for(p->type);
            return [read, value_index, null_index] (byte_source& src) {
                int64_t index = binary::read_long(src);
                return index == value_index ? read(src) : null_branch(index, null_index);
            };
        }
        decode_fn read = compile(branch);
        return [read = std::move(read), value_index, null_index] (byte_source& src) {
            int64_t index = binary::read_long(src);
            if (index == value_index) {
                return read(src);
            }
            return null_branch(index, null_index);
        };
    }

    decode_fn compile_record(const schema::record_node& x) {
        std::vector<std::pair<std::string, decode_fn>> fields;
        std::unordered_set<std::string_view> names;
        fields.reserve(x.fields.size());
        for (const schema::field& f : x.fields) {
            if (!names.insert(f.name).second) {
                throw schema_exception::invalid_schema(
                        seastar::format("duplicate field {} in record {}", f.name, x.name));
            }
            fields.emplace_back(f.name, compile(*f.type));
        }
        return [fields = std::move(fields)] (byte_source& src) -> value {
            record_value record;
            record.fields.reserve(fields.size());
            for (const auto& [name, read] : fields) {
                record.fields.emplace_back(name, read(src));
            }
            return record;
        };
    }

    decode_fn compile_array(const schema::array_node& x) {
        decode_fn read_item = compile(*x.items);
        return [read_item = std::move(read_item)] (byte_source& src) -> value {
            array_value items;
            for_each_block_item(src, [&] {
                items.push_back(read_item(src));
            });
            return items;
        };
    }

    decode_fn compile_map(const schema::map_node& x) {
        decode_fn read_value = compile(*x.values);
        return [read_value = std::move(read_value)] (byte_source& src) -> value {
            map_value entries;
            for_each_block_item(src, [&] {
                std::string key = binary::read_string(src);
                value v = read_value(src);
                entries.insert_or_assign(std::move(key), std::move(v));
            });
            return entries;
        };
    }

    decode_fn compile_fixed(const schema::fixed_node& x) {
        size_t size = x.size;
        return [size] (byte_source& src) -> value { return binary::read_fixed(src, size); };
    }

    decode_fn compile_enum(const schema::enum_node& x) {
        if (x.symbols.empty()) {
            throw schema_exception::invalid_schema(seastar::format("enum {} without symbols", x.name));
        }
        if (x.default_symbol
                && std::find(x.symbols.begin(), x.symbols.end(), *x.default_symbol) == x.symbols.end()) {
            throw schema_exception::invalid_schema(
                    seastar::format("default {} of enum {} is not one of its symbols", *x.default_symbol, x.name));
        }
        return [name = x.name, symbols = x.symbols, default_symbol = x.default_symbol]
                (byte_source& src) -> value {
            int64_t index = binary::read_long(src);
            if (index >= 0 && static_cast<uint64_t>(index) < symbols.size()) {
                return symbols[index];
            }
            if (default_symbol) {
                return *default_symbol;
            }
            throw decode_exception::corrupted_data(seastar::format(
                    "enum {} has no symbol at index {} and no default", name, index));
        };
    }

    decode_fn compile_logical(const schema::logical_node& x) {
        if (std::optional<decode_fn> read = compile_annotated(x)) {
            return std::move(*read);
        }
        clogger.debug("Logical type {} does not apply, decoding the physical type", x.logical_type);
        return compile(*x.underlying);
    }

    // The physical type under a logical annotation, looking through a reference.
    const schema::node& physical_type(const schema::logical_node& x) const {
        if (auto ref = std::get_if<schema::named_ref_node>(x.underlying.get())) {
            return schema::resolve(_schema, ref->name);
        }
        return *x.underlying;
    }

    bool has_primitive_type(const schema::logical_node& x, schema::primitive_type t) const {
        auto p = std::get_if<schema::primitive_node>(&physical_type(x));
        return p && p->type == t;
    }

    // nullopt if the annotation is unknown or does not fit the physical type.
    std::optional<decode_fn> compile_annotated(const schema::logical_node& x) {
        using schema::primitive_type;
        const std::string& lt = x.logical_type;
        if (lt == "decimal") {
            int32_t precision = x.precision.value_or(0);
            int32_t scale = x.scale.value_or(0);
            if (precision <= 0 || scale < 0 || scale > precision) {
                return std::nullopt;
            }
            if (has_primitive_type(x, primitive_type::BYTES)) {
                return decode_fn{[precision, scale] (byte_source& src) -> value {
                    return logical::parse_decimal(binary::read_bytes(src), precision, scale);
                }};
            }
            if (auto f = std::get_if<schema::fixed_node>(&physical_type(x))) {
                size_t size = f->size;
                return decode_fn{[size, precision, scale] (byte_source& src) -> value {
                    return logical::parse_decimal(src.read(size), precision, scale);
                }};
            }
        } else if (lt == "uuid") {
            if (has_primitive_type(x, primitive_type::STRING)) {
                return decode_fn{[] (byte_source& src) -> value {
                    return logical::parse_uuid(binary::read_string(src));
                }};
            }
        } else if (lt == "date") {
            if (has_primitive_type(x, primitive_type::INT)) {
                return decode_fn{[] (byte_source& src) -> value {
                    return logical::parse_date(binary::read_int(src));
                }};
            }
        } else if (lt == "time-millis") {
            if (has_primitive_type(x, primitive_type::INT)) {
                return decode_fn{[] (byte_source& src) -> value {
                    return logical::parse_time_millis(binary::read_int(src));
                }};
            }
        } else if (lt == "time-micros") {
            if (has_primitive_type(x, primitive_type::LONG)) {
                return decode_fn{[] (byte_source& src) -> value {
                    return logical::parse_time_micros(binary::read_long(src));
                }};
            }
        } else if (lt == "timestamp-millis") {
            if (has_primitive_type(x, primitive_type::LONG)) {
                return decode_fn{[] (byte_source& src) -> value {
                    return logical::parse_timestamp_millis(binary::read_long(src));
                }};
            }
        } else if (lt == "timestamp-micros") {
            if (has_primitive_type(x, primitive_type::LONG)) {
                return decode_fn{[] (byte_source& src) -> value {
                    return logical::parse_timestamp_micros(binary::read_long(src));
                }};
            }
        }
        return std::nullopt;
    }
};

} // namespace

value decoding_plan::decode_named(const std::string& name, byte_source& src) const {
    auto it = _procedures->find(name);
    if (it == _procedures->end()) {
        throw avro_exception(seastar::format("No shared procedure for named type {}", name));
    }
    return it->second(src);
}

decoding_plan compile(const schema::schema& s) {
    return compile(s, schema::find_recursive_types(s));
}

decoding_plan compile(const schema::schema& s, std::vector<std::string> recursive_types) {
    auto procedures = std::make_shared<procedure_table>();
    std::vector<std::string> names;
    // Every table entry exists before any call site takes its address.
    for (std::string& name : recursive_types) {
        schema::resolve(s, name);
        if (procedures->emplace(name, decode_fn{}).second) {
            names.push_back(std::move(name));
        }
    }
    plan_compiler compiler{s, *procedures};
    for (const std::string& name : names) {
        clogger.debug("Compiling shared procedure for recursive type {}", name);
        (*procedures)[name] = compiler.compile(schema::resolve(s, name));
    }
    decode_fn root = compiler.compile(*s.root);
    clogger.debug("Compiled decoding plan with {} shared procedure(s)", names.size());
    return decoding_plan{std::move(root), std::move(procedures), std::move(names)};
}

} // namespace avro
