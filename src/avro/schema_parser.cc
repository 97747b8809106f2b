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

#include <avro/schema_parser.hh>
#include <avro/exception.hh>
#include <nlohmann/json.hpp>
#include <limits>
#include <unordered_set>

namespace avro::schema {

namespace {

using json = nlohmann::json;

[[noreturn]] void fail(const std::string& msg) {
    throw schema_exception::invalid_schema(msg);
}

const std::string& string_attribute(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        fail(std::string("missing or non-string attribute \"") + key + "\" in " + j.dump());
    }
    return it->get_ref<const std::string&>();
}

std::optional<int32_t> int_attribute(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    // Values outside the int range are treated as absent.
    if (it->is_number_unsigned()) {
        auto v = it->get<uint64_t>();
        if (v > uint64_t(std::numeric_limits<int32_t>::max())) {
            return std::nullopt;
        }
        return int32_t(v);
    }
    auto v = it->get<int64_t>();
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
        return std::nullopt;
    }
    return int32_t(v);
}

class parser {
    std::unordered_set<std::string> _defined;
private:
    struct qualified_name {
        std::string full_name;
        std::string space;
    };

    qualified_name qualify(const json& j, const std::string& enclosing_space) {
        const std::string& name = string_attribute(j, "name");
        if (name.empty()) {
            fail("empty name in " + j.dump());
        }
        std::string full_name;
        if (name.find('.') != std::string::npos) {
            full_name = name;
        } else {
            std::string space = enclosing_space;
            auto it = j.find("namespace");
            if (it != j.end() && it->is_string()) {
                space = it->get<std::string>();
            }
            full_name = space.empty() ? name : space + "." + name;
        }
        auto dot = full_name.rfind('.');
        std::string space = dot == std::string::npos ? std::string() : full_name.substr(0, dot);
        return {std::move(full_name), std::move(space)};
    }

    void define(const std::string& full_name) {
        if (!_defined.insert(full_name).second) {
            fail("duplicate definition of " + full_name);
        }
    }

    std::string resolve_reference(const std::string& name, const std::string& space) {
        if (name.find('.') == std::string::npos && !space.empty()) {
            std::string qualified = space + "." + name;
            if (_defined.count(qualified)) {
                return qualified;
            }
        }
        if (_defined.count(name)) {
            return name;
        }
        fail("unknown type " + name);
    }

    node parse_name(const std::string& name, const std::string& space) {
        if (auto p = primitive_type_from_name(name)) {
            return primitive_node{*p};
        }
        return named_ref_node{resolve_reference(name, space)};
    }

    node parse_union(const json& j, const std::string& space) {
        if (j.empty()) {
            fail("union without branches");
        }
        std::vector<node> branches;
        branches.reserve(j.size());
        for (const json& branch : j) {
            if (branch.is_array()) {
                fail("union may not immediately contain another union: " + j.dump());
            }
            branches.push_back(parse(branch, space));
        }
        return union_node{std::move(branches)};
    }

    node parse_record(const json& j, const std::string& space) {
        qualified_name qn = qualify(j, space);
        define(qn.full_name);
        auto it = j.find("fields");
        if (it == j.end() || !it->is_array()) {
            fail("record " + qn.full_name + " without a fields array");
        }
        std::unordered_set<std::string> field_names;
        std::vector<field> fields;
        fields.reserve(it->size());
        for (const json& f : *it) {
            if (!f.is_object()) {
                fail("invalid field in record " + qn.full_name);
            }
            const std::string& name = string_attribute(f, "name");
            if (!field_names.insert(name).second) {
                fail("duplicate field " + name + " in record " + qn.full_name);
            }
            auto type = f.find("type");
            if (type == f.end()) {
                fail("field " + name + " of record " + qn.full_name + " has no type");
            }
            fields.push_back(field{name, std::make_unique<node>(parse(*type, qn.space))});
        }
        return record_node{std::move(qn.full_name), std::move(fields)};
    }

    node parse_enum(const json& j, const std::string& space) {
        qualified_name qn = qualify(j, space);
        define(qn.full_name);
        auto it = j.find("symbols");
        if (it == j.end() || !it->is_array() || it->empty()) {
            fail("enum " + qn.full_name + " without symbols");
        }
        std::vector<std::string> symbols;
        std::unordered_set<std::string> seen;
        for (const json& s : *it) {
            if (!s.is_string()) {
                fail("non-string symbol in enum " + qn.full_name);
            }
            if (!seen.insert(s.get<std::string>()).second) {
                fail("duplicate symbol " + s.get<std::string>() + " in enum " + qn.full_name);
            }
            symbols.push_back(s.get<std::string>());
        }
        std::optional<std::string> default_symbol;
        auto d = j.find("default");
        if (d != j.end()) {
            if (!d->is_string() || !seen.count(d->get<std::string>())) {
                fail("default of enum " + qn.full_name + " is not one of its symbols");
            }
            default_symbol = d->get<std::string>();
        }
        return enum_node{std::move(qn.full_name), std::move(symbols), std::move(default_symbol)};
    }

    node parse_fixed(const json& j, const std::string& space) {
        qualified_name qn = qualify(j, space);
        define(qn.full_name);
        auto it = j.find("size");
        if (it == j.end() || !it->is_number_integer() || it->get<int64_t>() < 0) {
            fail("fixed " + qn.full_name + " without a valid size");
        }
        return fixed_node{std::move(qn.full_name), it->get<size_t>()};
    }

    node parse_type(const json& j, const std::string& space) {
        auto type = j.find("type");
        if (type == j.end()) {
            fail("missing type in " + j.dump());
        }
        if (!type->is_string()) {
            return parse(*type, space);
        }
        const std::string& t = type->get_ref<const std::string&>();
        if (t == "record" || t == "error") {
            return parse_record(j, space);
        } else if (t == "enum") {
            return parse_enum(j, space);
        } else if (t == "fixed") {
            return parse_fixed(j, space);
        } else if (t == "array") {
            auto items = j.find("items");
            if (items == j.end()) {
                fail("array without items");
            }
            return array_node{std::make_unique<node>(parse(*items, space))};
        } else if (t == "map") {
            auto values = j.find("values");
            if (values == j.end()) {
                fail("map without values");
            }
            return map_node{std::make_unique<node>(parse(*values, space))};
        }
        return parse_name(t, space);
    }

    node parse_object(const json& j, const std::string& space) {
        auto lt = j.find("logicalType");
        if (lt == j.end() || !lt->is_string()) {
            return parse_type(j, space);
        }
        return logical_node{
                lt->get<std::string>(),
                std::make_unique<node>(parse_type(j, space)),
                int_attribute(j, "precision"),
                int_attribute(j, "scale")};
    }

public:
    node parse(const json& j, const std::string& space) {
        if (j.is_string()) {
            return parse_name(j.get<std::string>(), space);
        } else if (j.is_array()) {
            return parse_union(j, space);
        } else if (j.is_object()) {
            return parse_object(j, space);
        }
        fail("unexpected JSON value " + j.dump());
    }
};

} // namespace

schema parse_schema(std::string_view text) {
    try {
        json j = json::parse(text.begin(), text.end());
        return make_schema(parser{}.parse(j, ""));
    } catch (const json::exception& e) {
        throw schema_exception::invalid_schema(e.what());
    }
}

} // namespace avro::schema
