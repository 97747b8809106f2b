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

#include <avro/recursion.hh>
#include <avro/overloaded.hh>
#include <unordered_map>
#include <unordered_set>

namespace avro::schema {

namespace {

using graph = std::unordered_map<std::string, std::vector<std::string>>;

// Calls f on each direct child of n.
template <typename Func>
void for_each_child(const node& n, Func&& f) {
    std::visit(overloaded {
        [&] (const union_node& x) {
            for (const node& branch : x.branches) {
                f(branch);
            }
        },
        [&] (const record_node& x) {
            for (const field& fld : x.fields) {
                f(*fld.type);
            }
        },
        [&] (const array_node& x) { f(*x.items); },
        [&] (const map_node& x) { f(*x.values); },
        [&] (const logical_node& x) { f(*x.underlying); },
        [] (const auto&) {}
    }, n);
}

// The named types a definition refers to, without looking into the bodies of
// the named types it contains.
std::vector<std::string> direct_references(const node& definition) {
    std::vector<std::string> refs;
    auto collect = y_combinator{[&] (auto&& collect, const node& n) -> void {
        if (const std::string* name = defined_name(n)) {
            refs.push_back(*name);
        } else if (auto ref = std::get_if<named_ref_node>(&n)) {
            refs.push_back(ref->name);
        } else {
            for_each_child(n, collect);
        }
    }};
    const node* body = &definition;
    while (auto l = std::get_if<logical_node>(body)) {
        body = l->underlying.get();
    }
    for_each_child(*body, collect);
    return refs;
}

bool reaches(const graph& g, const std::string& from, const std::string& target) {
    std::unordered_set<std::string> visited;
    std::vector<const std::string*> stack{&from};
    while (!stack.empty()) {
        const std::string& current = *stack.back();
        stack.pop_back();
        auto it = g.find(current);
        if (it == g.end()) {
            continue;
        }
        for (const std::string& next : it->second) {
            if (next == target) {
                return true;
            }
            if (visited.insert(next).second) {
                stack.push_back(&next);
            }
        }
    }
    return false;
}

} // namespace

std::vector<std::string> find_recursive_types(const schema& s) {
    std::vector<std::string> order;
    graph g;
    y_combinator{[&] (auto&& walk, const node& n) -> void {
        // A logical node and the named type under it share one name.
        if (const std::string* name = defined_name(n); name && !g.count(*name)) {
            g.emplace(*name, direct_references(n));
            order.push_back(*name);
        }
        for_each_child(n, walk);
    }}(*s.root);

    std::vector<std::string> recursive;
    for (const std::string& name : order) {
        if (reaches(g, name, name)) {
            recursive.push_back(name);
        }
    }
    return recursive;
}

} // namespace avro::schema
