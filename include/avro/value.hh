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
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/uuid/uuid.hpp>
#include <map>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace avro {

// The value of the decimal logical type: unscaled * 10^-scale.
struct decimal {
    boost::multiprecision::cpp_int unscaled;
    int32_t precision;
    int32_t scale;

    std::string to_string() const;
    bool operator==(const decimal& o) const {
        return unscaled == o.unscaled && precision == o.precision && scale == o.scale;
    }
    bool operator!=(const decimal& o) const { return !(*this == o); }
};

class value;

using array_value = std::vector<value>;
using map_value = std::map<std::string, value>;

// Record fields in schema declaration order. Names are unique within a record.
struct record_value {
    std::vector<std::pair<std::string, value>> fields;

    // nullptr if there is no such field.
    const value* find(std::string_view name) const;
    // Throws std::out_of_range if there is no such field.
    const value& at(std::string_view name) const;
    size_t size() const { return fields.size(); }

    bool operator==(const record_value& o) const;
    bool operator!=(const record_value& o) const { return !(*this == o); }
};

/* A decoded avro datum. Enum symbols decode to strings, fixed to bytes.
 * Values own all their data and share nothing with the plan that produced them.
 */
class value {
public:
    using variant_type = std::variant<
        std::monostate,
        bool,
        int32_t,
        int64_t,
        float,
        double,
        std::string,
        bytes,
        array_value,
        map_value,
        record_value,
        decimal,
        boost::uuids::uuid,
        boost::gregorian::date,
        boost::posix_time::time_duration,
        boost::posix_time::ptime
    >;
private:
    variant_type _v;
public:
    value() = default;

    template <typename T, typename = std::enable_if_t<
            !std::is_same_v<std::decay_t<T>, value> && !std::is_same_v<std::decay_t<T>, const char*>>>
    value(T&& v) : _v(std::forward<T>(v)) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(_v); }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(_v); }

    // Throws std::bad_variant_access if the value holds a different type.
    template <typename T>
    const T& as() const { return std::get<T>(_v); }

    template <typename T>
    T& as() { return std::get<T>(_v); }

    const variant_type& variant() const { return _v; }

    bool operator==(const value& o) const { return _v == o._v; }
    bool operator!=(const value& o) const { return !(*this == o); }
};

// Prints a JSON-like rendering of the value: bytes as 0x-prefixed hex,
// logical types in their ISO/decimal text forms.
std::ostream& operator<<(std::ostream& out, const value& v);

} // namespace avro
