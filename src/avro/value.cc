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

#include <avro/value.hh>
#include <avro/overloaded.hh>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <iomanip>
#include <stdexcept>

namespace avro {

std::string decimal::to_string() const {
    boost::multiprecision::cpp_int magnitude = abs(unscaled);
    std::string digits = magnitude.str();
    if (scale > 0) {
        size_t s = static_cast<size_t>(scale);
        if (digits.size() <= s) {
            digits.insert(0, s - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - s, 1, '.');
    }
    if (unscaled < 0) {
        digits.insert(0, 1, '-');
    }
    return digits;
}

const value* record_value::find(std::string_view name) const {
    for (const auto& [field_name, field_value] : fields) {
        if (field_name == name) {
            return &field_value;
        }
    }
    return nullptr;
}

const value& record_value::at(std::string_view name) const {
    const value* v = find(name);
    if (!v) {
        throw std::out_of_range(std::string("No such record field: ") + std::string(name));
    }
    return *v;
}

bool record_value::operator==(const record_value& o) const {
    return fields == o.fields;
}

namespace {

void print_quoted_string(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        switch (c) {
        case '"': out << "\\\""; break;
        case '\\': out << "\\\\"; break;
        case '\n': out << "\\n"; break;
        case '\t': out << "\\t"; break;
        case '\r': out << "\\r"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                out << c;
            }
        }
    }
    out << '"';
}

void print_blob(std::ostream& out, const bytes& b) {
    static const char table[] = "0123456789abcdef";
    out << "0x";
    for (uint8_t c : b) {
        out << table[c >> 4] << table[c & 0x0f];
    }
}

} // namespace

std::ostream& operator<<(std::ostream& out, const value& v) {
    std::visit(overloaded {
        [&] (const std::monostate&) { out << "null"; },
        [&] (bool x) { out << (x ? "true" : "false"); },
        [&] (int32_t x) { out << x; },
        [&] (int64_t x) { out << x; },
        [&] (float x) { out << x; },
        [&] (double x) { out << x; },
        [&] (const std::string& x) { print_quoted_string(out, x); },
        [&] (const bytes& x) { print_blob(out, x); },
        [&] (const array_value& x) {
            out << '[';
            for (size_t i = 0; i < x.size(); ++i) {
                if (i > 0) {
                    out << ", ";
                }
                out << x[i];
            }
            out << ']';
        },
        [&] (const map_value& x) {
            out << '{';
            bool first = true;
            for (const auto& [k, item] : x) {
                if (!first) {
                    out << ", ";
                }
                first = false;
                print_quoted_string(out, k);
                out << ": " << item;
            }
            out << '}';
        },
        [&] (const record_value& x) {
            out << '{';
            for (size_t i = 0; i < x.fields.size(); ++i) {
                if (i > 0) {
                    out << ", ";
                }
                print_quoted_string(out, x.fields[i].first);
                out << ": " << x.fields[i].second;
            }
            out << '}';
        },
        [&] (const decimal& x) { out << x.to_string(); },
        [&] (const boost::uuids::uuid& x) { out << boost::uuids::to_string(x); },
        [&] (const boost::gregorian::date& x) { out << boost::gregorian::to_iso_extended_string(x); },
        [&] (const boost::posix_time::time_duration& x) { out << boost::posix_time::to_simple_string(x); },
        [&] (const boost::posix_time::ptime& x) { out << boost::posix_time::to_iso_extended_string(x) << 'Z'; },
    }, v.variant());
    return out;
}

} // namespace avro
