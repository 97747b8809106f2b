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
#include <limits>

// Decoders of the primitive types of the avro binary encoding.
// Each one consumes exactly one encoded value from the source.
namespace avro::binary {

// Zig-zag encoded variable-length integer, at most 10 bytes.
inline int64_t read_long(byte_source& src) {
    uint64_t n = 0;
    int shift = 0;
    uint8_t b;
    do {
        if (shift >= 70) {
            throw decode_exception::corrupted_data("variable-length integer longer than 10 bytes");
        }
        b = src.read_byte();
        // The tenth byte carries only the top bit.
        if (shift == 63 && (b & 0x7e)) {
            throw decode_exception::corrupted_data("variable-length integer overflows 64 bits");
        }
        n |= static_cast<uint64_t>(b & 0x7f) << shift;
        shift += 7;
    } while (b & 0x80);
    return static_cast<int64_t>(n >> 1) ^ -static_cast<int64_t>(n & 1);
}

inline int32_t read_int(byte_source& src) {
    int64_t n = read_long(src);
    if (n < std::numeric_limits<int32_t>::min() || n > std::numeric_limits<int32_t>::max()) {
        throw decode_exception::corrupted_data(seastar::format("int value {} out of range", n));
    }
    return static_cast<int32_t>(n);
}

inline void read_null(byte_source&) {}

bool read_boolean(byte_source& src);
float read_float(byte_source& src);
double read_double(byte_source& src);
bytes read_bytes(byte_source& src);
std::string read_string(byte_source& src);
bytes read_fixed(byte_source& src, size_t size);

// Returns false unless the range holds well-formed UTF-8.
bool is_valid_utf8(std::string_view s);

} // namespace avro::binary
