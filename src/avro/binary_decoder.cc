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

#include <avro/binary_decoder.hh>
#include <cstring>

namespace avro::binary {

namespace {

size_t read_length(byte_source& src) {
    int64_t len = read_long(src);
    if (len < 0) {
        throw decode_exception::corrupted_data(seastar::format("negative length ({})", len));
    }
    if (static_cast<uint64_t>(len) > src.remaining()) {
        throw decode_exception::unexpected_end(static_cast<size_t>(len), src.remaining());
    }
    return static_cast<size_t>(len);
}

} // namespace

bool read_boolean(byte_source& src) {
    uint8_t b = src.read_byte();
    if (b > 1) {
        throw decode_exception::corrupted_data(seastar::format("invalid boolean byte ({})", b));
    }
    return b == 1;
}

// Floats are stored little-endian, like the host.
float read_float(byte_source& src) {
    bytes_view raw = src.read(sizeof(float));
    float v;
    std::memcpy(&v, raw.data(), sizeof(v));
    return v;
}

double read_double(byte_source& src) {
    bytes_view raw = src.read(sizeof(double));
    double v;
    std::memcpy(&v, raw.data(), sizeof(v));
    return v;
}

bytes read_bytes(byte_source& src) {
    size_t len = read_length(src);
    return bytes{src.read(len)};
}

std::string read_string(byte_source& src) {
    size_t len = read_length(src);
    bytes_view raw = src.read(len);
    std::string s{reinterpret_cast<const char*>(raw.data()), raw.size()};
    if (!is_valid_utf8(s)) {
        throw decode_exception::corrupted_data("string is not valid UTF-8");
    }
    return s;
}

bytes read_fixed(byte_source& src, size_t size) {
    return bytes{src.read(size)};
}

bool is_valid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        uint8_t c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t len;
        uint32_t cp;
        if ((c & 0xe0) == 0xc0) {
            len = 2;
            cp = c & 0x1f;
        } else if ((c & 0xf0) == 0xe0) {
            len = 3;
            cp = c & 0x0f;
        } else if ((c & 0xf8) == 0xf0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > s.size()) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            uint8_t cc = s[i + k];
            if ((cc & 0xc0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3f);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)
                || (cp >= 0xd800 && cp <= 0xdfff) || cp > 0x10ffff) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace avro::binary
