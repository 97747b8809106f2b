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

#include <avro/exception.hh>
#include <cstdint>
#include <string>
#include <string_view>

namespace avro {

using bytes = std::basic_string<uint8_t>;
using bytes_view = std::basic_string_view<uint8_t>;
using byte = bytes::value_type;

/* A sequential, read-only cursor over a contiguous range of encoded data.
 * The source does not own the data; the range must outlive the cursor.
 * A byte_source is stateful and must not be shared between concurrent decodes.
 */
class byte_source {
    const uint8_t* _data;
    size_t _size;
    size_t _position = 0;
public:
    explicit byte_source(bytes_view data) noexcept
        : _data(data.data())
        , _size(data.size()) {}

    byte_source(const char* data, size_t size) noexcept
        : _data(reinterpret_cast<const uint8_t*>(data))
        , _size(size) {}

    // View the next n bytes and consume them. Throws if fewer than n bytes remain.
    bytes_view read(size_t n) {
        if (n > remaining()) {
            throw decode_exception::unexpected_end(n, remaining());
        }
        bytes_view result{_data + _position, n};
        _position += n;
        return result;
    }

    uint8_t read_byte() {
        if (_position == _size) {
            throw decode_exception::unexpected_end(1, 0);
        }
        return _data[_position++];
    }

    size_t position() const noexcept { return _position; }
    size_t remaining() const noexcept { return _size - _position; }
    bool eof() const noexcept { return _position == _size; }
};

} // namespace avro
