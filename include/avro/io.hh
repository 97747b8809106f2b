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
#include <avro/exception.hh>
#include <seastar/core/bitops.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/print.hh>
#include <memory>
#include <optional>
#include <type_traits>

namespace avro {

/* A dynamically sized buffer. Rounds up the size given in constructor to a power of 2.
 */
class buffer {
    size_t _size;
    std::unique_ptr<uint8_t[]> _data;
    static constexpr inline uint64_t next_power_of_2(uint64_t n) {
        if (n < 2) return n;
        return 1ull << seastar::log2ceil(n);
    }
public:
    explicit buffer(size_t size = 0)
        : _size(next_power_of_2(size))
        , _data(new uint8_t[_size]) {}
    uint8_t* data() { return _data.get(); }
    size_t size() const { return _size; }
};

/* Block headers (and the file header) in an avro container are variable-length and
 * their size is only known once they are decoded. We read optimistically and keep the leftovers
 * contiguous with the next read. peekable_stream takes care of that.
 */
class peekable_stream {
    seastar::input_stream<char> _source;
    buffer _buffer;
    size_t _buffer_start = 0;
    size_t _buffer_end = 0;
private:
    void ensure_space(size_t n);
    seastar::future<> read_exactly(size_t n);
public:
    explicit peekable_stream(seastar::input_stream<char>&& source)
        : _source{std::move(source)} {};

    // Assuming there is k bytes remaining in stream, view the next unconsumed min(k, n) bytes.
    seastar::future<bytes_view> peek(size_t n);
    // Consume n bytes. If there is less than n bytes in stream, throw.
    seastar::future<> advance(size_t n);
    // Copy out and consume exactly n bytes. Throws decode_exception if the stream ends first.
    seastar::future<bytes> read(size_t n);
    seastar::future<> close() { return _source.close(); }
};

/* Decode (and consume from the stream) a single object, whose encoded size is not known up front.
 * decode is called with a byte_source over the peeked bytes and must return the decoded object.
 * Return nullopt if the stream is empty.
 */
template <typename Decode>
auto read_from_stream(
        peekable_stream& stream,
        Decode decode,
        size_t expected_size = 1024,
        size_t max_allowed_size = 1024 * 1024 * 16
) -> seastar::future<std::optional<std::invoke_result_t<Decode&, byte_source&>>> {
    using result_type = std::optional<std::invoke_result_t<Decode&, byte_source&>>;
    if (expected_size > max_allowed_size) {
        return seastar::make_exception_future<result_type>(avro_exception::corrupted_file(seastar::format(
                "max allowed size of {}B exceeded while decoding", max_allowed_size)));
    }
    return stream.peek(expected_size).then(
    [&stream, decode = std::move(decode), expected_size, max_allowed_size] (bytes_view peek) mutable {
        if (peek.empty()) {
            return seastar::make_ready_future<result_type>();
        }
        byte_source src{peek};
        result_type result;
        try {
            result = decode(src);
        } catch (const decode_exception& e) {
            if (e.end_of_input()) {
                // The encoded object was bigger than expected. Retry with a bigger expectation.
                if (peek.size() < expected_size) {
                    throw decode_exception(seastar::format(
                            "Unexpected end of stream at {}B: {}", peek.size(), e.what()));
                }
                return read_from_stream(stream, std::move(decode), expected_size * 2, max_allowed_size);
            }
            throw;
        }
        return stream.advance(src.position()).then([result = std::move(result)] () mutable {
            return std::move(result);
        });
    });
}

} // namespace avro
