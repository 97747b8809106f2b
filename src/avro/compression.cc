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

#include "compression.hh"
#include <avro/exception.hh>
#include <boost/crc.hpp>
#include <snappy.h>
#include <zlib.h>
#include <algorithm>

namespace avro::compression {

bytes snappy_decompress(bytes_view input) {
    if (input.size() < 4) {
        throw avro_exception::corrupted_file(seastar::format(
                "snappy block too small ({}B) to hold a checksum", input.size()));
    }
    const char* compressed = reinterpret_cast<const char*>(input.data());
    size_t compressed_len = input.size() - 4;
    size_t decompressed_size;
    if (!snappy::GetUncompressedLength(compressed, compressed_len, &decompressed_size)) {
        throw avro_exception::corrupted_file("Corrupt snappy-compressed data");
    }
    bytes output(decompressed_size, 0);
    if (!snappy::RawUncompress(compressed, compressed_len, reinterpret_cast<char*>(output.data()))) {
        throw avro_exception::corrupted_file("Could not decompress snappy");
    }

    const uint8_t* trailer = input.data() + compressed_len;
    uint32_t expected = (uint32_t(trailer[0]) << 24) | (uint32_t(trailer[1]) << 16)
            | (uint32_t(trailer[2]) << 8) | uint32_t(trailer[3]);
    boost::crc_32_type crc;
    crc.process_bytes(output.data(), output.size());
    if (crc.checksum() != expected) {
        throw avro_exception::corrupted_file(seastar::format(
                "snappy block checksum mismatch (expected {:#010x}, computed {:#010x})", expected, crc.checksum()));
    }
    return output;
}

bytes deflate_decompress(bytes_view input) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    // Negative window bits: raw deflate, no header or trailer.
    constexpr int WINDOW_BITS = -15;
    if (inflateInit2(&stream, WINDOW_BITS) != Z_OK) {
        throw avro_exception(seastar::format("Could not initialize inflate: {}", stream.msg ? stream.msg : ""));
    }

    bytes output(std::max<size_t>(input.size() * 2, 64), 0);
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    int err;
    do {
        if (stream.total_out == output.size()) {
            output.resize(output.size() * 2);
        }
        stream.next_out = output.data() + stream.total_out;
        stream.avail_out = static_cast<uInt>(output.size() - stream.total_out);
        err = inflate(&stream, Z_NO_FLUSH);
    } while (err == Z_OK);

    size_t total_out = stream.total_out;
    inflateEnd(&stream);
    if (err != Z_STREAM_END) {
        throw avro_exception::corrupted_file(seastar::format("Could not inflate deflate block (zlib error {})", err));
    }
    output.resize(total_out);
    return output;
}

} // namespace avro::compression
