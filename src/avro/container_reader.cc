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

#include <avro/binary_decoder.hh>
#include <avro/container_reader.hh>
#include <avro/exception.hh>
#include <avro/schema_parser.hh>
#include <seastar/core/do_with.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/util/log.hh>

namespace avro {

namespace {

seastar::logger rlogger("avro_container");

constexpr size_t SYNC_SIZE = 16;
// Larger blocks are taken as corruption.
constexpr int64_t MAX_BLOCK_SIZE = int64_t(1) << 30;
const bytes MAGIC{'O', 'b', 'j', 1};

constexpr std::string_view HEADER_SCHEMA = R"({
    "type": "record", "name": "org.apache.avro.file.Header",
    "fields": [
        {"name": "magic", "type": {"type": "fixed", "name": "Magic", "size": 4}},
        {"name": "meta", "type": {"type": "map", "values": "bytes"}},
        {"name": "sync", "type": {"type": "fixed", "name": "Sync", "size": 16}}
    ]
})";

// Every header is decoded with the same plan.
const decoding_plan& header_plan() {
    static thread_local const decoding_plan plan = [] {
        schema::schema s = schema::parse_schema(HEADER_SCHEMA);
        return compile(s);
    }();
    return plan;
}

codec codec_from_name(const std::string& name) {
    if (name == "null") {
        return codec::NULL_;
    } else if (name == "deflate") {
        return codec::DEFLATE;
    } else if (name == "snappy") {
        return codec::SNAPPY;
    }
    throw avro_exception::not_implemented(seastar::format("avro.codec {}", name));
}

std::string to_string(const bytes& b) {
    return std::string(b.begin(), b.end());
}

} // namespace

const char* codec_name(codec c) {
    switch (c) {
    case codec::NULL_: return "null";
    case codec::DEFLATE: return "deflate";
    case codec::SNAPPY: return "snappy";
    }
    return "unknown";
}

seastar::future<container_header> container_reader::read_header(peekable_stream& stream, std::string path) {
    return stream.peek(MAGIC.size()).then([&stream] (bytes_view magic) {
        if (magic != bytes_view{MAGIC}) {
            throw avro_exception::corrupted_file("Magic bytes not found in header");
        }
        return read_from_stream(stream, [] (byte_source& src) {
            return header_plan().decode(src);
        });
    }).then([path = std::move(path)] (std::optional<value> decoded) {
        if (!decoded) {
            throw avro_exception::corrupted_file("Empty file");
        }
        const record_value& record = decoded->as<record_value>();
        container_header header;
        for (const auto& [key, v] : record.at("meta").as<map_value>()) {
            header.metadata.emplace(key, v.as<bytes>());
        }
        header.sync = record.at("sync").as<bytes>();
        if (!header.metadata.count("avro.schema")) {
            throw avro_exception::missing_schema(path);
        }
        auto codec_it = header.metadata.find("avro.codec");
        header.codec = codec_it == header.metadata.end() ? codec::NULL_ : codec_from_name(to_string(codec_it->second));
        rlogger.debug("Read header of {}: {} metadata entries, codec {}",
                path, header.metadata.size(), codec_name(header.codec));
        return header;
    });
}

seastar::future<> container_reader::init() {
    return read_header(*_stream, _path).then([this] (container_header header) {
        _header = std::make_unique<container_header>(std::move(header));
        _writer_schema = std::make_unique<schema::schema>(schema::parse_schema(writer_schema_json()));
        _plan = std::make_unique<decoding_plan>(compile(*_writer_schema));
    });
}

seastar::future<container_reader> container_reader::open(std::string path) {
    return seastar::open_file_dma(path, seastar::open_flags::ro).then(
    [path] (seastar::file file) {
        container_reader cr;
        cr._path = path;
        cr._file = file;
        cr._stream = std::make_unique<peekable_stream>(seastar::make_file_input_stream(file));
        return seastar::do_with(std::move(cr), [] (container_reader& cr) {
            return cr.init().then_wrapped([&cr] (seastar::future<> f) {
                if (!f.failed()) {
                    return seastar::make_ready_future<container_reader>(std::move(cr));
                }
                // Release the file before reporting the error.
                std::exception_ptr eptr = f.get_exception();
                return cr.close().then_wrapped([eptr] (seastar::future<> closed) {
                    closed.ignore_ready_future();
                    return seastar::make_exception_future<container_reader>(eptr);
                });
            });
        });
    }).handle_exception([path = std::move(path)] (std::exception_ptr eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            return seastar::make_exception_future<container_reader>(avro_exception(seastar::format(
                    "Could not open avro file {} for reading: {}", path, e.what())));
        }
    });
}

seastar::future<> container_reader::close() {
    return _stream->close().then([this] {
        return _file.close();
    });
}

std::string container_reader::writer_schema_json() const {
    return to_string(_header->metadata.at("avro.schema"));
}

seastar::future<std::optional<container_block>> container_reader::next_block() {
    return read_from_stream(*_stream, [] (byte_source& src) {
        int64_t record_count = binary::read_long(src);
        int64_t size = binary::read_long(src);
        return std::make_pair(record_count, size);
    }).then([this] (std::optional<std::pair<int64_t, int64_t>> block_header) {
        if (!block_header) {
            return seastar::make_ready_future<std::optional<container_block>>();
        }
        auto [record_count, size] = *block_header;
        if (record_count < 0 || size < 0) {
            throw avro_exception::corrupted_file(seastar::format(
                    "Negative block header (count {}, size {}B) in {}", record_count, size, _path));
        }
        if (size > MAX_BLOCK_SIZE) {
            throw avro_exception::corrupted_file(seastar::format(
                    "Block size {}B exceeds the limit of {}B in {}", size, MAX_BLOCK_SIZE, _path));
        }
        rlogger.debug("Reading block of {} records, {}B", record_count, size);
        return _stream->read(size + SYNC_SIZE).then([this, record_count] (bytes raw) {
            bytes_view data{raw.data(), raw.size() - SYNC_SIZE};
            if (bytes_view{raw.data() + data.size(), SYNC_SIZE} != bytes_view{_header->sync}) {
                throw avro_exception::corrupted_file(seastar::format("Sync marker mismatch in {}", _path));
            }
            container_block block{record_count, {}};
            switch (_header->codec) {
            case codec::NULL_:
                block.data = bytes{data};
                break;
            case codec::DEFLATE:
                block.data = compression::deflate_decompress(data);
                break;
            case codec::SNAPPY:
                block.data = compression::snappy_decompress(data);
                break;
            }
            return std::optional<container_block>{std::move(block)};
        });
    });
}

void container_reader::finish_block(const byte_source& src, const container_block& block) const {
    if (!src.eof()) {
        rlogger.warn("{}B of trailing data after {} records of a block in {}",
                src.remaining(), block.record_count, _path);
    }
}

} // namespace avro
