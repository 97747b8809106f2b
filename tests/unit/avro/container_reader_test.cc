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

#include "encoder.hh"

#include <avro/container_reader.hh>
#include <avro/exception.hh>
#include <avro/schema_parser.hh>
#include <seastar/core/smp.hh>
#include <seastar/core/thread.hh>
#include <seastar/testing/thread_test_case.hh>
#include <boost/crc.hpp>
#include <snappy.h>
#include <zlib.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <memory>
#include <unistd.h>
#include <vector>

using namespace avro;
using avro::testing::encoder;
using avro::testing::to_bytes;

namespace {

constexpr auto record_schema = R"({
    "type": "record", "name": "Event", "namespace": "test",
    "fields": [
        {"name": "id", "type": "long"},
        {"name": "tag", "type": ["null", "string"]}
    ]
})";

const bytes sync_marker{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15};

// A file in /tmp, removed when the object goes out of scope.
class temporary_file {
    std::string _path;
public:
    explicit temporary_file(const bytes& contents) {
        char name[] = "/tmp/avro_container_XXXXXX";
        int fd = ::mkstemp(name);
        BOOST_REQUIRE(fd >= 0);
        ::close(fd);
        _path = name;
        std::ofstream out(_path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(contents.data()), contents.size());
        BOOST_REQUIRE(out.good());
    }
    ~temporary_file() {
        std::remove(_path.c_str());
    }
    const std::string& path() const { return _path; }
};

bytes snappy_compress(const bytes& data) {
    std::string compressed;
    snappy::Compress(reinterpret_cast<const char*>(data.data()), data.size(), &compressed);
    boost::crc_32_type crc;
    crc.process_bytes(data.data(), data.size());
    uint32_t c = crc.checksum();
    bytes out = to_bytes(compressed);
    out.append({uint8_t(c >> 24), uint8_t(c >> 16), uint8_t(c >> 8), uint8_t(c)});
    return out;
}

bytes deflate_compress(const bytes& data) {
    z_stream stream{};
    BOOST_REQUIRE_EQUAL(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY), Z_OK);
    bytes out(deflateBound(&stream, data.size()), 0);
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = data.size();
    stream.next_out = out.data();
    stream.avail_out = out.size();
    BOOST_REQUIRE_EQUAL(deflate(&stream, Z_FINISH), Z_STREAM_END);
    out.resize(stream.total_out);
    deflateEnd(&stream);
    return out;
}

struct block_fixture {
    int64_t count;
    bytes data;
};

bytes encode_events(int64_t first_id, int64_t count) {
    encoder e;
    for (int64_t id = first_id; id < first_id + count; ++id) {
        e.write_long(id);
        if (id % 2) {
            e.write_long(1).write_string("event-" + std::to_string(id));
        } else {
            e.write_long(0);
        }
    }
    return e.release();
}

bytes container_file(const std::vector<std::pair<std::string, bytes>>& metadata,
        const std::vector<block_fixture>& blocks, const std::string& codec = "null") {
    encoder e;
    e.write_raw({'O', 'b', 'j', 1});
    e.write_long(metadata.size());
    for (const auto& [key, v] : metadata) {
        e.write_string(key).write_bytes(v);
    }
    e.write_long(0);
    e.write_fixed(sync_marker);
    for (const block_fixture& b : blocks) {
        bytes data = codec == "snappy" ? snappy_compress(b.data)
                : codec == "deflate" ? deflate_compress(b.data)
                : b.data;
        e.write_long(b.count).write_long(data.size()).write_fixed(data).write_fixed(sync_marker);
    }
    return e.release();
}

bytes events_file(const std::string& codec, std::vector<std::pair<std::string, bytes>> extra_metadata = {}) {
    std::vector<std::pair<std::string, bytes>> metadata{{"avro.schema", to_bytes(record_schema)}};
    if (codec != "null") {
        metadata.emplace_back("avro.codec", to_bytes(codec));
    }
    for (auto& entry : extra_metadata) {
        metadata.push_back(std::move(entry));
    }
    return container_file(metadata, {{3, encode_events(0, 3)}, {0, {}}, {2, encode_events(3, 2)}}, codec);
}

std::vector<value> read_all(container_reader& reader) {
    std::vector<value> records;
    reader.for_each_record([&records] (value v) {
        records.push_back(std::move(v));
    }).get();
    return records;
}

void check_events(const std::vector<value>& records, int64_t count) {
    BOOST_REQUIRE_EQUAL(records.size(), size_t(count));
    for (int64_t id = 0; id < count; ++id) {
        const record_value& r = records[id].as<record_value>();
        BOOST_REQUIRE_EQUAL(r.at("id").as<int64_t>(), id);
        if (id % 2) {
            BOOST_REQUIRE_EQUAL(r.at("tag").as<std::string>(), "event-" + std::to_string(id));
        } else {
            BOOST_REQUIRE(r.at("tag").is_null());
        }
    }
}

// Runs f and returns the message of the avro_exception it throws.
template <typename Func>
std::string error_message(Func f) {
    try {
        f();
    } catch (const avro_exception& e) {
        return e.what();
    }
    BOOST_FAIL("expected avro_exception");
    return {};
}

} // namespace

SEASTAR_THREAD_TEST_CASE(read_uncompressed_container) {
    temporary_file tf{events_file("null")};
    container_reader reader = container_reader::open(tf.path()).get0();
    BOOST_REQUIRE(reader.header().codec == codec::NULL_);
    BOOST_REQUIRE(reader.header().sync == sync_marker);
    BOOST_REQUIRE_EQUAL(reader.writer_schema_json(), record_schema);
    BOOST_REQUIRE(reader.writer_schema().named_types.count("test.Event"));
    check_events(read_all(reader), 5);
    BOOST_REQUIRE(!reader.next_block().get0());
    reader.close().get();
}

SEASTAR_THREAD_TEST_CASE(read_compressed_containers) {
    for (const char* codec : {"deflate", "snappy"}) {
        BOOST_TEST_CONTEXT(codec) {
            temporary_file tf{events_file(codec)};
            container_reader reader = container_reader::open(tf.path()).get0();
            BOOST_REQUIRE_EQUAL(codec_name(reader.header().codec), codec);
            check_events(read_all(reader), 5);
            reader.close().get();
        }
    }
}

SEASTAR_THREAD_TEST_CASE(read_blocks) {
    temporary_file tf{events_file("snappy")};
    container_reader reader = container_reader::open(tf.path()).get0();
    std::optional<container_block> block = reader.next_block().get0();
    BOOST_REQUIRE(block);
    BOOST_REQUIRE_EQUAL(block->record_count, 3);
    BOOST_REQUIRE(block->data == encode_events(0, 3));
    block = reader.next_block().get0();
    BOOST_REQUIRE(block && block->record_count == 0);
    block = reader.next_block().get0();
    BOOST_REQUIRE(block && block->record_count == 2);
    BOOST_REQUIRE(!reader.next_block().get0());
    reader.close().get();
}

SEASTAR_THREAD_TEST_CASE(large_header) {
    // Forces the header to be read in several attempts.
    bytes big(20000, 'x');
    temporary_file tf{events_file("null", {{"user.comment", big}})};
    container_reader reader = container_reader::open(tf.path()).get0();
    BOOST_REQUIRE(reader.header().metadata.at("user.comment") == big);
    check_events(read_all(reader), 5);
    reader.close().get();
}

SEASTAR_THREAD_TEST_CASE(stop_early) {
    temporary_file tf{events_file("null")};
    container_reader reader = container_reader::open(tf.path()).get0();
    int64_t seen = 0;
    reader.for_each_record([&seen] (value) {
        return ++seen == 2 ? seastar::stop_iteration::yes : seastar::stop_iteration::no;
    }).get();
    BOOST_REQUIRE_EQUAL(seen, 2);
    reader.close().get();
}

SEASTAR_THREAD_TEST_CASE(consumer_owns_its_state) {
    // The consumer is moved into the reader and must stay alive across every block.
    temporary_file tf{events_file("snappy")};
    container_reader reader = container_reader::open(tf.path()).get0();
    auto ids = std::make_shared<std::vector<int64_t>>();
    reader.for_each_record([ids, seen = std::vector<int64_t>{}] (value v) mutable {
        seen.push_back(v.as<record_value>().at("id").as<int64_t>());
        *ids = seen;
    }).get();
    BOOST_REQUIRE((*ids == std::vector<int64_t>{0, 1, 2, 3, 4}));
    reader.close().get();
}

SEASTAR_THREAD_TEST_CASE(missing_writer_schema) {
    temporary_file tf{container_file({{"avro.codec", to_bytes("null")}}, {{3, encode_events(0, 3)}})};
    std::string msg = error_message([&] { container_reader::open(tf.path()).get(); });
    BOOST_REQUIRE(msg.find("No writer schema") != std::string::npos);
}

SEASTAR_THREAD_TEST_CASE(unsupported_codec) {
    temporary_file tf{container_file({{"avro.schema", to_bytes(R"("long")")}, {"avro.codec", to_bytes("bzip2")}}, {})};
    std::string msg = error_message([&] { container_reader::open(tf.path()).get(); });
    BOOST_REQUIRE(msg.find("Not implemented") != std::string::npos);
}

SEASTAR_THREAD_TEST_CASE(not_a_container) {
    temporary_file tf{to_bytes("PAR1 certainly not avro")};
    std::string msg = error_message([&] { container_reader::open(tf.path()).get(); });
    BOOST_REQUIRE(msg.find("Magic bytes") != std::string::npos);
}

SEASTAR_THREAD_TEST_CASE(corrupted_sync_marker) {
    bytes file = events_file("null");
    file.back() ^= 0xff;
    temporary_file tf{file};
    container_reader reader = container_reader::open(tf.path()).get0();
    BOOST_REQUIRE(reader.next_block().get0());
    BOOST_REQUIRE(reader.next_block().get0());
    BOOST_REQUIRE_THROW(reader.next_block().get(), avro_exception);
    reader.close().get();
}

SEASTAR_THREAD_TEST_CASE(truncated_block) {
    bytes file = events_file("null");
    file.resize(file.size() - 20);
    temporary_file tf{file};
    container_reader reader = container_reader::open(tf.path()).get0();
    BOOST_REQUIRE_THROW(read_all(reader), decode_exception);
    reader.close().get();
}

SEASTAR_THREAD_TEST_CASE(oversized_block) {
    std::vector<std::pair<std::string, bytes>> metadata{{"avro.schema", to_bytes(record_schema)}};
    encoder e;
    e.append(container_file(metadata, {}));
    e.write_long(1).write_long(std::numeric_limits<int64_t>::max());
    temporary_file tf{e.release()};
    container_reader reader = container_reader::open(tf.path()).get0();
    std::string msg = error_message([&] { reader.next_block().get(); });
    BOOST_REQUIRE(msg.find("exceeds the limit") != std::string::npos);
    reader.close().get();
}

SEASTAR_THREAD_TEST_CASE(corrupted_snappy_checksum) {
    std::vector<std::pair<std::string, bytes>> metadata{
            {"avro.schema", to_bytes(record_schema)}, {"avro.codec", to_bytes("snappy")}};
    bytes file = container_file(metadata, {{3, encode_events(0, 3)}}, "snappy");
    // The last checksum byte sits right before the trailing sync marker.
    file[file.size() - sync_marker.size() - 1] ^= 0xff;
    temporary_file tf{file};
    container_reader reader = container_reader::open(tf.path()).get0();
    std::string msg = error_message([&] { reader.next_block().get(); });
    BOOST_REQUIRE(msg.find("checksum") != std::string::npos);
    reader.close().get();
}

SEASTAR_THREAD_TEST_CASE(decode_on_all_shards) {
    // One plan shared by every shard, each with its own byte source.
    const decoding_plan plan = compile(schema::parse_schema(record_schema));
    const bytes encoded = encode_events(0, 50);
    seastar::smp::invoke_on_all([&plan, &encoded] {
        byte_source src{encoded};
        for (int64_t id = 0; id < 50; ++id) {
            BOOST_REQUIRE_EQUAL(plan.decode(src).as<record_value>().at("id").as<int64_t>(), id);
        }
        BOOST_REQUIRE(src.eof());
    }).get();

    // One reader per shard.
    temporary_file tf{events_file("deflate")};
    seastar::smp::invoke_on_all([path = tf.path()] {
        return seastar::async([path] {
            container_reader reader = container_reader::open(path).get0();
            check_events(read_all(reader), 5);
            reader.close().get();
        });
    }).get();
}
