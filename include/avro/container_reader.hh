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

#include <avro/compiler.hh>
#include <avro/io.hh>
#include <avro/schema.hh>
#include <avro/value.hh>
#include <seastar/core/do_with.hh>
#include <seastar/core/file.hh>
#include <seastar/core/future-util.hh>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace avro {

enum class codec { NULL_, DEFLATE, SNAPPY };

const char* codec_name(codec c);

struct container_header {
    std::map<std::string, bytes> metadata;
    avro::codec codec;
    bytes sync;
};

// A data block of a container file, decompressed.
struct container_block {
    int64_t record_count;
    bytes data;
};

/* Reader of avro object container files.
 * The header is read on open. The writer schema it carries is compiled once into a decoding plan,
 * which then decodes every record of every block. Blocks are read sequentially.
 */
class container_reader {
    std::string _path;
    seastar::file _file;
    std::unique_ptr<peekable_stream> _stream;
    std::unique_ptr<container_header> _header;
    std::unique_ptr<schema::schema> _writer_schema;
    std::unique_ptr<decoding_plan> _plan;
private:
    container_reader() {};
    static seastar::future<container_header> read_header(peekable_stream& stream, std::string path);
    // Reads the header and compiles the writer schema.
    seastar::future<> init();
    void finish_block(const byte_source& src, const container_block& block) const;
public:
    // The entry point to this library.
    static seastar::future<container_reader> open(std::string path);
    seastar::future<> close();
    const std::string& path() const { return _path; }
    const container_header& header() const { return *_header; }
    // The JSON text of the writer schema, as stored in the file.
    std::string writer_schema_json() const;
    const schema::schema& writer_schema() const { return *_writer_schema; }
    const decoding_plan& plan() const { return *_plan; }

    // The next data block, or nullopt at the end of the file. Verifies the sync marker after the block.
    seastar::future<std::optional<container_block>> next_block();

    // Decode all remaining records, passing each one to the consumer.
    // The consumer returns void, or stop_iteration to stop before the end of the file.
    // It is kept alive by do_with until the last block has been consumed.
    template <typename Consumer>
    seastar::future<> for_each_record(Consumer consumer) {
        return seastar::do_with(std::move(consumer), [this] (Consumer& consumer) {
            return seastar::repeat([this, &consumer] {
                return next_block().then([this, &consumer] (std::optional<container_block> block) {
                    if (!block) {
                        return seastar::stop_iteration::yes;
                    }
                    byte_source src{block->data};
                    for (int64_t i = 0; i < block->record_count; ++i) {
                        if constexpr (std::is_same_v<std::invoke_result_t<Consumer&, value>, seastar::stop_iteration>) {
                            if (consumer(_plan->decode(src)) == seastar::stop_iteration::yes) {
                                return seastar::stop_iteration::yes;
                            }
                        } else {
                            consumer(_plan->decode(src));
                        }
                    }
                    finish_block(src, *block);
                    return seastar::stop_iteration::no;
                });
            });
        });
    }
};

} // namespace avro
