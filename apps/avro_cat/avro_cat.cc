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

#include <avro/container_reader.hh>
#include <seastar/core/app-template.hh>
#include <seastar/core/do_with.hh>
#include <seastar/core/reactor.hh>
#include <iostream>

using namespace seastar;

using std::cerr;
using std::cout;
using std::endl;

namespace {

// Prints the records of the file, one per line, up to limit records (0 means all).
future<> print_records(avro::container_reader& reader, uint64_t limit) {
    return do_with(uint64_t(0), [&reader, limit] (uint64_t& printed) {
        return reader.for_each_record([&printed, limit] (avro::value v) {
            if (limit && printed == limit) {
                return stop_iteration::yes;
            }
            cout << v << "\n";
            ++printed;
            return stop_iteration::no;
        });
    }).then([] {
        cout << std::flush;
    });
}

future<> cat(std::string path, uint64_t limit, bool schema_only) {
    return avro::container_reader::open(path).then([limit, schema_only] (avro::container_reader reader) {
        return do_with(std::move(reader), [limit, schema_only] (avro::container_reader& reader) {
            auto printed = schema_only
                    ? make_ready_future<>().then([&reader] { cout << reader.writer_schema_json() << endl; })
                    : print_records(reader, limit);
            return printed.finally([&reader] {
                return reader.close();
            });
        });
    });
}

}

int main(int argc, char** argv) {
    app_template app;
    namespace bpo = boost::program_options;
    app.add_options()
        ("file,f", bpo::value<std::string>()->required(), "avro object container file to read")
        ("limit,n", bpo::value<uint64_t>()->default_value(0), "print at most this many records (0 for all)")
        ("schema", bpo::bool_switch()->default_value(false), "print the writer schema and exit");

    try {
        return app.run(argc, argv, [&app] {
            auto& args = app.configuration();
            return cat(args["file"].as<std::string>(), args["limit"].as<uint64_t>(), args["schema"].as<bool>())
                    .then([] { return 0; })
                    .handle_exception([] (std::exception_ptr e) {
                cerr << "An error occurred: " << e << endl;
                return 1;
            });
        });
    } catch(...) {
        cerr << "Couldn't start application: " << std::current_exception() << "\n";
        return 1;
    }
}
