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

#define BOOST_TEST_MODULE avro

#include <avro/logical.hh>
#include <boost/test/included/unit_test.hpp>
#include <limits>
#include <sstream>

using namespace avro;
namespace pt = boost::posix_time;
namespace gr = boost::gregorian;

namespace {

std::string print(const value& v) {
    std::ostringstream out;
    out << v;
    return out.str();
}

} // namespace

BOOST_AUTO_TEST_CASE(decimal_twos_complement) {
    BOOST_REQUIRE_EQUAL(logical::parse_decimal(bytes{0x00, 0x80}, 5, 0).unscaled, 128);
    BOOST_REQUIRE_EQUAL(logical::parse_decimal(bytes{0x80}, 5, 0).unscaled, -128);
    BOOST_REQUIRE_EQUAL(logical::parse_decimal(bytes{0xff, 0xff, 0xff}, 5, 0).unscaled, -1);
    BOOST_REQUIRE_EQUAL(logical::parse_decimal(bytes{}, 5, 0).unscaled, 0);

    // Wider than 64 bits: -(2^71).
    bytes wide{0xff, 0x80, 0, 0, 0, 0, 0, 0, 0, 0};
    boost::multiprecision::cpp_int expected = -(boost::multiprecision::cpp_int(1) << 71);
    BOOST_REQUIRE_EQUAL(logical::parse_decimal(wide, 38, 0).unscaled, expected);
}

BOOST_AUTO_TEST_CASE(decimal_text) {
    BOOST_REQUIRE_EQUAL((decimal{5, 3, 2}).to_string(), "0.05");
    BOOST_REQUIRE_EQUAL((decimal{-5, 3, 2}).to_string(), "-0.05");
    BOOST_REQUIRE_EQUAL((decimal{12345, 5, 0}).to_string(), "12345");
    BOOST_REQUIRE_EQUAL((decimal{100, 3, 2}).to_string(), "1.00");
    BOOST_REQUIRE_EQUAL((decimal{0, 1, 1}).to_string(), "0.0");
}

BOOST_AUTO_TEST_CASE(uuid) {
    auto u = logical::parse_uuid("f81d4fae-7dec-11d0-a765-00a0c91e6bf6");
    BOOST_REQUIRE_EQUAL(print(u), "f81d4fae-7dec-11d0-a765-00a0c91e6bf6");
    BOOST_REQUIRE_THROW(logical::parse_uuid(""), decode_exception);
    BOOST_REQUIRE_THROW(logical::parse_uuid("f81d4fae-7dec-11d0-a765"), decode_exception);
    BOOST_REQUIRE_THROW(logical::parse_uuid("z81d4fae-7dec-11d0-a765-00a0c91e6bf6"), decode_exception);
}

BOOST_AUTO_TEST_CASE(dates) {
    BOOST_REQUIRE(logical::parse_date(0) == gr::date(1970, 1, 1));
    BOOST_REQUIRE(logical::parse_date(-1) == gr::date(1969, 12, 31));
    BOOST_REQUIRE_EQUAL(print(logical::parse_date(19000)), "2022-01-08");
    BOOST_REQUIRE_THROW(logical::parse_date(std::numeric_limits<int32_t>::max()), decode_exception);
}

BOOST_AUTO_TEST_CASE(times_of_day) {
    BOOST_REQUIRE(logical::parse_time_millis(0) == pt::time_duration(0, 0, 0));
    BOOST_REQUIRE(logical::parse_time_millis(86399999) == pt::hours(24) - pt::milliseconds(1));
    BOOST_REQUIRE_THROW(logical::parse_time_millis(86400000), decode_exception);
    BOOST_REQUIRE_THROW(logical::parse_time_millis(-1), decode_exception);
    BOOST_REQUIRE(logical::parse_time_micros(1) == pt::microseconds(1));
    BOOST_REQUIRE_THROW(logical::parse_time_micros(86400000000LL), decode_exception);
    BOOST_REQUIRE_EQUAL(print(logical::parse_time_millis(45296000)), "12:34:56");
}

BOOST_AUTO_TEST_CASE(timestamps) {
    BOOST_REQUIRE(logical::parse_timestamp_millis(0) == pt::ptime(gr::date(1970, 1, 1)));
    BOOST_REQUIRE(logical::parse_timestamp_micros(1000000) == pt::ptime(gr::date(1970, 1, 1), pt::seconds(1)));
    BOOST_REQUIRE(logical::parse_timestamp_millis(-86400000) == pt::ptime(gr::date(1969, 12, 31)));
    BOOST_REQUIRE_EQUAL(print(logical::parse_timestamp_millis(1577836800000LL)), "2020-01-01T00:00:00Z");
}
