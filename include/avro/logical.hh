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

#include <avro/value.hh>

// Parsers turning the physical value of a logical type into its logical value.
// They run at decode time and throw decode_exception on malformed content.
namespace avro::logical {

// Big-endian two's complement unscaled integer.
decimal parse_decimal(bytes_view raw, int32_t precision, int32_t scale);
// Canonical textual form, e.g. 4fb8c1a2-36a0-4f5e-8e9c-1b9a0c2d3e4f.
boost::uuids::uuid parse_uuid(std::string_view text);
// Days since 1970-01-01.
boost::gregorian::date parse_date(int32_t days);
// Time of day since midnight.
boost::posix_time::time_duration parse_time_millis(int32_t millis);
boost::posix_time::time_duration parse_time_micros(int64_t micros);
// Instants since 1970-01-01T00:00:00Z.
boost::posix_time::ptime parse_timestamp_millis(int64_t millis);
boost::posix_time::ptime parse_timestamp_micros(int64_t micros);

} // namespace avro::logical
