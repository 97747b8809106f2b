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

#include <avro/logical.hh>
#include <boost/uuid/string_generator.hpp>

namespace avro::logical {

namespace {

const boost::gregorian::date epoch_date{1970, 1, 1};
const boost::posix_time::ptime epoch{epoch_date};

constexpr int64_t millis_per_day = 24LL * 60 * 60 * 1000;
constexpr int64_t micros_per_day = millis_per_day * 1000;

// Boost dates span 1400-01-01 to 9999-12-31.
const int64_t min_day = (boost::gregorian::date(boost::date_time::min_date_time) - epoch_date).days();
const int64_t max_day = (boost::gregorian::date(boost::date_time::max_date_time) - epoch_date).days();
const int64_t min_micros = min_day * micros_per_day;
const int64_t max_micros = (max_day + 1) * micros_per_day - 1;

boost::posix_time::ptime timestamp(int64_t micros, const char* type, int64_t raw) {
    if (micros < min_micros || micros > max_micros) {
        throw decode_exception::corrupted_data(seastar::format("{} {} out of range", type, raw));
    }
    return epoch + boost::posix_time::microseconds(micros);
}

} // namespace

decimal parse_decimal(bytes_view raw, int32_t precision, int32_t scale) {
    boost::multiprecision::cpp_int unscaled;
    if (!raw.empty()) {
        import_bits(unscaled, raw.begin(), raw.end(), 8);
        if (raw[0] & 0x80) {
            unscaled -= boost::multiprecision::cpp_int(1) << (8 * raw.size());
        }
    }
    return decimal{std::move(unscaled), precision, scale};
}

boost::uuids::uuid parse_uuid(std::string_view text) {
    try {
        return boost::uuids::string_generator{}(text.begin(), text.end());
    } catch (const std::runtime_error&) {
        throw decode_exception::corrupted_data(seastar::format("invalid uuid \"{}\"", text));
    }
}

boost::gregorian::date parse_date(int32_t days) {
    if (days < min_day || days > max_day) {
        throw decode_exception::corrupted_data(seastar::format("date {} days from epoch out of range", days));
    }
    return epoch_date + boost::gregorian::days(days);
}

boost::posix_time::time_duration parse_time_millis(int32_t millis) {
    if (millis < 0 || millis >= millis_per_day) {
        throw decode_exception::corrupted_data(seastar::format("time-millis {} out of range", millis));
    }
    return boost::posix_time::milliseconds(millis);
}

boost::posix_time::time_duration parse_time_micros(int64_t micros) {
    if (micros < 0 || micros >= micros_per_day) {
        throw decode_exception::corrupted_data(seastar::format("time-micros {} out of range", micros));
    }
    return boost::posix_time::microseconds(micros);
}

boost::posix_time::ptime parse_timestamp_millis(int64_t millis) {
    if (millis < min_micros / 1000 || millis > max_micros / 1000) {
        throw decode_exception::corrupted_data(seastar::format("timestamp-millis {} out of range", millis));
    }
    return timestamp(millis * 1000, "timestamp-millis", millis);
}

boost::posix_time::ptime parse_timestamp_micros(int64_t micros) {
    return timestamp(micros, "timestamp-micros", micros);
}

} // namespace avro::logical
