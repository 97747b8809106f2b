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

#include <avro/binary_decoder.hh>

namespace avro {

/* Arrays and maps are encoded as a series of blocks. Each block starts with a long item count
 * and a zero count ends the series. A negative count -n means n items, preceded by a long
 * holding the byte size of the block. We always decode the items, so the size is read and dropped.
 * read_item is called once per item, in encoding order, and must consume exactly one item.
 */
template <typename ReadItem>
void for_each_block_item(byte_source& src, ReadItem&& read_item) {
    int64_t count = binary::read_long(src);
    while (count != 0) {
        if (count < 0) {
            if (count == std::numeric_limits<int64_t>::min()) {
                throw decode_exception::corrupted_data("block item count out of range");
            }
            count = -count;
            binary::read_long(src);
        }
        for (int64_t i = 0; i < count; ++i) {
            read_item();
        }
        count = binary::read_long(src);
    }
}

} // namespace avro
