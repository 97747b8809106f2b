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

#include <avro/io.hh>
#include <cassert>
#include <cstring>

namespace avro {

/* Assuming there is k bytes remaining in stream, append exactly min(k, n) bytes to the internal buffer.
 * input_stream::read_exactly discards the buffered bytes on eof instead of returning them,
 * so we loop over read_up_to ourselves.
 */
seastar::future<> peekable_stream::read_exactly(size_t n) {
    assert(_buffer.size() - _buffer_end >= n);
    if (n == 0) {
        return seastar::make_ready_future<>();
    }
    return _source.read_up_to(n).then([this, n] (seastar::temporary_buffer<char> newbuf) {
        if (newbuf.size() == 0) {
            return seastar::make_ready_future<>();
        } else {
            std::memcpy(_buffer.data() + _buffer_end, newbuf.get(), newbuf.size());
            _buffer_end += newbuf.size();
            return read_exactly(n - newbuf.size());
        }
    });
}

/* Ensure that there is at least n bytes of space after _buffer_end.
 * Rewind only when _buffer_start moves past half of the buffer, otherwise reallocate.
 * At least half of the allocated memory is in use and any given byte is rewound at most once.
 */
void peekable_stream::ensure_space(size_t n) {
    if (_buffer.size() - _buffer_end >= n) {
        return;
    } else if (_buffer.size() > n + (_buffer_end - _buffer_start) && _buffer_start > _buffer.size() / 2) {
        std::memmove(_buffer.data(), _buffer.data() + _buffer_start, _buffer_end - _buffer_start);
        _buffer_end -= _buffer_start;
        _buffer_start = 0;
    } else {
        buffer b{_buffer_end - _buffer_start + n};
        if (_buffer_end - _buffer_start > 0) {
            std::memcpy(b.data(), _buffer.data() + _buffer_start, _buffer_end - _buffer_start);
        }
        _buffer = std::move(b);
        _buffer_end -= _buffer_start;
        _buffer_start = 0;
    }
}

seastar::future<bytes_view> peekable_stream::peek(size_t n) {
    if (n == 0) {
        return seastar::make_ready_future<bytes_view>();
    } else if (_buffer_end - _buffer_start >= n) {
        return seastar::make_ready_future<bytes_view>(bytes_view{_buffer.data() + _buffer_start, n});
    } else {
        size_t bytes_needed = n - (_buffer_end - _buffer_start);
        ensure_space(bytes_needed);
        return read_exactly(bytes_needed).then([this] {
            return bytes_view{_buffer.data() + _buffer_start, _buffer_end - _buffer_start};
        });
    }
}

seastar::future<> peekable_stream::advance(size_t n) {
    if (_buffer_end - _buffer_start > n) {
        _buffer_start += n;
        return seastar::make_ready_future<>();
    } else {
        size_t remaining = n - (_buffer_end - _buffer_start);
        return _source.skip(remaining).then([this] {
            _buffer_end = 0;
            _buffer_start = 0;
        });
    }
}

seastar::future<bytes> peekable_stream::read(size_t n) {
    return peek(n).then([this, n] (bytes_view view) {
        if (view.size() < n) {
            throw decode_exception::unexpected_end(n, view.size());
        }
        bytes copy{view};
        return advance(n).then([copy = std::move(copy)] () mutable {
            return std::move(copy);
        });
    });
}

} // namespace avro
