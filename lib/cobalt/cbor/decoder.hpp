/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef COBALT_CBOR_DECODER_HPP
#define COBALT_CBOR_DECODER_HPP

#include <vector>
#include <cobalt/cbor/error.hpp>
#include <cobalt/cbor/value.hpp>
#include <cobalt/common/bytes.hpp>
#include <cobalt/config.hpp>

namespace cobalt::cbor {
    struct decode_options {
        static constexpr size_t default_max_depth = 1024;

        // lists, maps, and tags each add a nesting level
        size_t max_depth = default_max_depth;

        static decode_options from_config(const config &cfg);
    };

    struct decode_result {
        value val {};
        // the number of bytes consumed by the decoded item
        size_t size = 0;
    };

    inline uint64_t uint_from_be(const buffer &buf)
    {
        if (buf.size() > sizeof(uint64_t)) [[unlikely]]
            throw error(fmt::format("a big-endian integer cannot be longer than 8 bytes but got {}", buf.size()));
        uint64_t x = 0;
        for (const auto b: buf) {
            x <<= 8;
            x |= b;
        }
        return x;
    }

    class decoder {
    public:
        explicit decoder(const buffer &buf, const decode_options &opts={}):
            _buf { buf }, _opts { opts }
        {
        }

        void read(value &val);

        value read()
        {
            value val {};
            read(val);
            return val;
        }

        bool eof() const noexcept
        {
            return _offset >= _buf.size();
        }

        size_t offset() const noexcept
        {
            return _offset;
        }
    private:
        struct head {
            uint8_t major = 0;
            uint8_t minor = 0;
        };

        struct depth_guard {
            depth_guard(size_t &depth, const size_t max_depth): _depth { depth }
            {
                if (_depth >= max_depth) [[unlikely]]
                    throw decode_error::max_depth_exceeded(max_depth);
                ++_depth;
            }

            ~depth_guard()
            {
                --_depth;
            }
        private:
            size_t &_depth;
        };

        const buffer _buf;
        const decode_options _opts;
        size_t _offset = 0;
        size_t _depth = 0;

        size_t _remaining() const noexcept
        {
            return _buf.size() - _offset;
        }

        uint8_t _peek() const
        {
            return _buf[_offset];
        }

        buffer _take(size_t sz);
        head _read_head();
        uint64_t _read_argument(head h);
        buffer _read_definite_bytes(head h);
        uint8_vector _read_chunks(uint8_t major);
        uint8_vector _read_bytes(head h);
        value _read_list(head h);
        value _read_map(head h);
        void _read_map_entry(cbor::map &m);
        value _read_tag(head h);
        value _read_simple(head h);
    };

    extern decode_result decode(const buffer &buf, const decode_options &opts={});
    extern std::vector<value> decode_all(const buffer &buf, const decode_options &opts={});
}

#endif // !COBALT_CBOR_DECODER_HPP
