/* This file is part of Cobalt, derived from Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <cobalt/cbor/decoder.hpp>
#include <cobalt/cbor/float16.hpp>

namespace cobalt::cbor {
    decode_options decode_options::from_config(const config &cfg)
    {
        decode_options opts {};
        if (const auto max_depth = cfg.get_uint("maxDepth"); max_depth) {
            if (*max_depth == 0)
                throw error("config element maxDepth must be greater than zero!");
            opts.max_depth = *max_depth;
        }
        return opts;
    }

    void decoder::read(value &val)
    {
        if (eof())
            throw decode_error::unexpected_end_of_payload();
        const auto h = _read_head();
        switch (h.major) {
            case 0:
                val = value { unsigned_int { _read_argument(h) } };
                break;
            case 1:
                val = value { negative_int { _read_argument(h) } };
                break;
            case 2:
                val = value { _read_bytes(h) };
                break;
            case 3:
                val = value { text_string { _read_bytes(h).str() } };
                break;
            case 4:
                val = _read_list(h);
                break;
            case 5:
                val = _read_map(h);
                break;
            case 6:
                val = _read_tag(h);
                break;
            case 7:
                val = _read_simple(h);
                break;
            default:
                throw error(fmt::format("internal error: reached an impossible state at byte {}", _offset));
        }
    }

    buffer decoder::_take(const size_t sz)
    {
        const auto res = _buf.subbuf(_offset, sz);
        _offset += sz;
        return res;
    }

    decoder::head decoder::_read_head()
    {
        if (eof()) [[unlikely]]
            throw decode_error::unexpected_end_of_payload();
        const uint8_t hdr = _buf[_offset++];
        return { static_cast<uint8_t>(hdr >> 5), static_cast<uint8_t>(hdr & 0x1F) };
    }

    uint64_t decoder::_read_argument(const head h)
    {
        switch (h.minor) {
            case 24:
            case 25:
            case 26:
            case 27: {
                const size_t len = size_t { 1 } << (h.minor - 24);
                if (_remaining() < len)
                    throw decode_error::argument_too_short(len);
                return uint_from_be(_take(len));
            }
            case 28:
            case 29:
            case 30:
            // indefinite lengths are handled by the callers that permit them
            case 31:
                throw decode_error::invalid_minor_value(h.minor);
            default:
                return h.minor;
        }
    }

    buffer decoder::_read_definite_bytes(const head h)
    {
        const auto len = _read_argument(h);
        if (_remaining() < len)
            throw decode_error::content_too_short(len);
        return _take(len);
    }

    uint8_vector decoder::_read_chunks(const uint8_t major)
    {
        uint8_vector res {};
        for (;;) {
            if (eof())
                throw decode_error::expected_break_marker();
            if (_peek() == 0xFF) {
                ++_offset;
                break;
            }
            const auto ch = _read_head();
            if (ch.major != major)
                throw decode_error::unexpected_major_in_indefinite(ch.major);
            if (ch.minor == 31)
                throw decode_error::nested_indefinite();
            try {
                res << _read_definite_bytes(ch);
            } catch (const decode_error &ex) {
                throw decode_error::nested(ex);
            }
        }
        return res;
    }

    uint8_vector decoder::_read_bytes(const head h)
    {
        if (h.minor == 31)
            return _read_chunks(h.major);
        return _read_definite_bytes(h);
    }

    value decoder::_read_list(const head h)
    {
        depth_guard dg { _depth, _opts.max_depth };
        cbor::list items {};
        if (h.minor == 31) {
            for (;;) {
                if (eof())
                    throw decode_error::expected_break_marker();
                if (_peek() == 0xFF) {
                    ++_offset;
                    break;
                }
                read(items.emplace_back());
            }
        } else {
            const auto sz = _read_argument(h);
            // each item takes at least one byte
            items.reserve(std::min(sz, uint64_t { _remaining() }));
            for (uint64_t i = 0; i < sz; ++i)
                read(items.emplace_back());
        }
        return value { std::move(items) };
    }

    void decoder::_read_map_entry(cbor::map &m)
    {
        const auto kh = _read_head();
        if (kh.major != 3)
            throw decode_error::unexpected_major_for_map_key(kh.major);
        std::string key { _read_bytes(kh).str() };
        value val {};
        read(val);
        m.insert_or_assign(std::move(key), std::move(val));
    }

    value decoder::_read_map(const head h)
    {
        depth_guard dg { _depth, _opts.max_depth };
        cbor::map m {};
        if (h.minor == 31) {
            for (;;) {
                if (eof())
                    throw decode_error::expected_break_marker();
                if (_peek() == 0xFF) {
                    ++_offset;
                    break;
                }
                _read_map_entry(m);
            }
        } else {
            const auto sz = _read_argument(h);
            for (uint64_t i = 0; i < sz; ++i)
                _read_map_entry(m);
        }
        return value { std::move(m) };
    }

    value decoder::_read_tag(const head h)
    {
        const auto id = _read_argument(h);
        depth_guard dg { _depth, _opts.max_depth };
        auto item = std::make_unique<value>();
        read(*item);
        return value { cbor::tag { id, std::move(item) } };
    }

    value decoder::_read_simple(const head h)
    {
        switch (h.minor) {
            case 20: return value { boolean { false } };
            case 21: return value { boolean { true } };
            case 22: return value { null {} };
            case 23: return value { undefined {} };
            case 25:
                if (_remaining() < 2)
                    throw decode_error::incomplete_float(16);
                return value { float32 { float16_to_float32_bits(static_cast<uint16_t>(uint_from_be(_take(2)))) } };
            case 26:
                if (_remaining() < 4)
                    throw decode_error::incomplete_float(32);
                return value { float32 { static_cast<uint32_t>(uint_from_be(_take(4))) } };
            case 27:
                if (_remaining() < 8)
                    throw decode_error::incomplete_float(64);
                return value { float64 { uint_from_be(_take(8)) } };
            default:
                throw decode_error::invalid_minor_value(h.minor);
        }
    }

    decode_result decode(const buffer &buf, const decode_options &opts)
    {
        decoder dec { buf, opts };
        decode_result res {};
        dec.read(res.val);
        res.size = dec.offset();
        return res;
    }

    std::vector<value> decode_all(const buffer &buf, const decode_options &opts)
    {
        decoder dec { buf, opts };
        std::vector<value> items {};
        while (!dec.eof())
            items.emplace_back(dec.read());
        return items;
    }
}
