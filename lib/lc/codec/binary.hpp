/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_CODEC_BINARY_HPP
#define LEDGER_CORE_CODEC_BINARY_HPP

#include <limits>
#include <lc/array.hpp>

namespace ledger_core::codec {
    // malformed or truncated input; never leaves a partially decoded value behind
    struct decode_error: error {
        using error::error;
    };

    // Big-endian fixed-width encoder producing the canonical wire representation
    struct encoder {
        encoder &u8(const uint8_t v)
        {
            _data << v;
            return *this;
        }

        encoder &u16(const uint16_t v)
        {
            return _uint(v);
        }

        encoder &u32(const uint32_t v)
        {
            return _uint(v);
        }

        encoder &u64(const uint64_t v)
        {
            return _uint(v);
        }

        encoder &bytes(const buffer b)
        {
            _data << b;
            return *this;
        }

        // a byte string prefixed with its u16 length
        encoder &short_bytes(const buffer b)
        {
            if (b.size() > std::numeric_limits<uint16_t>::max()) [[unlikely]]
                throw error(fmt::format("a short byte string cannot be longer than 65535 bytes but got {}", b.size()));
            u16(static_cast<uint16_t>(b.size()));
            return bytes(b);
        }

        // a UTF-8 string prefixed with its u64 length
        encoder &text(const std::string_view s)
        {
            u64(s.size());
            return bytes(buffer { s });
        }

        const uint8_vector &data() const noexcept
        {
            return _data;
        }

        uint8_vector take() noexcept
        {
            return std::move(_data);
        }

        size_t size() const noexcept
        {
            return _data.size();
        }
    private:
        uint8_vector _data {};

        template<typename T>
        encoder &_uint(const T v)
        {
            const T net = host_to_net(v);
            return bytes(buffer { reinterpret_cast<const uint8_t *>(&net), sizeof(net) });
        }
    };

    // A cursor over an immutable byte range. Offsets returned by pos() can be used
    // to re-read the exact bytes consumed since then without re-parsing them.
    struct decoder {
        explicit decoder(const buffer data): _data { data }
        {
        }

        uint8_t u8()
        {
            return _take(1)[0];
        }

        uint16_t u16()
        {
            return _uint<uint16_t>();
        }

        uint32_t u32()
        {
            return _uint<uint32_t>();
        }

        uint64_t u64()
        {
            return _uint<uint64_t>();
        }

        buffer bytes(const size_t sz)
        {
            return _take(sz);
        }

        buffer short_bytes()
        {
            return _take(u16());
        }

        std::string text()
        {
            const auto sz = u64();
            return std::string { static_cast<std::string_view>(_take(sz)) };
        }

        template<size_t SZ>
        byte_array<SZ> array()
        {
            return byte_array<SZ> { _take(SZ) };
        }

        size_t pos() const noexcept
        {
            return _pos;
        }

        size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        bool empty() const noexcept
        {
            return _pos == _data.size();
        }

        // the bytes consumed between the start offset and the current position
        buffer consumed_since(const size_t start) const
        {
            if (start > _pos) [[unlikely]]
                throw error(fmt::format("start offset {} is after the current position {}", start, _pos));
            return _data.subbuf(start, _pos - start);
        }

        void expect_end(const std::string_view what) const
        {
            if (!empty()) [[unlikely]]
                throw decode_error(fmt::format("{}: {} trailing bytes after the end of the value", what, remaining()));
        }
    private:
        buffer _data;
        size_t _pos = 0;

        buffer _take(const size_t sz)
        {
            if (sz > remaining()) [[unlikely]]
                throw decode_error(fmt::format("not enough data: requested {} bytes at offset {} but only {} are available", sz, _pos, remaining()));
            const auto res = _data.subbuf(_pos, sz);
            _pos += sz;
            return res;
        }

        template<typename T>
        T _uint()
        {
            return _take(sizeof(T)).to_host<T>();
        }
    };
}

#endif // !LEDGER_CORE_CODEC_BINARY_HPP
