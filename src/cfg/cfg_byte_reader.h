/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "cfg_error.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace nxcfg::cfg {
// Little-endian cursor over an input blob. Every read past the end is TruncatedInput.
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    std::size_t position() const { return _pos; }
    bool at_end() const { return _pos >= _data.size(); }

    std::uint8_t read_u8() {
        require(1, "u8");
        return _data[_pos++];
    }

    std::uint32_t read_u32() { return static_cast<std::uint32_t>(read_le(4, "u32")); }

    std::uint64_t read_u64() { return read_le(8, "u64"); }

    std::span<const std::uint8_t> read_span(std::size_t count) {
        require(count, "byte range");
        const auto out = _data.subspan(_pos, count);
        _pos += count;
        return out;
    }

    std::vector<std::uint8_t> read_bytes(std::size_t count) {
        const auto s = read_span(count);
        return std::vector<std::uint8_t>(s.begin(), s.end());
    }

    void seek(std::size_t pos) {
        if (pos > _data.size()) {
            throw CfgError(
                ErrorKind::TruncatedInput,
                "Seek to offset " + std::to_string(pos) + " past end of "
                    + std::to_string(_data.size()) + "-byte input"
            );
        }
        _pos = pos;
    }

   private:
    void require(std::size_t count, const char* what) const {
        if (count > _data.size() - _pos) {
            throw CfgError(
                ErrorKind::TruncatedInput,
                std::string("Unexpected EOF reading ") + what + " at offset "
                    + std::to_string(_pos) + " (" + std::to_string(count) + " byte(s) needed, "
                    + std::to_string(_data.size() - _pos) + " left)"
            );
        }
    }

    std::uint64_t read_le(std::size_t width, const char* what) {
        require(width, what);
        std::uint64_t v = 0;
        for (std::size_t i = 0; i < width; i++) {
            v |= static_cast<std::uint64_t>(_data[_pos + i]) << (8 * i);
        }
        _pos += width;
        return v;
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace nxcfg::cfg
