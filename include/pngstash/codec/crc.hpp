#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>

#include <zlib.h>

#include "pngstash/codec/type_code.hpp"


namespace pngstash::codec::crc {

// -----------------------------------------------------------------------------
// CRC-32/ISO-HDLC (zlib crc32: reflected 0xEDB88320, init/xorout 0xFFFFFFFF)
// -----------------------------------------------------------------------------

// Continue a running checksum over [data, data + size)
[[nodiscard]] inline std::uint32_t update(std::uint32_t crc, const std::uint8_t* data, std::size_t size) noexcept {
    uLong acc = crc;
    // zlib takes uInt lengths, feed large buffers in slices
    while (size > 0) {
        const std::size_t slice = size > std::numeric_limits<uInt>::max()
                                ? std::numeric_limits<uInt>::max()
                                : size;
        acc = ::crc32(acc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(slice));
        data += slice;
        size -= slice;
    }
    return static_cast<std::uint32_t>(acc);
}

// Checksum of a record: type bytes followed by data bytes
[[nodiscard]] inline std::uint32_t compute(const TypeCode& type, const std::uint8_t* data, std::size_t size) noexcept {
    std::uint32_t crc = static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0));
    crc = update(crc, type.bytes().data(), type.bytes().size());
    return update(crc, data, size);
}

} // namespace pngstash::codec::crc
