#pragma once

#include <array>
#include <cstdint>
#include <cstddef>


namespace pngstash::codec {

// -----------------------------------------------------------------------------
// Container signature (PNG magic number)
// -----------------------------------------------------------------------------
inline constexpr std::size_t SIGNATURE_SIZE = 8;

inline constexpr std::array<std::uint8_t, SIGNATURE_SIZE> SIGNATURE = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
};

// -----------------------------------------------------------------------------
// Record framing
// -----------------------------------------------------------------------------
//   length(u32 BE) | type(4) | data(length) | crc(u32 BE)
//
inline constexpr std::size_t LENGTH_SIZE  = sizeof(std::uint32_t);
inline constexpr std::size_t TYPE_SIZE    = 4;
inline constexpr std::size_t CRC_SIZE     = sizeof(std::uint32_t);
inline constexpr std::size_t HEADER_SIZE  = LENGTH_SIZE + TYPE_SIZE;   // 8
inline constexpr std::size_t FRAMING_SIZE = HEADER_SIZE + CRC_SIZE;    // 12

// PNG caps chunk lengths at 2^31 - 1. The codec itself does not enforce it;
// front-ends use it to refuse payloads other decoders would reject.
inline constexpr std::uint32_t MAX_RECORD_LENGTH = 0x7FFFFFFFu;

// -----------------------------------------------------------------------------
// Type code property bits
// -----------------------------------------------------------------------------
// Bit 5 (0x20) of each type byte is the ASCII case bit.
inline constexpr std::uint8_t PROPERTY_BIT = 0x20;

inline constexpr std::size_t ANCILLARY_BYTE    = 0;
inline constexpr std::size_t PRIVATE_BYTE      = 1;
inline constexpr std::size_t RESERVED_BYTE     = 2;
inline constexpr std::size_t SAFE_TO_COPY_BYTE = 3;

} // namespace pngstash::codec
