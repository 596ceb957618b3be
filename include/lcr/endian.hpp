#pragma once

#include <cstdint>
#include <cstring>


// -------------------------------------------------------------
// Endian conversion helpers for wire serialization
// -------------------------------------------------------------
// Canonical wire format: BIG-ENDIAN (network byte order)
// Use to_be32() before writing, from_be32() after reading.
// load_be32() / store_be32() work on unaligned byte pointers.
// -------------------------------------------------------------

// Detect endianness (portable fallback)
#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__) && defined(__ORDER_BIG_ENDIAN__)
#  define LCR_HOST_IS_LITTLE_ENDIAN (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
#elif defined(_WIN32)
#  define LCR_HOST_IS_LITTLE_ENDIAN 1
#else
#  error "Cannot determine host endianness"
#endif

// -------------------------------------------------------------
// Byte-swap primitive (compiler intrinsic preferred)
// -------------------------------------------------------------
#if defined(_MSC_VER)
#  include <stdlib.h>
#  define LCR_BSWAP32 _byteswap_ulong
#else
#  define LCR_BSWAP32 __builtin_bswap32
#endif


namespace lcr {

// -------------------------------------------------------------
// Host <-> big-endian conversion
// -------------------------------------------------------------
inline uint32_t to_be32(uint32_t x) noexcept {
#if LCR_HOST_IS_LITTLE_ENDIAN
    return LCR_BSWAP32(x);
#else
    return x;
#endif
}

// Symmetric function for reading back from the wire
inline uint32_t from_be32(uint32_t x) noexcept { return to_be32(x); }

// -------------------------------------------------------------
// Unaligned access
// -------------------------------------------------------------
[[nodiscard]] inline uint32_t load_be32(const uint8_t* p) noexcept {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return from_be32(v);
}

inline void store_be32(uint8_t* p, uint32_t v) noexcept {
    v = to_be32(v);
    std::memcpy(p, &v, sizeof(v));
}

} // namespace lcr
