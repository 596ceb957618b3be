#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "pngstash/codec/constants.hpp"


namespace pngstash::codec {

namespace type_code {

// Status codes for type code construction
enum class Status : std::uint8_t {
    Ok = 0,
    InvalidLength,      // Source is not exactly 4 bytes long
    InvalidFormat       // A byte is not an ASCII letter
};

[[nodiscard]] const char* to_string(Status status) noexcept;

} // namespace type_code


// -----------------------------------------------------------------------------
// 4-byte chunk type tag
// -----------------------------------------------------------------------------
// Bit 0x20 of each byte carries a property flag:
//
//   byte 0  clear = critical      set = ancillary
//   byte 1  clear = public        set = private
//   byte 2  clear = conforming    set = reserved bit misused
//   byte 3  clear = unsafe        set = safe to copy
//
// Property reads are defined for any byte values. Only is_valid() says
// whether the tag is a legal type code.
// -----------------------------------------------------------------------------
class TypeCode {
public:
    using Bytes = std::array<std::uint8_t, TYPE_SIZE>;

    TypeCode() noexcept = default;
    explicit constexpr TypeCode(const Bytes& bytes) noexcept : bytes_(bytes) {}

    // Structural construction, never fails
    [[nodiscard]] static constexpr TypeCode from_bytes(const Bytes& bytes) noexcept {
        return TypeCode{bytes};
    }

    // Requires exactly 4 bytes, does not check letters or the reserved bit
    [[nodiscard]] static type_code::Status from_string(std::string_view s, TypeCode& out) noexcept;

    // Strict construction used when decoding: all 4 bytes must be ASCII letters
    [[nodiscard]] static type_code::Status from_wire(const std::uint8_t* p, TypeCode& out) noexcept;

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    [[nodiscard]] bool is_valid() const noexcept;

    [[nodiscard]] constexpr bool is_critical() const noexcept {
        return (bytes_[ANCILLARY_BYTE] & PROPERTY_BIT) == 0;
    }
    [[nodiscard]] constexpr bool is_public() const noexcept {
        return (bytes_[PRIVATE_BYTE] & PROPERTY_BIT) == 0;
    }
    [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept {
        return (bytes_[RESERVED_BYTE] & PROPERTY_BIT) == 0;
    }
    [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept {
        return (bytes_[SAFE_TO_COPY_BYTE] & PROPERTY_BIT) != 0;
    }

    // Raw bytes as text; meaningful only when is_valid()
    [[nodiscard]] std::string to_string() const;

    // Exact byte comparison against a tag spelled as text
    [[nodiscard]] bool matches(std::string_view s) const noexcept;

    friend constexpr bool operator==(const TypeCode& a, const TypeCode& b) noexcept {
        return a.bytes_ == b.bytes_;
    }
    friend constexpr bool operator!=(const TypeCode& a, const TypeCode& b) noexcept {
        return !(a == b);
    }

private:
    Bytes bytes_{};
};

std::ostream& operator<<(std::ostream&, const TypeCode&);

} // namespace pngstash::codec
