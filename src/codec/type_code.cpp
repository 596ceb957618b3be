#include "pngstash/codec/type_code.hpp"

#include <algorithm>
#include <ostream>

#include "lcr/log/logger.hpp"


namespace pngstash::codec {

namespace {

constexpr bool is_ascii_letter(std::uint8_t c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

} // namespace


const char* type_code::to_string(Status status) noexcept {
    switch (status) {
        case Status::Ok:            return "ok";
        case Status::InvalidLength: return "type code must be exactly 4 bytes";
        case Status::InvalidFormat: return "type code bytes must be ASCII letters";
    }
    return "unknown type code status";
}

type_code::Status TypeCode::from_string(std::string_view s, TypeCode& out) noexcept {
    if (s.size() != TYPE_SIZE) {
        PS_TRACE("[!!] Rejected type code of " << s.size() << " bytes");
        return type_code::Status::InvalidLength;
    }
    Bytes bytes{};
    std::transform(s.begin(), s.end(), bytes.begin(),
                   [](char c) { return static_cast<std::uint8_t>(c); });
    out = from_bytes(bytes);
    return type_code::Status::Ok;
}

type_code::Status TypeCode::from_wire(const std::uint8_t* p, TypeCode& out) noexcept {
    Bytes bytes{};
    for (std::size_t i = 0; i < TYPE_SIZE; ++i) {
        if (!is_ascii_letter(p[i])) {
            PS_TRACE("[!!] Non-letter byte 0x" << std::hex << static_cast<unsigned>(p[i]) << std::dec
                     << " at type code position " << i);
            return type_code::Status::InvalidFormat;
        }
        bytes[i] = p[i];
    }
    out = from_bytes(bytes);
    return type_code::Status::Ok;
}

bool TypeCode::is_valid() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), is_ascii_letter) && is_reserved_bit_valid();
}

std::string TypeCode::to_string() const {
    return std::string(reinterpret_cast<const char*>(bytes_.data()), bytes_.size());
}

bool TypeCode::matches(std::string_view s) const noexcept {
    return s.size() == TYPE_SIZE &&
           std::equal(bytes_.begin(), bytes_.end(), s.begin(),
                      [](std::uint8_t b, char c) { return b == static_cast<std::uint8_t>(c); });
}

std::ostream& operator<<(std::ostream& os, const TypeCode& t) {
    return os.write(reinterpret_cast<const char*>(t.bytes().data()),
                    static_cast<std::streamsize>(t.bytes().size()));
}

} // namespace pngstash::codec
