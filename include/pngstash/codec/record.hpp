#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>

#include "pngstash/codec/constants.hpp"
#include "pngstash/codec/type_code.hpp"


namespace pngstash::codec {

namespace record {

// Status codes for record decoding and conversion
enum class Status : std::uint8_t {
    Ok = 0,
    InvalidLength,      // Buffer too short for the length field or the declared data
    InvalidChunkType,   // Type field missing or malformed (see type_cause)
    InvalidCrc,         // Buffer too short for the checksum field
    MismatchCrc,        // Stored checksum disagrees with the computed one
    TextConversion      // Data is not valid UTF-8
};

[[nodiscard]] const char* to_string(Status status) noexcept;

// -----------------------------------------------------------------------------
// Record-layer error
// -----------------------------------------------------------------------------
// offset is relative to the start of the window handed to Record::parse().
struct Error {
    Status code = Status::Ok;
    type_code::Status type_cause = type_code::Status::Ok;
    std::size_t offset = 0;
    std::uint32_t stored_crc = 0;     // MismatchCrc only
    std::uint32_t computed_crc = 0;   // MismatchCrc only

    [[nodiscard]] bool ok() const noexcept { return code == Status::Ok; }

    [[nodiscard]] static Error make(Status code, std::size_t offset) noexcept {
        Error e;
        e.code = code;
        e.offset = offset;
        return e;
    }

    // Type code failures surface as InvalidChunkType, keeping the cause
    [[nodiscard]] static Error from_type_code(type_code::Status cause, std::size_t offset) noexcept {
        Error e = make(Status::InvalidChunkType, offset);
        e.type_cause = cause;
        return e;
    }
};

std::ostream& operator<<(std::ostream&, const Error&);
[[nodiscard]] std::string to_string(const Error& error);

} // namespace record


// -----------------------------------------------------------------------------
// One framed chunk
// -----------------------------------------------------------------------------
//   length(u32 BE) | type(4) | data(length) | crc(u32 BE)
//
// The checksum covers type + data. A Record is immutable: length and
// checksum are derived at construction and never drift from the data.
// -----------------------------------------------------------------------------
class Record {
public:
    Record() = default;
    Record(const TypeCode& type, std::vector<std::uint8_t> data);

    // Decodes one record from the front of buffer. On success writes the
    // record to out and the number of bytes it occupied to consumed.
    // On failure out and consumed are left untouched.
    [[nodiscard]] static record::Error parse(std::span<const std::uint8_t> buffer,
                                             Record& out, std::size_t& consumed);

    [[nodiscard]] std::uint32_t length() const noexcept { return length_; }
    [[nodiscard]] const TypeCode& type() const noexcept { return type_; }
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return data_; }
    [[nodiscard]] std::uint32_t checksum() const noexcept { return checksum_; }

    // Size on the wire (framing + data)
    [[nodiscard]] std::size_t byte_size() const noexcept { return FRAMING_SIZE + data_.size(); }

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;

    // Appends the wire form to out
    void serialize_into(std::vector<std::uint8_t>& out) const;

    // Data as UTF-8 text, TextConversion if it is not valid UTF-8
    [[nodiscard]] record::Error as_text(std::string& out) const;

    friend bool operator==(const Record& a, const Record& b) noexcept {
        return a.length_ == b.length_ && a.type_ == b.type_ &&
               a.checksum_ == b.checksum_ && a.data_ == b.data_;
    }
    friend bool operator!=(const Record& a, const Record& b) noexcept {
        return !(a == b);
    }

private:
    std::uint32_t length_ = 0;
    TypeCode type_{};
    std::vector<std::uint8_t> data_;
    std::uint32_t checksum_ = 0;
};

// Multi-line diagnostic dump, not a wire format
std::ostream& operator<<(std::ostream&, const Record&);

} // namespace pngstash::codec
