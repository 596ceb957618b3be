#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pngstash/codec/constants.hpp"
#include "pngstash/codec/record.hpp"


namespace pngstash::codec {

namespace container {

// Status codes for container operations
enum class Status : std::uint8_t {
    Ok = 0,
    InvalidSignature,   // Leading 8 bytes are not the PNG signature
    InvalidRecord,      // A record failed to decode (see record_cause)
    ChunkNotFound       // No record with the requested type
};

[[nodiscard]] const char* to_string(Status status) noexcept;

// -----------------------------------------------------------------------------
// Container-layer error
// -----------------------------------------------------------------------------
// For InvalidRecord, record_index is the position the failed record would
// have taken and offset is where it starts in the whole buffer.
struct Error {
    Status code = Status::Ok;
    record::Error record_cause{};
    std::size_t record_index = 0;
    std::size_t offset = 0;

    [[nodiscard]] bool ok() const noexcept { return code == Status::Ok; }

    [[nodiscard]] static Error make(Status code) noexcept {
        Error e;
        e.code = code;
        return e;
    }

    [[nodiscard]] static Error from_record(const record::Error& cause, std::size_t index, std::size_t offset) noexcept {
        Error e = make(Status::InvalidRecord);
        e.record_cause = cause;
        e.record_index = index;
        e.offset = offset;
        return e;
    }
};

std::ostream& operator<<(std::ostream&, const Error&);
[[nodiscard]] std::string to_string(const Error& error);

} // namespace container


// -----------------------------------------------------------------------------
// Signature + ordered records
// -----------------------------------------------------------------------------
// Records keep file / insertion order. Type codes need not be unique;
// lookups and removals act on the first match.
//
// Not synchronized. One writer at a time per instance.
// -----------------------------------------------------------------------------
class Container {
public:
    Container() = default;
    explicit Container(std::vector<Record> records) noexcept
        : records_(std::move(records)) {}

    // Decodes a complete buffer. Either every record decodes and out is
    // replaced, or an error is returned and out is untouched.
    [[nodiscard]] static container::Error parse(std::span<const std::uint8_t> buffer, Container& out);

    [[nodiscard]] static constexpr const std::array<std::uint8_t, SIGNATURE_SIZE>& header() noexcept {
        return SIGNATURE;
    }

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;

    void append(Record record);

    // First record whose type spells type_name, nullptr when absent.
    // The pointer is invalidated by the next append or remove.
    [[nodiscard]] const Record* find_by_type(std::string_view type_name) const noexcept;

    // Removes the first record whose type spells type_name and hands it to
    // removed when given. ChunkNotFound leaves the sequence unchanged.
    [[nodiscard]] container::Error remove_by_type(std::string_view type_name, Record* removed = nullptr);

    [[nodiscard]] std::span<const Record> records() const noexcept { return records_; }
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    // Serialized size in bytes
    [[nodiscard]] std::size_t byte_size() const noexcept;

    friend bool operator==(const Container& a, const Container& b) noexcept {
        return a.records_ == b.records_;
    }

private:
    std::vector<Record> records_;
};

std::ostream& operator<<(std::ostream&, const Container&);

} // namespace pngstash::codec
