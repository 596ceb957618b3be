#include "pngstash/codec/record.hpp"

#include <algorithm>
#include <ostream>
#include <sstream>
#include <utility>

#include <simdjson.h>

#include "lcr/endian.hpp"
#include "lcr/log/logger.hpp"
#include "pngstash/codec/crc.hpp"
#include "pngstash/codec/cursor.hpp"


namespace pngstash::codec {

// ---------------------------------
// Errors
// ---------------------------------

const char* record::to_string(Status status) noexcept {
    switch (status) {
        case Status::Ok:               return "ok";
        case Status::InvalidLength:    return "invalid length";
        case Status::InvalidChunkType: return "invalid chunk type";
        case Status::InvalidCrc:       return "missing checksum";
        case Status::MismatchCrc:      return "checksum mismatch";
        case Status::TextConversion:   return "data is not valid UTF-8";
    }
    return "unknown record status";
}

std::ostream& record::operator<<(std::ostream& os, const Error& e) {
    os << "record: " << to_string(e.code);
    if (e.ok() || e.code == Status::TextConversion) {
        return os;
    }
    os << " at offset " << e.offset;
    if (e.code == Status::InvalidChunkType) {
        os << " (" << type_code::to_string(e.type_cause) << ")";
    }
    else if (e.code == Status::MismatchCrc) {
        os << " (stored " << e.stored_crc << ", computed " << e.computed_crc << ")";
    }
    return os;
}

std::string record::to_string(const Error& error) {
    std::ostringstream oss;
    oss << error;
    return oss.str();
}

// ---------------------------------
// Record
// ---------------------------------

Record::Record(const TypeCode& type, std::vector<std::uint8_t> data)
    : length_(static_cast<std::uint32_t>(data.size()))
    , type_(type)
    , data_(std::move(data))
    , checksum_(crc::compute(type_, data_.data(), data_.size()))
{}

record::Error Record::parse(std::span<const std::uint8_t> buffer, Record& out, std::size_t& consumed) {
    using record::Error;
    using record::Status;

    Cursor cursor(buffer);

    // 1. Length
    std::uint32_t length = 0;
    if (!cursor.read_u32(length)) {
        PS_TRACE("[!!] Record truncated: " << cursor.remaining() << " bytes left for the length field");
        return Error::make(Status::InvalidLength, cursor.position());
    }

    // 2. Type
    std::span<const std::uint8_t> type_bytes;
    if (!cursor.read_bytes(TYPE_SIZE, type_bytes)) {
        PS_TRACE("[!!] Record truncated: " << cursor.remaining() << " bytes left for the type field");
        return Error::from_type_code(type_code::Status::InvalidLength, cursor.position());
    }
    TypeCode type;
    if (auto status = TypeCode::from_wire(type_bytes.data(), type); status != type_code::Status::Ok) {
        return Error::from_type_code(status, LENGTH_SIZE);
    }

    // 3. Data
    std::span<const std::uint8_t> data;
    if (!cursor.read_bytes(length, data)) {
        PS_TRACE("[!!] Record '" << type << "' declares " << length << " data bytes, only "
                 << cursor.remaining() << " available");
        return Error::make(Status::InvalidLength, cursor.position());
    }

    // 4. Checksum
    std::uint32_t stored_crc = 0;
    if (!cursor.read_u32(stored_crc)) {
        PS_TRACE("[!!] Record '" << type << "' truncated before its checksum");
        return Error::make(Status::InvalidCrc, cursor.position());
    }

    // 5. Integrity, checked before anything is allocated
    const std::uint32_t computed_crc = crc::compute(type, data.data(), data.size());
    if (computed_crc != stored_crc) {
        PS_TRACE("[!!] Record '" << type << "' checksum mismatch: stored " << stored_crc
                 << ", computed " << computed_crc);
        Error e = Error::make(Status::MismatchCrc, HEADER_SIZE + data.size());
        e.stored_crc = stored_crc;
        e.computed_crc = computed_crc;
        return e;
    }

    out = Record(type, std::vector<std::uint8_t>(data.begin(), data.end()));
    consumed = cursor.position();
    return Error{};
}

std::vector<std::uint8_t> Record::serialize() const {
    std::vector<std::uint8_t> out;
    out.reserve(byte_size());
    serialize_into(out);
    return out;
}

void Record::serialize_into(std::vector<std::uint8_t>& out) const {
    const std::size_t base = out.size();
    out.resize(base + byte_size());
    std::uint8_t* p = out.data() + base;

    lcr::store_be32(p, length_);
    p += LENGTH_SIZE;
    std::copy(type_.bytes().begin(), type_.bytes().end(), p);
    p += TYPE_SIZE;
    std::copy(data_.begin(), data_.end(), p);
    p += data_.size();
    lcr::store_be32(p, checksum_);
}

record::Error Record::as_text(std::string& out) const {
    if (data_.empty()) {
        out.clear();
        return record::Error{};
    }
    const char* text = reinterpret_cast<const char*>(data_.data());
    if (!simdjson::validate_utf8(text, data_.size())) {
        PS_DEBUG("Record '" << type_ << "' holds " << data_.size() << " bytes of non UTF-8 data");
        return record::Error::make(record::Status::TextConversion, 0);
    }
    out.assign(text, data_.size());
    return record::Error{};
}

// ---------------------------------
// Debug / logging helper
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const Record& r) {
    os << "Chunk {\n"
       << "  Length: " << r.length() << "\n"
       << "  Type: " << r.type() << "\n"
       << "  Data: " << r.data().size() << " bytes\n"
       << "  Crc: " << r.checksum() << "\n"
       << "}";
    return os;
}

} // namespace pngstash::codec
