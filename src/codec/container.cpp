#include "pngstash/codec/container.hpp"

#include <algorithm>
#include <ostream>
#include <sstream>
#include <utility>

#include "lcr/log/logger.hpp"
#include "pngstash/codec/cursor.hpp"


namespace pngstash::codec {

const char* container::to_string(Status status) noexcept {
    switch (status) {
        case Status::Ok:               return "ok";
        case Status::InvalidSignature: return "invalid signature";
        case Status::InvalidRecord:    return "invalid record";
        case Status::ChunkNotFound:    return "chunk not found";
    }
    return "unknown container status";
}

std::ostream& container::operator<<(std::ostream& os, const Error& e) {
    os << "container: " << to_string(e.code);
    if (e.code == Status::InvalidRecord) {
        os << " #" << e.record_index << " at offset " << e.offset << " (" << e.record_cause << ")";
    }
    return os;
}

std::string container::to_string(const Error& error) {
    std::ostringstream oss;
    oss << error;
    return oss.str();
}

// ---------------------------------------------------------------------------

container::Error Container::parse(std::span<const std::uint8_t> buffer, Container& out) {
    using container::Error;
    using container::Status;

    if (buffer.size() < SIGNATURE_SIZE ||
        !std::equal(SIGNATURE.begin(), SIGNATURE.end(), buffer.begin())) {
        PS_TRACE("[!!] Invalid signature in " << buffer.size() << " byte buffer");
        return Error::make(Status::InvalidSignature);
    }

    Cursor cursor(buffer);
    cursor.advance(SIGNATURE_SIZE);

    std::vector<Record> records;
    while (!cursor.at_end()) {
        Record record;
        std::size_t consumed = 0;
        const std::size_t offset = cursor.position();
        auto err = Record::parse(cursor.rest(), record, consumed);
        if (!err.ok()) {
            PS_TRACE("[!!] Record #" << records.size() << " at offset " << offset << " rejected: " << err);
            return Error::from_record(err, records.size(), offset);
        }
        PS_TRACE("Record #" << records.size() << " '" << record.type() << "' length=" << record.length()
                 << " at offset " << offset);
        records.push_back(std::move(record));
        cursor.advance(consumed);
    }

    out = Container(std::move(records));
    return Error{};
}

std::vector<std::uint8_t> Container::serialize() const {
    std::vector<std::uint8_t> out;
    out.reserve(byte_size());
    out.insert(out.end(), SIGNATURE.begin(), SIGNATURE.end());
    for (const auto& record : records_) {
        record.serialize_into(out);
    }
    return out;
}

void Container::append(Record record) {
    records_.push_back(std::move(record));
}

const Record* Container::find_by_type(std::string_view type_name) const noexcept {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [type_name](const Record& r) { return r.type().matches(type_name); });
    return it != records_.end() ? &*it : nullptr;
}

container::Error Container::remove_by_type(std::string_view type_name, Record* removed) {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [type_name](const Record& r) { return r.type().matches(type_name); });
    if (it == records_.end()) {
        PS_DEBUG("No '" << type_name << "' record among " << records_.size());
        return container::Error::make(container::Status::ChunkNotFound);
    }
    if (removed) {
        *removed = std::move(*it);
    }
    records_.erase(it);
    return container::Error{};
}

std::size_t Container::byte_size() const noexcept {
    std::size_t total = SIGNATURE_SIZE;
    for (const auto& record : records_) {
        total += record.byte_size();
    }
    return total;
}

// ---------------------------------
// Debug / logging helper
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const Container& c) {
    os << "Container [" << c.size() << " records]";
    for (const auto& record : c.records()) {
        os << "\n" << record;
    }
    return os;
}

} // namespace pngstash::codec
