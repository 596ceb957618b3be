#include "pngstash/command/commands.hpp"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "lcr/log/logger.hpp"
#include "pngstash/codec/constants.hpp"
#include "pngstash/codec/container.hpp"
#include "pngstash/fs/file.hpp"


namespace pngstash::command {

using codec::Container;
using codec::Record;
using codec::TypeCode;

namespace {

// Reads and decodes a whole file
[[nodiscard]] Error load(const std::string& path, Container& out) {
    std::vector<std::uint8_t> bytes;
    if (auto err = fs::read_file(path, bytes); !err.ok()) {
        return Error::from_fs(std::move(err));
    }
    if (auto err = Container::parse(bytes, out); !err.ok()) {
        PS_DEBUG("Failed to decode '" << path << "': " << err);
        return Error::from_container(err);
    }
    PS_DEBUG("Decoded " << out.size() << " chunks from '" << path << "'");
    return Error{};
}

// Encodes and writes a whole file
[[nodiscard]] Error store(const std::string& path, const Container& container) {
    const std::vector<std::uint8_t> bytes = container.serialize();
    if (auto err = fs::write_file(path, bytes); !err.ok()) {
        return Error::from_fs(std::move(err));
    }
    return Error{};
}

} // namespace


Error encode(const EncodeArgs& args) {
    TypeCode type;
    if (auto status = TypeCode::from_string(args.chunk_type, type); status != codec::type_code::Status::Ok) {
        return Error::from_type_code(status);
    }
    if (!type.is_valid()) {
        PS_DEBUG("Refusing non-conforming chunk type '" << args.chunk_type << "'");
        return Error::from_type_code(codec::type_code::Status::InvalidFormat);
    }
    if (args.message.size() > codec::MAX_RECORD_LENGTH) {
        return Error::make(Status::MessageTooLarge);
    }

    Container container;
    if (auto err = load(args.file_path, container); !err.ok()) {
        return err;
    }

    container.append(Record(type, std::vector<std::uint8_t>(args.message.begin(), args.message.end())));

    const std::string& target = args.output_path.value_or(args.file_path);
    if (auto err = store(target, container); !err.ok()) {
        return err;
    }
    PS_INFO("Encoded " << args.message.size() << " bytes as '" << type << "' into '" << target << "'");
    return Error{};
}

Error decode(const DecodeArgs& args, std::ostream& out) {
    Container container;
    if (auto err = load(args.file_path, container); !err.ok()) {
        return err;
    }

    const Record* record = container.find_by_type(args.chunk_type);
    if (!record) {
        return Error::from_container(codec::container::Error::make(codec::container::Status::ChunkNotFound));
    }

    std::string text;
    if (auto err = record->as_text(text); !err.ok()) {
        PS_DEBUG("'" << args.chunk_type << "' chunk is not text: " << err);
        out << NO_MESSAGE_TEXT << "\n";
        return Error{};
    }
    out << text << "\n";
    return Error{};
}

Error remove(const RemoveArgs& args) {
    Container container;
    if (auto err = load(args.file_path, container); !err.ok()) {
        return err;
    }

    if (auto err = container.remove_by_type(args.chunk_type); !err.ok()) {
        return Error::from_container(err);
    }

    if (auto err = store(args.file_path, container); !err.ok()) {
        return err;
    }
    PS_INFO("Removed '" << args.chunk_type << "' chunk from '" << args.file_path << "'");
    return Error{};
}

Error print(const PrintArgs& args, std::ostream& out) {
    Container container;
    if (auto err = load(args.file_path, container); !err.ok()) {
        return err;
    }

    for (const auto& record : container.records()) {
        out << record.type()
            << "  length=" << record.length()
            << "  crc=" << record.checksum() << "\n";
    }
    return Error{};
}

} // namespace pngstash::command
