#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>

#include "pngstash/codec/container.hpp"
#include "pngstash/codec/type_code.hpp"
#include "pngstash/fs/file.hpp"


namespace pngstash::command {

/*
===============================================================================
Command Error Model
===============================================================================

A command error names the layer that failed and carries that layer's own
error value unchanged, so the diagnostic line shows the full cause chain:

  command: container (container: invalid record #2 at offset 57
           (record: checksum mismatch at offset 12 (stored 1, computed 2)))

[filesystem] reading the input or writing the output failed. The target
file is untouched.

[container] the input is not a well-formed chunk container, or the
requested chunk is absent.

[chunk_type] the chunk type argument is not a usable type code.

[message_too_large] the message exceeds the PNG chunk length limit.
===============================================================================
*/

enum class Status : std::uint8_t {
    Ok = 0,
    Filesystem,
    Container,
    ChunkType,
    MessageTooLarge
};

[[nodiscard]] const char* to_string(Status status) noexcept;

struct Error {
    Status code = Status::Ok;
    fs::Error fs_cause{};
    codec::container::Error container_cause{};
    codec::type_code::Status type_cause = codec::type_code::Status::Ok;

    [[nodiscard]] bool ok() const noexcept { return code == Status::Ok; }

    [[nodiscard]] static Error from_fs(fs::Error cause) {
        Error e;
        e.code = Status::Filesystem;
        e.fs_cause = std::move(cause);
        return e;
    }

    [[nodiscard]] static Error from_container(const codec::container::Error& cause) {
        Error e;
        e.code = Status::Container;
        e.container_cause = cause;
        return e;
    }

    [[nodiscard]] static Error from_type_code(codec::type_code::Status cause) {
        Error e;
        e.code = Status::ChunkType;
        e.type_cause = cause;
        return e;
    }

    [[nodiscard]] static Error make(Status code) {
        Error e;
        e.code = code;
        return e;
    }
};

std::ostream& operator<<(std::ostream&, const Error&);
[[nodiscard]] std::string to_string(const Error& error);

} // namespace pngstash::command
