#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "pngstash/command/error.hpp"


namespace pngstash::command {

// -----------------------------------------------------------------------------
// Command arguments
// -----------------------------------------------------------------------------

struct EncodeArgs {
    std::string file_path;
    std::string chunk_type;
    std::string message;
    std::optional<std::string> output_path;   // Defaults to file_path
};

struct DecodeArgs {
    std::string file_path;
    std::string chunk_type;
};

struct RemoveArgs {
    std::string file_path;
    std::string chunk_type;
};

struct PrintArgs {
    std::string file_path;
};

// Printed by decode when the chunk exists but holds no text
inline constexpr const char* NO_MESSAGE_TEXT = "No encoded message.";

// -----------------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------------
// Each command reads the whole file, works on the parsed container in memory
// and, when it modifies anything, writes the whole result back. A file is
// only written after every earlier step succeeded.
//
// Console output goes to out. Diagnostics are the caller's job.

// Appends a chunk holding message and writes the result to output_path
[[nodiscard]] Error encode(const EncodeArgs& args);

// Prints the text of the first chunk with the given type
[[nodiscard]] Error decode(const DecodeArgs& args, std::ostream& out);

// Drops the first chunk with the given type and rewrites the file
[[nodiscard]] Error remove(const RemoveArgs& args);

// One line per chunk: type, length and checksum
[[nodiscard]] Error print(const PrintArgs& args, std::ostream& out);

} // namespace pngstash::command
