#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "cli/validators.hpp"
#include "lcr/log/logger.hpp"
#include "pngstash/command/commands.hpp"
#include "pngstash/version.hpp"


namespace pngstash::cli {

enum class Command : std::uint8_t {
    Encode,
    Decode,
    Remove,
    Print
};

inline constexpr const char* to_string(Command c) noexcept {
    switch (c) {
        case Command::Encode: return "encode";
        case Command::Decode: return "decode";
        case Command::Remove: return "remove";
        case Command::Print:  return "print";
    }
    return "unknown";
}

struct Params {
    std::string log_level = "warn";
    bool color            = false;

    Command command = Command::Print;
    command::EncodeArgs encode{};
    command::DecodeArgs decode{};
    command::RemoveArgs remove{};
    command::PrintArgs  print{};

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  Command   : " << to_string(command) << "\n";
        switch (command) {
            case Command::Encode:
                os << "  File      : " << encode.file_path << "\n"
                   << "  Type      : " << encode.chunk_type << "\n"
                   << "  Message   : " << encode.message.size() << " bytes\n"
                   << "  Output    : " << encode.output_path.value_or(encode.file_path) << "\n";
                break;
            case Command::Decode:
                os << "  File      : " << decode.file_path << "\n"
                   << "  Type      : " << decode.chunk_type << "\n";
                break;
            case Command::Remove:
                os << "  File      : " << remove.file_path << "\n"
                   << "  Type      : " << remove.chunk_type << "\n";
                break;
            case Command::Print:
                os << "  File      : " << print.file_path << "\n";
                break;
        }
        os << "  Log Level : " << log_level << "\n";
    }
};

// Parses the command line. Exits the process on --help, --version or
// argument errors, with CLI11's exit code.
[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description), "pngstash"};
    Params params{};

    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->check(log_level_validator)
        ->default_val(params.log_level);
    app.add_flag("--color", params.color, "Colorize log output");
    app.set_version_flag("-V,--version", version_string);
    app.require_subcommand(1);

    // encode <file> <type> <message> [output]
    auto* encode = app.add_subcommand("encode", "Hide a message in a chunk appended to the file");
    std::string encode_output;
    encode->add_option("file", params.encode.file_path, "PNG file to read")->required()->check(CLI::ExistingFile);
    encode->add_option("chunk_type", params.encode.chunk_type, "Chunk type to store the message under")->required()->check(chunk_type_validator);
    encode->add_option("message", params.encode.message, "Message text")->required();
    auto* output_opt = encode->add_option("output", encode_output, "Output file (defaults to the input file)");

    // decode <file> <type>
    auto* decode = app.add_subcommand("decode", "Print the message stored in the first chunk of a type");
    decode->add_option("file", params.decode.file_path, "PNG file to read")->required()->check(CLI::ExistingFile);
    decode->add_option("chunk_type", params.decode.chunk_type, "Chunk type to look up")->required()->check(chunk_type_validator);

    // remove <file> <type>
    auto* remove = app.add_subcommand("remove", "Remove the first chunk of a type and rewrite the file");
    remove->add_option("file", params.remove.file_path, "PNG file to rewrite")->required()->check(CLI::ExistingFile);
    remove->add_option("chunk_type", params.remove.chunk_type, "Chunk type to remove")->required()->check(chunk_type_validator);

    // print <file>
    auto* print = app.add_subcommand("print", "List every chunk with its type, length and checksum");
    print->add_option("file", params.print.file_path, "PNG file to read")->required()->check(CLI::ExistingFile);

    app.footer(
        "Files are only written after the whole operation succeeded.\n"
        "Exit status is non-zero on any failure."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    if (encode->parsed()) {
        params.command = Command::Encode;
        if (output_opt->count() > 0) {
            params.encode.output_path = encode_output;
        }
    }
    else if (decode->parsed()) {
        params.command = Command::Decode;
    }
    else if (remove->parsed()) {
        params.command = Command::Remove;
    }
    else {
        params.command = Command::Print;
    }

    auto& logger = lcr::log::Logger::instance();
    logger.set_level(lcr::log::parse_level(params.log_level, lcr::log::Level::Warn));
    logger.enable_color(params.color);
    return params;
}

} // namespace pngstash::cli
