#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "pngstash/codec/constants.hpp"


namespace pngstash::cli {

// -------------------------------------------------------------
// Chunk type validator
// -------------------------------------------------------------
// Only the shape is checked here. Letter and reserved-bit rules are
// enforced by the commands so they surface as chunk type errors.
inline auto chunk_type_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.size() == codec::TYPE_SIZE) {
            return {};
        }
        return "Chunk type must be exactly 4 characters (e.g. ruSt)";
    },
    "CHUNK_TYPE"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error"});

} // namespace pngstash::cli
