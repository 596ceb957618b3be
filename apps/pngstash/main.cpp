#include <cstdlib>
#include <iostream>
#include <sstream>

#include "cli/params.hpp"
#include "lcr/log/logger.hpp"
#include "pngstash/command/commands.hpp"

using namespace pngstash;

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = cli::configure(argc, argv,
        "pngstash - hide text messages in PNG chunks\n"
        "Encode, decode, remove or list the chunks of a PNG file.\n");

    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
        std::ostringstream oss;
        params.dump("Parameters", oss);
        PS_DEBUG(oss.str());
    }

    command::Error err;
    switch (params.command) {
        case cli::Command::Encode: err = command::encode(params.encode);            break;
        case cli::Command::Decode: err = command::decode(params.decode, std::cout); break;
        case cli::Command::Remove: err = command::remove(params.remove);            break;
        case cli::Command::Print:  err = command::print(params.print, std::cout);   break;
    }

    if (!err.ok()) {
        std::cerr << "pngstash " << cli::to_string(params.command) << ": " << err << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
