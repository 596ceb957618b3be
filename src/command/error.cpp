#include "pngstash/command/error.hpp"

#include <ostream>
#include <sstream>


namespace pngstash::command {

const char* to_string(Status status) noexcept {
    switch (status) {
        case Status::Ok:              return "ok";
        case Status::Filesystem:      return "filesystem";
        case Status::Container:       return "container";
        case Status::ChunkType:       return "chunk type";
        case Status::MessageTooLarge: return "message too large";
    }
    return "unknown command status";
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
    os << "command: " << to_string(e.code);
    switch (e.code) {
        case Status::Filesystem: os << " (" << e.fs_cause << ")"; break;
        case Status::Container:  os << " (" << e.container_cause << ")"; break;
        case Status::ChunkType:  os << " (" << codec::type_code::to_string(e.type_cause) << ")"; break;
        default: break;
    }
    return os;
}

std::string to_string(const Error& error) {
    std::ostringstream oss;
    oss << error;
    return oss.str();
}

} // namespace pngstash::command
