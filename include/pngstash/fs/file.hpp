#pragma once

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>


namespace pngstash::fs {

// Status codes for whole-file I/O
enum class Status : std::uint8_t {
    Ok = 0,
    OpenFailed,
    ReadFailed,
    WriteFailed,
    SyncFailed,
    CloseFailed,
    RenameFailed
};

[[nodiscard]] const char* to_string(Status status) noexcept;

// Result of a file operation. sys_errno holds errno at the failing call.
struct Error {
    Status code = Status::Ok;
    int sys_errno = 0;
    std::string path;

    [[nodiscard]] bool ok() const noexcept { return code == Status::Ok; }
};

std::ostream& operator<<(std::ostream&, const Error&);

// Reads the whole file into out. out is only replaced on success.
[[nodiscard]] Error read_file(const std::string& path, std::vector<std::uint8_t>& out);

// Replaces the whole file with bytes. Data goes to a sibling temporary
// file which is synced and renamed over path, so readers see either the
// old content or the new content.
[[nodiscard]] Error write_file(const std::string& path, std::span<const std::uint8_t> bytes);

} // namespace pngstash::fs
