#include "pngstash/fs/file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ostream>
#include <utility>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "lcr/log/logger.hpp"


namespace pngstash::fs {

namespace {

#if defined(O_CLOEXEC)
constexpr int OPEN_FLAGS_EXTRA = O_CLOEXEC;
#else
constexpr int OPEN_FLAGS_EXTRA = 0;
#endif

Error fail(Status code, const std::string& path) {
    Error e;
    e.code = code;
    e.sys_errno = errno;
    e.path = path;
    return e;
}

// Closes the descriptor on scope exit unless released
class FdGuard {
public:
    explicit FdGuard(int fd) noexcept : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] int release() noexcept { int fd = fd_; fd_ = -1; return fd; }

private:
    int fd_;
};

} // namespace


const char* to_string(Status status) noexcept {
    switch (status) {
        case Status::Ok:           return "ok";
        case Status::OpenFailed:   return "open failed";
        case Status::ReadFailed:   return "read failed";
        case Status::WriteFailed:  return "write failed";
        case Status::SyncFailed:   return "fsync failed";
        case Status::CloseFailed:  return "close failed";
        case Status::RenameFailed: return "rename failed";
    }
    return "unknown filesystem status";
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
    os << "filesystem: " << to_string(e.code);
    if (!e.ok()) {
        os << " '" << e.path << "'";
        if (e.sys_errno != 0) {
            os << " (" << std::strerror(e.sys_errno) << ")";
        }
    }
    return os;
}

Error read_file(const std::string& path, std::vector<std::uint8_t>& out) {
    FdGuard fd(::open(path.c_str(), O_RDONLY | OPEN_FLAGS_EXTRA));
    if (fd.get() < 0) {
        return fail(Status::OpenFailed, path);
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        return fail(Status::ReadFailed, path);
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(static_cast<std::size_t>(st.st_size));

    // st_size is only a capacity hint, read until EOF
    std::uint8_t chunk[64 * 1024];
    for (;;) {
        ssize_t n = ::read(fd.get(), chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail(Status::ReadFailed, path);
        }
        if (n == 0) break;
        bytes.insert(bytes.end(), chunk, chunk + n);
    }

    if (::close(fd.release()) != 0) {
        return fail(Status::CloseFailed, path);
    }

    PS_DEBUG("Read " << bytes.size() << " bytes from '" << path << "'");
    out = std::move(bytes);
    return Error{};
}

Error write_file(const std::string& path, std::span<const std::uint8_t> bytes) {
    const std::string tmp_path = path + ".pngstash.tmp";

    FdGuard fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | OPEN_FLAGS_EXTRA, 0644));
    if (fd.get() < 0) {
        return fail(Status::OpenFailed, tmp_path);
    }

    const std::uint8_t* p = bytes.data();
    std::size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(fd.get(), p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            Error e = fail(Status::WriteFailed, tmp_path);
            ::unlink(tmp_path.c_str());
            return e;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }

    if (::fsync(fd.get()) != 0) {
        Error e = fail(Status::SyncFailed, tmp_path);
        ::unlink(tmp_path.c_str());
        return e;
    }
    if (::close(fd.release()) != 0) {
        Error e = fail(Status::CloseFailed, tmp_path);
        ::unlink(tmp_path.c_str());
        return e;
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        Error e = fail(Status::RenameFailed, path);
        ::unlink(tmp_path.c_str());
        return e;
    }

    PS_DEBUG("Wrote " << bytes.size() << " bytes to '" << path << "'");
    return Error{};
}

} // namespace pngstash::fs
