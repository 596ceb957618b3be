#pragma once

#include <cstdint>
#include <cstddef>
#include <span>

#include "lcr/endian.hpp"


namespace pngstash::codec {

// ============================================================================
// Cursor
// ----------------------------------------------------------------------------
// Read position over a borrowed, complete byte buffer.
//
// Every read is bounds-checked first. A read that would run past the end
// returns false and leaves the position where it was, so callers can map
// the failure to their own error code.
//
// The cursor does not own the buffer. It must not outlive it.
// ============================================================================
class Cursor {
public:
    explicit Cursor(std::span<const std::uint8_t> buffer) noexcept
        : buffer_(buffer) {}

    [[nodiscard]] inline std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] inline std::size_t remaining() const noexcept { return buffer_.size() - pos_; }
    [[nodiscard]] inline bool at_end() const noexcept { return pos_ == buffer_.size(); }

    [[nodiscard]] inline bool can_read(std::size_t n) const noexcept {
        return n <= remaining();
    }

    // Big-endian u32
    [[nodiscard]] inline bool read_u32(std::uint32_t& out) noexcept {
        if (!can_read(sizeof(std::uint32_t))) [[unlikely]] return false;
        out = lcr::load_be32(buffer_.data() + pos_);
        pos_ += sizeof(std::uint32_t);
        return true;
    }

    // View of the next n bytes, valid as long as the buffer is
    [[nodiscard]] inline bool read_bytes(std::size_t n, std::span<const std::uint8_t>& out) noexcept {
        if (!can_read(n)) [[unlikely]] return false;
        out = buffer_.subspan(pos_, n);
        pos_ += n;
        return true;
    }

    inline void advance(std::size_t n) noexcept {
        pos_ += (n <= remaining()) ? n : remaining();
    }

    [[nodiscard]] inline std::span<const std::uint8_t> rest() const noexcept {
        return buffer_.subspan(pos_);
    }

private:
    std::span<const std::uint8_t> buffer_;
    std::size_t pos_ = 0;
};

} // namespace pngstash::codec
