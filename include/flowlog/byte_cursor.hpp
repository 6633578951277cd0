#pragma once
#include <cstddef>
#include <cstdint>

namespace fl {

// Bounds-checked big-endian reader over a borrowed byte window.
// Every read either consumes exactly its width and returns true, or returns
// false (truncated) and leaves position() where it was.
class ByteCursor {
public:
  ByteCursor() = default;
  ByteCursor(const std::uint8_t* data, std::size_t size,
             std::uint64_t base_offset = 0) noexcept
      : data_(data), size_(size), base_(base_offset) {}

  bool read_u8(std::uint8_t& out) noexcept;
  bool read_u16(std::uint16_t& out) noexcept;
  bool read_u32(std::uint32_t& out) noexcept;
  bool read_u64(std::uint64_t& out) noexcept;

  // Copy exactly n bytes into out; no partial copies.
  bool read_exact(std::size_t n, std::uint8_t* out) noexcept;
  bool skip(std::size_t n) noexcept;

  // Carve the next n bytes into `out` (a cursor of its own) and advance past them.
  bool window(std::size_t n, ByteCursor& out) noexcept;

  // Move back to a position previously returned by position().
  void rewind_to(std::size_t pos) noexcept { if (pos <= pos_) pos_ = pos; }

  std::size_t size() const noexcept { return size_; }
  std::size_t position() const noexcept { return pos_; }
  std::size_t remaining() const noexcept { return size_ - pos_; }
  bool can_take(std::size_t n) const noexcept { return n <= remaining(); }

  // Absolute stream offset of the next unread byte.
  std::uint64_t offset() const noexcept { return base_ + pos_; }
  std::uint64_t offset_at(std::size_t pos) const noexcept { return base_ + pos; }

  // Unread bytes, for pattern scans. Valid for remaining() bytes.
  const std::uint8_t* here() const noexcept { return data_ + pos_; }

private:
  const std::uint8_t* data_{nullptr};
  std::size_t size_{0};
  std::size_t pos_{0};
  std::uint64_t base_{0};
};

}
