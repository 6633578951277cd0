#include "flowlog/byte_cursor.hpp"
#include <cstring>

namespace fl {

bool ByteCursor::read_u8(std::uint8_t& out) noexcept {
  if (!can_take(1)) return false;
  out = data_[pos_++];
  return true;
}

bool ByteCursor::read_u16(std::uint16_t& out) noexcept {
  if (!can_take(2)) return false;
  const std::uint8_t* p = data_ + pos_;
  out = static_cast<std::uint16_t>((p[0] << 8) | p[1]);
  pos_ += 2;
  return true;
}

bool ByteCursor::read_u32(std::uint32_t& out) noexcept {
  if (!can_take(4)) return false;
  const std::uint8_t* p = data_ + pos_;
  out = (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) |
        (std::uint32_t(p[2]) << 8)  |  std::uint32_t(p[3]);
  pos_ += 4;
  return true;
}

bool ByteCursor::read_u64(std::uint64_t& out) noexcept {
  if (!can_take(8)) return false;
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < 8; ++i) v = (v << 8) | data_[pos_ + i];
  out = v;
  pos_ += 8;
  return true;
}

bool ByteCursor::read_exact(std::size_t n, std::uint8_t* out) noexcept {
  if (!can_take(n)) return false;
  if (n) std::memcpy(out, data_ + pos_, n);
  pos_ += n;
  return true;
}

bool ByteCursor::skip(std::size_t n) noexcept {
  if (!can_take(n)) return false;
  pos_ += n;
  return true;
}

bool ByteCursor::window(std::size_t n, ByteCursor& out) noexcept {
  if (!can_take(n)) return false;
  out = ByteCursor(data_ + pos_, n, base_ + pos_);
  pos_ += n;
  return true;
}

}
