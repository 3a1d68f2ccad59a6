#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ftr::aux
{
/*
 * Piece bitfield in wire order: bit 7 of byte 0 is piece 0.
 */
class BitField
{
  std::vector<uint8_t> m_bitfield;

public:
  BitField() = default;

  explicit BitField(size_t piece_count);

  explicit BitField(std::vector<uint8_t> bitfield);

  static size_t bytes_for(size_t piece_count) { return (piece_count + 7) / 8; }

  void mark(size_t piece_index, bool value);

  bool get(size_t piece_index) const;

  bool is_empty() const;

  size_t count() const;

  // True when every bit beyond `piece_count` is clear and the byte length
  // matches exactly.
  bool fits(size_t piece_count) const;

  const std::vector<uint8_t>& as_raw() const { return m_bitfield; }
};
}  // namespace ftr::aux
