#include <algorithm>
#include <bit>

#include "torrent/bitfield/bitfield.hpp"

namespace ftr::aux
{
namespace
{
constexpr size_t BITS_PER_BYTE = 8;

uint8_t mask_for(size_t piece_index)
{
  return static_cast<uint8_t>(1u << (7 - piece_index % BITS_PER_BYTE));
}
}  // namespace

BitField::BitField(size_t piece_count)
    : m_bitfield(bytes_for(piece_count))
{
}

BitField::BitField(std::vector<uint8_t> bitfield)
    : m_bitfield(std::move(bitfield))
{
}

void BitField::mark(size_t piece_index, bool value)
{
  size_t container_index = piece_index / BITS_PER_BYTE;

  if (container_index >= m_bitfield.size()) {
    m_bitfield.resize(container_index + 1);
  }

  if (value) {
    m_bitfield[container_index] |= mask_for(piece_index);
  } else {
    m_bitfield[container_index] &= static_cast<uint8_t>(~mask_for(piece_index));
  }
}

bool BitField::get(size_t piece_index) const
{
  size_t container_index = piece_index / BITS_PER_BYTE;

  if (container_index >= m_bitfield.size()) {
    return false;
  }

  return (mask_for(piece_index) & m_bitfield[container_index]) != 0;
}

bool BitField::is_empty() const
{
  return std::ranges::all_of(m_bitfield, [](uint8_t u) { return u == 0; });
}

size_t BitField::count() const
{
  size_t total = 0;
  for (auto u : m_bitfield) {
    total += static_cast<size_t>(std::popcount(u));
  }

  return total;
}

bool BitField::fits(size_t piece_count) const
{
  if (m_bitfield.size() != bytes_for(piece_count)) {
    return false;
  }

  for (size_t index = piece_count; index < m_bitfield.size() * BITS_PER_BYTE;
       index++)
  {
    if (get(index)) {
      return false;
    }
  }

  return true;
}
}  // namespace ftr::aux
