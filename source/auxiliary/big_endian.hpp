#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

#ifndef FTR_PACKED
#  if defined BROKEN_GCC_STRUCTURE_PACKING && defined __GNUC__
// Used for gcc tool chains accepting but not supporting pragma pack
// See http://gcc.gnu.org/onlinedocs/gcc/Type-Attributes.html
#    define FTR_PACKED __attribute__((__packed__))
#  else
#    define FTR_PACKED
#  endif  // defined BROKEN_GCC_STRUCTURE_PACKING && defined __GNUC__
#endif  // ndef FTR_PACKED

namespace ftr::aux
{
template<typename T>
constexpr inline T switch_endian_on_le_machine(T value)
{
  if constexpr (std::endian::native == std::endian::little) {
    return std::byteswap(value);
  } else {
    return value;
  }
}

// Reads a network-order integer from an unaligned buffer.
template<typename T>
T load_big_endian(const uint8_t* data)
{
  T value;
  std::memcpy(&value, data, sizeof(T));
  return switch_endian_on_le_machine(value);
}

template<typename T>
void store_big_endian(uint8_t* data, T value)
{
  value = switch_endian_on_le_machine(value);
  std::memcpy(data, &value, sizeof(T));
}

#pragma pack(push, 1)

// Network-order field for packed wire structs.
template<typename T>
class FTR_PACKED BigEndian
{
public:
  BigEndian() = default;

  BigEndian(T value)
      : m_be_value {switch_endian_on_le_machine(value)}
  {
  }

  T operator=(T value)
  {
    m_be_value = switch_endian_on_le_machine(value);
    return value;
  }

  operator T() const { return switch_endian_on_le_machine(m_be_value); }

private:
  T m_be_value = 0;
};

#pragma pack(pop)
}  // namespace ftr::aux

namespace ftr
{
using int32_big = aux::BigEndian<int32_t>;
using uint16_big = aux::BigEndian<uint16_t>;
using uint32_big = aux::BigEndian<uint32_t>;
using uint64_big = aux::BigEndian<uint64_t>;
}  // namespace ftr
