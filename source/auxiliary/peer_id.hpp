#pragma once

#include <algorithm>
#include <array>
#include <climits>
#include <cstdint>
#include <random>
#include <string>

namespace ftr::aux
{
/*
 * Azureus-style client id: -FT0100-<12 random bytes>
 */
class PeerId
{
public:
  using raw_type = std::array<uint8_t, 20>;

  PeerId()
      : m_peer_id {'-', 'F', 'T', '0', '1', '0', '0', '-'}
  {
    std::independent_bits_engine<std::mt19937, CHAR_BIT, unsigned int> rbe {
        std::random_device {}()};
    std::generate(m_peer_id.begin() + PREFIX_LENGTH,
                  m_peer_id.end(),
                  [&rbe] { return static_cast<uint8_t>(rbe()); });
  }

  explicit PeerId(const raw_type& raw)
      : m_peer_id {raw}
  {
  }

  const raw_type& as_raw() const { return m_peer_id; }

  std::string as_string() const
  {
    return std::string(m_peer_id.begin(), m_peer_id.end());
  }

private:
  static constexpr size_t PREFIX_LENGTH = 8;

  raw_type m_peer_id;
};
}  // namespace ftr::aux
