#pragma once

#include <algorithm>
#include <array>
#include <cstdint>

#include "auxiliary/big_endian.hpp"
#include "auxiliary/random.hpp"
#include "client/context.hpp"

namespace ftr
{
#pragma pack(push, 1)

/// UDP tracker protocol (BEP 15).

enum class Actions : int32_t
{
  Connect = 0,
  Announce = 1,
  Scrape = 2,
  Error = 3,  // Only sent by tracker to client
};

enum class AnnounceEvent : uint32_t
{
  None = 0,
  Completed = 1,
  Started = 2,
  Stopped = 3,
};

constexpr uint64_t ANNOUNCER_MAGIC = 0x41727101980;

struct FTR_PACKED ConnectRequest
{
  uint64_big protocol_id = ANNOUNCER_MAGIC;
  uint32_big action = static_cast<uint32_t>(Actions::Connect);
  uint32_big transaction_id =
      aux::generate_random_in_range<uint32_t, 0, UINT32_MAX>();
};

struct FTR_PACKED ConnectResponse
{
  uint32_big action;
  uint32_big transaction_id;
  uint64_big connection_id;
};

struct FTR_PACKED UdpAnnounceRequest
{
  uint64_big connection_id;
  uint32_big action = static_cast<uint32_t>(Actions::Announce);
  uint32_big transaction_id =
      aux::generate_random_in_range<uint32_t, 0, UINT32_MAX>();

  uint8_t info_hash[20] {0};
  uint8_t peer_id[20] {0};
  uint64_big downloaded;
  uint64_big left;
  uint64_big uploaded;
  uint32_big event = 0;  // 0: none; 1: completed; 2: started; 3: stopped
  uint32_big ip_address = 0;  // default, your ip, 0 = this ip
  uint32_big key = aux::generate_random_in_range<uint32_t, 0, UINT32_MAX>();
  int32_big num_want = -1;  // num of peers in reply (-1 = default)
  uint16_big port;  // your listening port
};

struct FTR_PACKED IpV4Port
{
  uint32_big ip;
  uint16_big port;
};

struct FTR_PACKED UdpAnnounceResponse
{
  uint32_big action;
  uint32_big transaction_id;
  uint32_big interval;
  uint32_big leechers;
  uint32_big seeders;
  // IpV4Port[N]...
};

struct FTR_PACKED UdpErrorHeader
{
  uint32_big action;
  uint32_big transaction_id;
  // message string...
};

#pragma pack(pop)

static_assert(sizeof(ConnectRequest) == 16);
static_assert(sizeof(UdpAnnounceRequest) == 98);
static_assert(sizeof(UdpAnnounceResponse) == 20);
}  // namespace ftr
