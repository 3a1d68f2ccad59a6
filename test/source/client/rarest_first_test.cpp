#include <catch2/catch_test_macros.hpp>

#include "client/reactor/strategy/rarest_first.hpp"
#include "test_support.hpp"

using ftr::RarestFirstStrategy;
using ftr::aux::BitField;

namespace
{
constexpr uint32_t PIECES = 6;

BitField holding(std::initializer_list<uint32_t> pieces)
{
  BitField field {PIECES};
  for (auto piece : pieces) {
    field.mark(piece, true);
  }
  return field;
}

BitField holding_all()
{
  return holding({0, 1, 2, 3, 4, 5});
}

std::vector<ftr::PieceDescriptor> table()
{
  std::vector<ftr::PieceDescriptor> pieces;
  for (uint32_t index = 0; index < PIECES; index++) {
    pieces.push_back({index, index * 16ULL, 16, {}});
  }
  return pieces;
}

struct Fixture
{
  boost::asio::io_context io;
  ftr::test::TempDirectory directory;
  ftr::PieceStore store {
      table(),
      ftr::test::open_backing(io, directory / "target.bin"),
      16,
      3};
  RarestFirstStrategy strategy {store};
};
}  // namespace

TEST_CASE("The rarest piece is picked first", "[rarest_first]")
{
  Fixture fixture;
  auto& strategy = fixture.strategy;

  // piece 4 is held by one peer only, the rest by all five
  std::vector<BitField> peers {
      holding({0, 1, 2, 3, 5}),
      holding({0, 1, 2, 3, 5}),
      holding_all(),
      holding({0, 1, 2, 3, 5}),
      holding({0, 1, 2, 3, 5}),
  };
  for (const auto& peer : peers) {
    strategy.add_peer(peer);
  }

  REQUIRE(strategy.availability(4) == 1);
  REQUIRE(strategy.availability(0) == 5);

  REQUIRE(strategy.pick(peers[2], 3) == 4u);
  REQUIRE(fixture.store.status(4) == ftr::UnitStatus::InFlight);

  // ties go to the lowest index
  REQUIRE(strategy.pick(peers[2], 3) == 0u);
  REQUIRE(strategy.pick(peers[0], 1) == 1u);
}

TEST_CASE("Only pending pieces the peer holds are candidates",
          "[rarest_first]")
{
  Fixture fixture;
  auto& strategy = fixture.strategy;

  auto peer = holding({1, 3});
  strategy.add_peer(peer);
  fixture.store.mark_completed(1);

  REQUIRE(strategy.pick(peer, 7) == 3u);
  REQUIRE_FALSE(strategy.pick(peer, 7));
  REQUIRE_FALSE(strategy.pick(holding({}), 8));
}

TEST_CASE("Availability follows peers and announcements", "[rarest_first]")
{
  Fixture fixture;
  auto& strategy = fixture.strategy;

  auto first = holding({0, 2});
  strategy.add_peer(first);
  strategy.add_peer(holding({2}));
  strategy.add_piece(5);
  strategy.add_piece(PIECES + 3);

  REQUIRE(strategy.availability(2) == 2);
  REQUIRE(strategy.availability(5) == 1);

  strategy.remove_peer(first);
  REQUIRE(strategy.availability(0) == 0);
  REQUIRE(strategy.availability(2) == 1);
}

TEST_CASE("A peer that corrupted a piece is steered elsewhere",
          "[rarest_first]")
{
  Fixture fixture;
  auto& store = fixture.store;
  auto& strategy = fixture.strategy;

  auto bad = holding({0, 1});
  auto good = holding({0});
  strategy.add_peer(bad);
  strategy.add_peer(good);

  REQUIRE(store.try_claim(0, 1));
  std::vector<uint8_t> garbage(16, 0xab);
  REQUIRE(store.record_block(0, 0, garbage, 1) == ftr::BlockOutcome::PieceFailed);

  // another holder exists, so the corrupting peer moves on to piece 1
  REQUIRE(strategy.pick(bad, 1) == 1u);
  REQUIRE(strategy.pick(good, 2) == 0u);
}

TEST_CASE("A sole holder may retry a piece it corrupted", "[rarest_first]")
{
  Fixture fixture;
  auto& store = fixture.store;
  auto& strategy = fixture.strategy;

  auto only = holding({3});
  strategy.add_peer(only);

  REQUIRE(store.try_claim(3, 9));
  std::vector<uint8_t> garbage(16, 0x11);
  REQUIRE(store.record_block(3, 0, garbage, 9) == ftr::BlockOutcome::PieceFailed);

  REQUIRE(strategy.pick(only, 9) == 3u);
}
