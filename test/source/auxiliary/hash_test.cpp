#include <chrono>
#include <string_view>

#include <catch2/catch_test_macros.hpp>

#include "auxiliary/hash.hpp"
#include "auxiliary/random.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

namespace
{
std::span<const uint8_t> bytes_of(std::string_view text)
{
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}
}  // namespace

TEST_CASE("SHA-1 matches the reference digest", "[hash]")
{
  REQUIRE(ftr::aux::to_hex(ftr::aux::sha1(bytes_of("abc")))
          == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_CASE("SHA-256 hashes incrementally", "[hash]")
{
  ftr::aux::Sha256 whole;
  whole.update(bytes_of("abc"));
  auto digest = whole.finish();

  REQUIRE(ftr::aux::to_hex(digest)
          == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  ftr::aux::Sha256 pieces;
  pieces.update(bytes_of("a"));
  pieces.update(bytes_of(""));
  pieces.update(bytes_of("bc"));
  REQUIRE(pieces.finish() == digest);
}

TEST_CASE("Hex digests parse back", "[hash]")
{
  auto hex = std::string(
      "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
  auto digest = ftr::aux::sha256_from_hex(hex);
  REQUIRE(digest);
  REQUIRE(ftr::aux::to_hex(*digest)
          == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  REQUIRE_FALSE(ftr::aux::sha256_from_hex("abc"));
  REQUIRE_FALSE(ftr::aux::sha256_from_hex(std::string(64, 'z')));
}

TEST_CASE("File hashing does not depend on the chunk size", "[hash]")
{
  ftr::test::TempDirectory directory;
  auto content = ftr::test::pattern_bytes(1000);
  ftr::test::write_file(directory / "data.bin", content);

  ftr::aux::Sha256 reference;
  reference.update(content);
  auto expected = reference.finish();

  REQUIRE(ftr::aux::sha256_file(directory / "data.bin", 3) == expected);
  REQUIRE(ftr::aux::sha256_file(directory / "data.bin", 4096) == expected);
  REQUIRE_THROWS_AS(ftr::aux::sha256_file(directory / "missing.bin", 64),
                    std::system_error);
}

TEST_CASE("Backoff grows and stays within its cap", "[hash][backoff]")
{
  for (int i = 0; i < 50; i++) {
    auto first = ftr::aux::jittered_backoff(100ms, 1000ms, 0);
    REQUIRE(first >= 50ms);
    REQUIRE(first <= 100ms);

    auto third = ftr::aux::jittered_backoff(100ms, 1000ms, 2);
    REQUIRE(third >= 200ms);
    REQUIRE(third <= 400ms);

    auto capped = ftr::aux::jittered_backoff(100ms, 1000ms, 30);
    REQUIRE(capped >= 500ms);
    REQUIRE(capped <= 1000ms);
  }
}
