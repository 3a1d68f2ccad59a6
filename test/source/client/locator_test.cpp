#include <catch2/catch_test_macros.hpp>

#include "client/transport/locator.hpp"

using ftr::ErrorKind;
using ftr::Locator;
using ftr::Scheme;

TEST_CASE("HTTP locators", "[locator]")
{
  SECTION("defaults")
  {
    auto locator = Locator::parse("http://example.com");
    REQUIRE(locator);
    REQUIRE(locator->scheme == Scheme::Http);
    REQUIRE(locator->host == "example.com");
    REQUIRE(locator->port == "80");
    REQUIRE(locator->target == "/");
    REQUIRE(locator->file_name() == "tmp.bin");
    REQUIRE_FALSE(locator->is_swarm());
  }

  SECTION("port, query and fragment")
  {
    auto locator =
        Locator::parse("https://user@mirror.example.org:8443/pub/iso/disk.img?x=1#top");
    REQUIRE(locator);
    REQUIRE(locator->scheme == Scheme::Https);
    REQUIRE(locator->host == "mirror.example.org");
    REQUIRE(locator->port == "8443");
    REQUIRE(locator->target == "/pub/iso/disk.img?x=1");
    REQUIRE(locator->file_name() == "disk.img");
  }

  SECTION("IPv6 literal")
  {
    auto locator = Locator::parse("http://[::1]:8080/a.bin");
    REQUIRE(locator);
    REQUIRE(locator->host == "::1");
    REQUIRE(locator->port == "8080");
  }

  SECTION("https default port")
  {
    auto locator = Locator::parse("https://example.com/x");
    REQUIRE(locator);
    REQUIRE(locator->port == "443");
  }
}

TEST_CASE("Local and swarm locators", "[locator]")
{
  auto file = Locator::parse("file:///srv/data/archive.tar");
  REQUIRE(file);
  REQUIRE(file->scheme == Scheme::File);
  REQUIRE(file->path == "/srv/data/archive.tar");
  REQUIRE(file->file_name() == "archive.tar");

  auto plain = Locator::parse("relative/dir/blob.bin");
  REQUIRE(plain);
  REQUIRE(plain->scheme == Scheme::File);

  auto torrent = Locator::parse("torrent:///tmp/debian.torrent");
  REQUIRE(torrent);
  REQUIRE(torrent->is_swarm());
  REQUIRE(torrent->path == "/tmp/debian.torrent");

  auto torrent_path = Locator::parse("/tmp/ubuntu.torrent");
  REQUIRE(torrent_path);
  REQUIRE(torrent_path->scheme == Scheme::Torrent);
}

TEST_CASE("Malformed locators are rejected before any I/O", "[locator]")
{
  for (auto text : {"", "ftp://example.com/file", "http://", "http://host:99999/",
                    "http://host:12ab/", "http://[::1/", "file://"})
  {
    auto locator = Locator::parse(text);
    INFO(text);
    REQUIRE_FALSE(locator);
    REQUIRE(locator.error().kind == ErrorKind::InvalidInput);
  }
}

TEST_CASE("Locator keys are stable and distinct", "[locator]")
{
  auto first = Locator::parse("http://example.com/a.bin");
  auto again = Locator::parse("http://example.com/a.bin");
  auto other = Locator::parse("http://example.com/b.bin");

  REQUIRE(first->key() == again->key());
  REQUIRE(first->key() != other->key());
  REQUIRE(first->key().size() == 32);
}

TEST_CASE("Redirect locations resolve against the request", "[locator]")
{
  auto base = Locator::parse("http://example.com:8080/dir/a.bin?q=1");
  REQUIRE(base);

  auto relative = base->resolve("b.bin");
  REQUIRE(relative);
  REQUIRE(relative->host == "example.com");
  REQUIRE(relative->port == "8080");
  REQUIRE(relative->target == "/dir/b.bin");

  auto rooted = base->resolve("/other/c.bin");
  REQUIRE(rooted);
  REQUIRE(rooted->target == "/other/c.bin");

  auto network_path = base->resolve("//cdn.example.net/d.bin");
  REQUIRE(network_path);
  REQUIRE(network_path->host == "cdn.example.net");
  REQUIRE(network_path->port == "80");

  auto absolute = base->resolve("https://secure.example.com/e.bin");
  REQUIRE(absolute);
  REQUIRE(absolute->scheme == Scheme::Https);
}
