#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "client/error.hpp"

namespace ftr
{
enum class Scheme : uint8_t
{
  Http,
  Https,
  File,
  Torrent
};

/*
 * A parsed resource locator. The scheme selects the transport:
 *   http://, https://            ranged bulk transfer
 *   file://<path>, plain path    local ranged transfer
 *   torrent://<path>, *.torrent  swarm transfer driven by a descriptor file
 */
struct Locator
{
  std::string text;
  Scheme scheme = Scheme::File;

  // http(s)
  std::string host;
  std::string port;
  std::string target;

  // file and torrent
  std::filesystem::path path;

  static Result<Locator> parse(std::string_view text);

  bool is_swarm() const { return scheme == Scheme::Torrent; }

  // Stable identifier used to name the state file and part directory.
  std::string key() const;

  // Last path segment, or "tmp.bin" when the locator has none.
  std::string file_name() const;

  // Resolves `location` (absolute or relative, from a redirect) against this
  // locator.
  Result<Locator> resolve(std::string_view location) const;
};
}  // namespace ftr
