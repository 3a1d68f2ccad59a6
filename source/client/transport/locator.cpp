#include <algorithm>
#include <span>

#include "client/transport/locator.hpp"

#include <fmt/format.h>

#include "auxiliary/hash.hpp"

namespace ftr
{
namespace
{
constexpr std::string_view HTTP_PREFIX = "http://";
constexpr std::string_view HTTPS_PREFIX = "https://";
constexpr std::string_view FILE_PREFIX = "file://";
constexpr std::string_view TORRENT_PREFIX = "torrent://";
constexpr std::string_view TORRENT_EXTENSION = ".torrent";
constexpr std::string_view FALLBACK_FILE_NAME = "tmp.bin";
constexpr size_t KEY_BYTES = 16;

TransferError invalid(std::string_view text, std::string_view reason)
{
  return make_error(ErrorKind::InvalidInput,
                    fmt::format("locator '{}': {}", text, reason));
}

Result<Locator> parse_http(std::string_view text, bool tls)
{
  Locator locator {};
  locator.text = std::string(text);
  locator.scheme = tls ? Scheme::Https : Scheme::Http;

  auto rest = text.substr(tls ? HTTPS_PREFIX.size() : HTTP_PREFIX.size());
  auto slash = rest.find_first_of("/?#");
  auto authority = rest.substr(0, slash);
  auto target =
      slash == std::string_view::npos ? std::string_view {} : rest.substr(slash);

  // drop user info, it is never sent
  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }

  if (authority.starts_with('[')) {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::unexpected(invalid(text, "unterminated IPv6 address"));
    }
    locator.host = std::string(authority.substr(1, close - 1));
    authority = authority.substr(close + 1);
    if (authority.starts_with(':')) {
      locator.port = std::string(authority.substr(1));
    } else if (!authority.empty()) {
      return std::unexpected(invalid(text, "malformed authority"));
    }
  } else if (auto colon = authority.rfind(':');
             colon != std::string_view::npos)
  {
    locator.host = std::string(authority.substr(0, colon));
    locator.port = std::string(authority.substr(colon + 1));
  } else {
    locator.host = std::string(authority);
  }

  if (locator.host.empty()) {
    return std::unexpected(invalid(text, "missing host"));
  }

  if (locator.port.empty()) {
    locator.port = tls ? "443" : "80";
  } else if (!std::ranges::all_of(locator.port,
                                  [](char c) { return c >= '0' && c <= '9'; })
             || locator.port.size() > 5 || std::stoul(locator.port) > 65535)
  {
    return std::unexpected(invalid(text, "invalid port"));
  }

  if (auto fragment = target.find('#'); fragment != std::string_view::npos) {
    target = target.substr(0, fragment);
  }
  locator.target = target.empty() || target.front() != '/'
      ? fmt::format("/{}", target)
      : std::string(target);

  return locator;
}

Result<Locator> parse_path(std::string_view text,
                           std::string_view path,
                           Scheme scheme)
{
  if (path.empty()) {
    return std::unexpected(invalid(text, "missing path"));
  }

  Locator locator {};
  locator.text = std::string(text);
  locator.scheme = scheme;
  locator.path = std::filesystem::path(path);
  return locator;
}

bool usable_file_name(std::string_view name)
{
  return !name.empty() && name != "." && name != "..";
}
}  // namespace

Result<Locator> Locator::parse(std::string_view text)
{
  if (text.empty()) {
    return std::unexpected(invalid(text, "empty"));
  }

  if (text.starts_with(HTTP_PREFIX)) {
    return parse_http(text, false);
  }
  if (text.starts_with(HTTPS_PREFIX)) {
    return parse_http(text, true);
  }
  if (text.starts_with(FILE_PREFIX)) {
    return parse_path(text, text.substr(FILE_PREFIX.size()), Scheme::File);
  }
  if (text.starts_with(TORRENT_PREFIX)) {
    return parse_path(
        text, text.substr(TORRENT_PREFIX.size()), Scheme::Torrent);
  }

  if (auto scheme_end = text.find("://"); scheme_end != std::string_view::npos)
  {
    return std::unexpected(invalid(
        text,
        fmt::format("unsupported scheme '{}'", text.substr(0, scheme_end))));
  }

  return parse_path(text,
                    text,
                    text.ends_with(TORRENT_EXTENSION) ? Scheme::Torrent
                                                      : Scheme::File);
}

std::string Locator::key() const
{
  aux::Sha256 hasher;
  hasher.update(std::span(reinterpret_cast<const uint8_t*>(text.data()),
                          text.size()));
  auto digest = hasher.finish();
  return aux::to_hex(std::span(digest).first(KEY_BYTES));
}

std::string Locator::file_name() const
{
  if (scheme == Scheme::Http || scheme == Scheme::Https) {
    std::string_view path = target;
    path = path.substr(0, path.find('?'));
    auto name = path.substr(path.rfind('/') + 1);
    return usable_file_name(name) ? std::string(name)
                                  : std::string(FALLBACK_FILE_NAME);
  }

  auto name = path.filename().string();
  return usable_file_name(name) ? name : std::string(FALLBACK_FILE_NAME);
}

Result<Locator> Locator::resolve(std::string_view location) const
{
  if (location.find("://") != std::string_view::npos) {
    return parse(location);
  }

  if (scheme != Scheme::Http && scheme != Scheme::Https) {
    return std::unexpected(invalid(location, "relative redirect"));
  }

  std::string_view scheme_prefix =
      scheme == Scheme::Https ? HTTPS_PREFIX : HTTP_PREFIX;

  if (location.starts_with("//")) {
    return parse(fmt::format("{}{}", scheme_prefix, location.substr(2)));
  }

  auto authority = fmt::format("{}{}:{}", scheme_prefix, host, port);
  if (host.find(':') != std::string::npos) {
    authority = fmt::format("{}[{}]:{}", scheme_prefix, host, port);
  }

  if (location.starts_with('/')) {
    return parse(fmt::format("{}{}", authority, location));
  }

  std::string_view base = target;
  base = base.substr(0, base.find('?'));
  base = base.substr(0, base.rfind('/') + 1);
  return parse(fmt::format("{}{}{}", authority, base, location));
}
}  // namespace ftr
