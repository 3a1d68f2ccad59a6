#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

#include "client/settings.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace ftr
{
namespace
{
template<typename T>
void read_field(const json& document, const char* key, T& out)
{
  if (auto it = document.find(key); it != document.end()) {
    out = it->get<T>();
  }
}

template<typename Duration>
void read_duration(const json& document, const char* key, Duration& out)
{
  if (auto it = document.find(key); it != document.end()) {
    out = Duration {it->get<typename Duration::rep>()};
  }
}

void read_path(const json& document,
               const char* key,
               std::filesystem::path& out)
{
  if (auto it = document.find(key); it != document.end()) {
    out = it->get<std::string>();
  }
}
}  // namespace

uint32_t Settings::resolved_threads() const
{
  if (threads > 0) {
    return threads;
  }

  return std::max(2u, std::thread::hardware_concurrency());
}

std::filesystem::path Settings::resolved_state_directory() const
{
  return state_directory.empty() ? target_directory : state_directory;
}

Result<Settings> parse_settings(std::string_view json_text, Settings defaults)
{
  Settings settings = std::move(defaults);

  try {
    auto document = json::parse(json_text);
    if (!document.is_object()) {
      return std::unexpected(make_error(ErrorKind::InvalidInput,
                                        "settings must be a JSON object"));
    }

    read_field(document, "workers", settings.workers);
    read_field(document, "max_concurrent_units", settings.max_concurrent_units);
    read_field(document, "increment_bytes", settings.increment_bytes);
    read_field(document, "retry_budget", settings.retry_budget);
    read_duration(document, "backoff_base_ms", settings.backoff_base);
    read_duration(document, "backoff_cap_ms", settings.backoff_cap);
    read_duration(document, "stall_timeout_s", settings.stall_timeout);
    read_duration(document, "progress_interval_ms", settings.progress_interval);
    read_duration(document, "pause_timeout_ms", settings.pause_timeout);
    read_field(document, "threads", settings.threads);

    read_duration(document, "peer_idle_timeout_s", settings.peer_idle_timeout);
    read_duration(document, "connect_timeout_s", settings.connect_timeout);
    read_duration(document, "handshake_timeout_s", settings.handshake_timeout);
    read_field(document, "pipeline_depth", settings.pipeline_depth);
    read_field(document, "block_bytes", settings.block_bytes);
    read_field(document, "target_peers", settings.target_peers);
    read_field(
        document, "max_candidate_failures", settings.max_candidate_failures);
    read_field(
        document, "max_piece_hash_failures", settings.max_piece_hash_failures);
    read_field(
        document, "max_peer_hash_failures", settings.max_peer_hash_failures);
    read_duration(document, "tracker_timeout_s", settings.tracker_timeout);
    read_duration(
        document, "announce_backoff_base_s", settings.announce_backoff_base);
    read_duration(
        document, "announce_backoff_cap_s", settings.announce_backoff_cap);
    read_field(document, "max_announce_failures", settings.max_announce_failures);
    read_field(document, "listen_port", settings.listen_port);

    read_path(document, "target_directory", settings.target_directory);
    read_path(document, "state_directory", settings.state_directory);
    read_field(document, "resume", settings.resume);
    read_field(document, "overwrite", settings.overwrite);
    read_field(document, "keep_parts", settings.keep_parts);
    read_field(document, "discard_corrupt_state", settings.discard_corrupt_state);
    read_field(document, "log_level", settings.log_level);
    read_path(document, "log_file", settings.log_file);

    if (auto it = document.find("expected_sha256"); it != document.end()) {
      auto digest = aux::sha256_from_hex(it->get<std::string>());
      if (!digest) {
        return std::unexpected(make_error(
            ErrorKind::InvalidInput, "expected_sha256 is not a SHA-256 hex digest"));
      }
      settings.expected_sha256 = *digest;
    }
  } catch (const json::exception& e) {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput, fmt::format("invalid settings: {}", e.what())));
  }

  if (settings.workers == 0 || settings.max_concurrent_units == 0
      || settings.increment_bytes == 0 || settings.block_bytes == 0
      || settings.pipeline_depth == 0)
  {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput,
        "workers, max_concurrent_units, increment_bytes, block_bytes and "
        "pipeline_depth must be positive"));
  }

  return settings;
}

Result<Settings> load_settings(const std::filesystem::path& path,
                               Settings defaults)
{
  std::ifstream file {path};
  if (!file) {
    return std::unexpected(make_error(
        ErrorKind::InvalidInput,
        fmt::format("couldn't open settings file {}", path.string())));
  }

  std::stringstream contents {};
  contents << file.rdbuf();

  return parse_settings(contents.str(), std::move(defaults));
}
}  // namespace ftr
