#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "auxiliary/hash.hpp"
#include "client/error.hpp"

namespace ftr
{
using namespace std::chrono_literals;

struct Settings
{
  // bulk transfers
  uint32_t workers = 4;
  uint32_t max_concurrent_units = 8;
  uint32_t increment_bytes = 64 * 1024;
  uint32_t retry_budget = 5;
  std::chrono::milliseconds backoff_base = 500ms;
  std::chrono::milliseconds backoff_cap = 30s;
  std::chrono::seconds stall_timeout = 60s;

  // job control
  std::chrono::milliseconds progress_interval = 500ms;
  std::chrono::milliseconds pause_timeout = 5s;
  uint32_t threads = 0;  // 0: hardware concurrency

  // swarm transfers
  std::chrono::seconds peer_idle_timeout = 120s;
  std::chrono::seconds connect_timeout = 10s;
  std::chrono::seconds handshake_timeout = 10s;
  uint32_t pipeline_depth = 5;
  uint32_t block_bytes = 16 * 1024;
  uint32_t target_peers = 30;
  uint32_t max_candidate_failures = 3;
  uint32_t max_piece_hash_failures = 5;
  uint32_t max_peer_hash_failures = 3;
  std::chrono::seconds tracker_timeout = 15s;
  std::chrono::seconds announce_backoff_base = 15s;
  std::chrono::seconds announce_backoff_cap = 30min;
  uint32_t max_announce_failures = 8;
  uint16_t listen_port = 6881;

  // destination and state
  std::filesystem::path target_directory = ".download";
  std::filesystem::path state_directory;  // empty: target directory
  bool resume = true;
  bool overwrite = false;
  bool keep_parts = false;
  bool discard_corrupt_state = false;
  std::optional<aux::Sha256Digest> expected_sha256;

  std::string log_level = "info";
  std::filesystem::path log_file;

  uint32_t resolved_threads() const;

  std::filesystem::path resolved_state_directory() const;
};

// Reads overrides for the defaults above from a JSON document. Keys that are
// absent keep their default; unknown keys are ignored.
Result<Settings> load_settings(const std::filesystem::path& path,
                               Settings defaults = {});

Result<Settings> parse_settings(std::string_view json_text,
                                Settings defaults = {});
}  // namespace ftr
