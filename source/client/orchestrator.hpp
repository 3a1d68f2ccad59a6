#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "auxiliary/hash.hpp"
#include "client/context.hpp"
#include "client/error.hpp"
#include "client/peer_endpoint.hpp"
#include "client/progress.hpp"
#include "client/settings.hpp"
#include "client/transport/transport.hpp"

namespace ftr
{
class SwarmCoordinator;

struct TransferReport
{
  TransferPhase phase = TransferPhase::Initializing;
  std::filesystem::path destination;
  std::optional<uint64_t> total_size;

  uint64_t bytes_transferred = 0;  // moved during this run only
  size_t scheduled_units = 0;      // units that still needed work this run
  bool resumed = false;

  std::vector<UnitFailure> failed_units;
  std::optional<TransferError> error;
  std::optional<aux::Sha256Digest> sha256;
  std::chrono::milliseconds elapsed {0};

  bool ok() const { return phase == TransferPhase::Complete; }
};

/*
 * Drives one job at a time through
 *
 *   Initializing -> MetadataResolved -> Transferring -> Merging -> Verifying
 *   -> Complete
 *
 * with Paused reachable from Transferring and Failed from any non-terminal
 * phase. Bulk locators are split into ranges fetched by chunk workers; swarm
 * locators are handed to a SwarmCoordinator. Either way the job state is
 * persisted after every completed unit, so a paused or interrupted job picks
 * up where it stopped.
 */
class TransferOrchestrator
{
public:
  explicit TransferOrchestrator(Settings settings,
                                std::shared_ptr<IProgressSink> sink = nullptr);

  TransferOrchestrator(const TransferOrchestrator&) = delete;
  TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

  /*
   * Blocks until the job completes, pauses or fails. `destination` overrides
   * the file name derived from the locator. Never throws for job-level
   * failures; they are reported in the returned TransferReport.
   */
  TransferReport run(std::string_view locator,
                     std::optional<std::filesystem::path> destination = {});

  // Thread safe. The running job stops its workers and persists its state.
  void request_pause();

  bool pause_requested() const
  {
    return m_pause_requested.load(std::memory_order_acquire);
  }

  // Thread safe. Extra peers for the running or the next swarm job.
  void add_peers(std::vector<PeerEndpoint> peers);

  const Settings& settings() const { return m_settings; }

private:
  struct Job;
  struct BulkRun;

  boost::asio::awaitable<TransferReport> run_job(std::shared_ptr<Job> job);

  boost::asio::awaitable<void> prepare(Job& job);

  template<typename T>
  boost::asio::awaitable<void> run_bulk(std::shared_ptr<Job> job,
                                        T& transport);

  template<typename T>
  boost::asio::awaitable<ResourceMetadata> resolve_with_retry(T& transport);

  template<typename T>
  boost::asio::awaitable<void> run_lane(std::shared_ptr<Job> job,
                                        T& transport,
                                        std::shared_ptr<BulkRun> run);

  template<typename T>
  boost::asio::awaitable<void> run_unit(std::shared_ptr<Job> job,
                                        T& transport,
                                        std::shared_ptr<BulkRun> run,
                                        size_t unit);

  boost::asio::awaitable<void> run_swarm(std::shared_ptr<Job> job,
                                         SwarmTransport& transport);

  boost::asio::awaitable<void> finish_bulk(Job& job, BulkRun& run);

  void verify_destination(Job& job);

  void discard_state(Job& job, const TransferError& reason);

  void set_phase(Job& job, TransferPhase phase);

  void publish(const ProgressSnapshot& snapshot);

  Settings m_settings;
  std::shared_ptr<IProgressSink> m_sink;

  std::atomic<bool> m_stop {false};
  std::atomic<bool> m_pause_requested {false};

  std::mutex m_peers_mutex;
  std::vector<PeerEndpoint> m_injected_peers;
  std::shared_ptr<SwarmCoordinator> m_coordinator;
};
}  // namespace ftr
