#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include <boost/asio.hpp>

#include "auxiliary/peer_id.hpp"
#include "client/context.hpp"
#include "client/error.hpp"
#include "client/peer_endpoint.hpp"
#include "client/peer_session.hpp"
#include "client/reactor/strategy/rarest_first.hpp"
#include "client/settings.hpp"
#include "client/storage/piece_store.hpp"
#include "client/tracker/tracker.hpp"
#include "torrent/metadata/torrentfile.hpp"

namespace ftr
{
struct SwarmResult
{
  TransferPhase phase = TransferPhase::Failed;  // Complete, Paused or Failed
  std::optional<TransferError> error;
};

/*
 * Fills a PieceStore from a swarm. Owns the tracker announce schedules, the
 * candidate list and the pool of peer sessions; the piece choice itself is
 * delegated to the rarest-first strategy the sessions share.
 *
 * All bookkeeping lives on one strand. Sessions run on strands of their own
 * and report back by posting to it.
 */
class SwarmCoordinator : public std::enable_shared_from_this<SwarmCoordinator>
{
public:
  using PieceHandler = std::function<void(uint32_t piece)>;

  SwarmCoordinator(boost::asio::any_io_executor pool_executor,
                   const TorrentFile& torrent,
                   PieceStore& store,
                   const Settings& settings,
                   const std::atomic<bool>& stop,
                   std::vector<PeerEndpoint> initial_peers,
                   PieceHandler on_piece_verified);

  // Must be awaited on executor(). Returns once every session has ended.
  boost::asio::awaitable<SwarmResult> run();

  // Thread safe.
  void add_peers(std::vector<PeerEndpoint> peers);

  const boost::asio::any_io_executor& executor() const { return m_strand; }

  size_t connected_peers() const
  {
    return m_connected.load(std::memory_order_relaxed);
  }

  const RarestFirstStrategy& strategy() const { return m_strategy; }

private:
  boost::asio::awaitable<void> announce_loop(Tracker tracker);

  boost::asio::awaitable<void> drain();

  void install_store_handlers();

  void queue_candidate(const PeerEndpoint& endpoint);

  void connect_candidates();

  void spawn_session(const PeerEndpoint& endpoint);

  void on_session_finished(const std::shared_ptr<PeerSession>& session);

  void on_piece_failed(uint32_t piece, PeerKey peer);

  void wake_idle_sessions();

  std::optional<TransferError> failed_piece_error() const;

  boost::asio::any_io_executor m_pool_executor;
  boost::asio::any_io_executor m_strand;
  boost::asio::steady_timer m_tick;

  const TorrentFile& m_torrent;
  PieceStore& m_store;
  const Settings& m_settings;
  const std::atomic<bool>& m_stop;
  PieceHandler m_on_piece_verified;

  RarestFirstStrategy m_strategy;
  aux::PeerId m_peer_id;
  SessionConfig m_session_config;

  std::map<PeerKey, std::shared_ptr<PeerSession>> m_sessions;
  std::map<PeerEndpoint, PeerKey> m_keys;
  PeerKey m_next_key = 1;

  std::deque<PeerEndpoint> m_candidates;
  std::set<PeerEndpoint> m_queued;
  std::set<PeerEndpoint> m_banned;
  std::map<PeerEndpoint, uint32_t> m_connect_failures;
  std::map<PeerKey, uint32_t> m_peer_hash_failures;

  std::set<boost::asio::steady_timer*> m_announce_timers;
  size_t m_active_announcers = 0;
  bool m_finished = false;
  std::atomic<size_t> m_connected {0};
};
}  // namespace ftr
