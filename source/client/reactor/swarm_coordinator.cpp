#include <algorithm>
#include <exception>
#include <iterator>
#include <optional>
#include <string>

#include "client/reactor/swarm_coordinator.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "auxiliary/random.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace ftr
{
using namespace std::chrono_literals;

namespace
{
constexpr auto TICK = 250ms;
constexpr std::chrono::seconds MIN_REANNOUNCE = 30s;
}  // namespace

SwarmCoordinator::SwarmCoordinator(boost::asio::any_io_executor pool_executor,
                                   const TorrentFile& torrent,
                                   PieceStore& store,
                                   const Settings& settings,
                                   const std::atomic<bool>& stop,
                                   std::vector<PeerEndpoint> initial_peers,
                                   PieceHandler on_piece_verified)
    : m_pool_executor {pool_executor}
    , m_strand {boost::asio::make_strand(pool_executor)}
    , m_tick {m_strand}
    , m_torrent {torrent}
    , m_store {store}
    , m_settings {settings}
    , m_stop {stop}
    , m_on_piece_verified {std::move(on_piece_verified)}
    , m_strategy {store}
{
  m_session_config.info_hash = torrent.info_hash;
  m_session_config.peer_id = m_peer_id;
  m_session_config.connect_timeout = settings.connect_timeout;
  m_session_config.handshake_timeout = settings.handshake_timeout;
  m_session_config.idle_timeout = settings.peer_idle_timeout;
  m_session_config.pipeline_depth = settings.pipeline_depth;

  for (const auto& peer : initial_peers) {
    queue_candidate(peer);
  }
}

void SwarmCoordinator::add_peers(std::vector<PeerEndpoint> peers)
{
  boost::asio::post(m_strand,
                    [self = shared_from_this(), peers = std::move(peers)]
                    {
                      for (const auto& peer : peers) {
                        self->queue_candidate(peer);
                      }
                      self->m_tick.cancel();
                    });
}

awaitable<SwarmResult> SwarmCoordinator::run()
{
  auto self = shared_from_this();
  install_store_handlers();

  for (const auto& url : m_torrent.trackers) {
    auto tracker = Tracker::from_url(url);
    if (!tracker) {
      spdlog::warn("skipping tracker {}: {}", url, tracker.error().message);
      continue;
    }

    m_active_announcers++;
    boost::asio::co_spawn(
        m_strand,
        [self, tracker = std::move(*tracker)]() -> awaitable<void>
        { co_await self->announce_loop(tracker); },
        boost::asio::detached);
  }

  SwarmResult result {};

  while (true) {
    if (m_store.all_completed()) {
      result.phase = TransferPhase::Complete;
      break;
    }

    if (m_store.any_failed()) {
      result.phase = TransferPhase::Failed;
      result.error = failed_piece_error();
      break;
    }

    if (m_stop.load(std::memory_order_acquire)) {
      result.phase = TransferPhase::Paused;
      break;
    }

    if (m_active_announcers == 0 && m_sessions.empty() && m_candidates.empty())
    {
      result.phase = TransferPhase::Failed;
      result.error = make_error(ErrorKind::Transport,
                                "no reachable peers left for the swarm");
      break;
    }

    connect_candidates();
    wake_idle_sessions();

    m_tick.expires_after(TICK);
    boost::system::error_code ec;
    co_await m_tick.async_wait(boost::asio::redirect_error(use_awaitable, ec));
  }

  co_await drain();

  spdlog::debug("swarm finished in phase {}, {}/{} pieces",
                to_string(result.phase),
                m_store.completed_count(),
                m_store.piece_count());
  co_return result;
}

void SwarmCoordinator::install_store_handlers()
{
  std::weak_ptr<SwarmCoordinator> weak = weak_from_this();

  m_store.on_piece_completed(
      [weak, handler = m_on_piece_verified](uint32_t piece)
      {
        spdlog::debug("piece {} verified", piece);
        if (handler) {
          handler(piece);
        }
        if (auto self = weak.lock()) {
          boost::asio::post(self->m_strand, [self] { self->m_tick.cancel(); });
        }
      });

  m_store.on_piece_failed(
      [weak](uint32_t piece, PeerKey peer)
      {
        if (auto self = weak.lock()) {
          boost::asio::post(self->m_strand,
                            [self, piece, peer]
                            { self->on_piece_failed(piece, peer); });
        }
      });
}

awaitable<void> SwarmCoordinator::announce_loop(Tracker tracker)
{
  boost::asio::steady_timer timer {m_strand};

  // however the loop ends, drain() must no longer see the timer
  struct Registration
  {
    SwarmCoordinator& coordinator;
    boost::asio::steady_timer& timer;

    Registration(SwarmCoordinator& p_coordinator,
                 boost::asio::steady_timer& p_timer)
        : coordinator {p_coordinator}
        , timer {p_timer}
    {
      coordinator.m_announce_timers.insert(&timer);
    }

    ~Registration()
    {
      coordinator.m_announce_timers.erase(&timer);
      coordinator.m_active_announcers--;
      coordinator.m_tick.cancel();
    }
  } registration {*this, timer};

  uint32_t failures = 0;
  auto event = AnnounceEvent::Started;

  while (!m_finished) {
    AnnounceParams params {};
    params.info_hash = m_torrent.info_hash;
    params.peer_id = m_peer_id;
    params.downloaded = m_store.completed_bytes();
    params.left = m_torrent.file_length - params.downloaded;
    params.port = m_settings.listen_port;
    params.num_want = static_cast<int32_t>(m_settings.target_peers);
    params.event = event;

    std::chrono::seconds delay {0};
    std::optional<std::string> failure;
    try {
      auto response = co_await tracker.announce(params, m_settings.tracker_timeout);
      if (m_finished) {
        break;
      }

      spdlog::debug("tracker {} returned {} peers",
                    tracker.url(),
                    response.peers.size());
      failures = 0;
      event = AnnounceEvent::None;
      for (const auto& peer : response.peers) {
        queue_candidate(peer);
      }
      m_tick.cancel();

      delay = std::max(response.interval, MIN_REANNOUNCE);
    } catch (const TransferException& e) {
      failure = e.error().message;
    } catch (const boost::system::system_error& e) {
      failure = e.what();
    }

    if (failure) {
      if (m_finished) {
        break;
      }

      failures++;
      spdlog::warn("announce to {} failed ({} of {}): {}",
                   tracker.url(),
                   failures,
                   m_settings.max_announce_failures,
                   *failure);

      if (failures >= m_settings.max_announce_failures) {
        spdlog::warn("giving up on tracker {}", tracker.url());
        break;
      }

      delay = aux::jittered_backoff(m_settings.announce_backoff_base,
                                    m_settings.announce_backoff_cap,
                                    failures - 1);
    }

    timer.expires_after(delay);
    boost::system::error_code ec;
    co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
  }
}

awaitable<void> SwarmCoordinator::drain()
{
  m_finished = true;
  m_candidates.clear();
  m_queued.clear();

  for (auto* timer : m_announce_timers) {
    timer->cancel();
  }

  for (auto& [key, session] : m_sessions) {
    session->stop();
  }

  while (!m_sessions.empty()) {
    m_tick.expires_after(TICK);
    boost::system::error_code ec;
    co_await m_tick.async_wait(boost::asio::redirect_error(use_awaitable, ec));
  }

  m_store.on_piece_completed({});
  m_store.on_piece_failed({});
}

void SwarmCoordinator::queue_candidate(const PeerEndpoint& endpoint)
{
  if (m_finished || m_banned.contains(endpoint) || m_queued.contains(endpoint)
      || m_keys.contains(endpoint))
  {
    return;
  }

  m_queued.insert(endpoint);
  m_candidates.push_back(endpoint);
}

void SwarmCoordinator::connect_candidates()
{
  while (m_sessions.size() < m_settings.target_peers && !m_candidates.empty())
  {
    auto endpoint = m_candidates.front();
    m_candidates.pop_front();
    m_queued.erase(endpoint);

    if (m_banned.contains(endpoint) || m_keys.contains(endpoint)) {
      continue;
    }

    spawn_session(endpoint);
  }
}

void SwarmCoordinator::spawn_session(const PeerEndpoint& endpoint)
{
  auto key = m_next_key++;
  auto session =
      std::make_shared<PeerSession>(boost::asio::make_strand(m_pool_executor),
                                    endpoint,
                                    key,
                                    m_session_config,
                                    m_store,
                                    m_strategy);

  m_sessions.emplace(key, session);
  m_keys.emplace(endpoint, key);
  m_connected.store(m_sessions.size(), std::memory_order_relaxed);

  spdlog::debug("connecting to peer {}", endpoint.to_string());

  boost::asio::co_spawn(
      session->executor(),
      [session]() -> awaitable<void> { co_await session->run(); },
      [self = shared_from_this(), session](std::exception_ptr error)
      {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception& e) {
            spdlog::error("peer {} session aborted: {}",
                          session->endpoint().to_string(),
                          e.what());
          }
        }

        boost::asio::post(self->m_strand,
                          [self, session]
                          { self->on_session_finished(session); });
      });
}

void SwarmCoordinator::on_session_finished(
    const std::shared_ptr<PeerSession>& session)
{
  const auto& endpoint = session->endpoint();
  const auto& activity = session->activity();

  m_sessions.erase(session->key());
  m_keys.erase(endpoint);
  m_connected.store(m_sessions.size(), std::memory_order_relaxed);
  m_tick.cancel();

  if (m_finished || m_banned.contains(endpoint)) {
    return;
  }

  if (activity.exit_kind == ErrorKind::ProtocolMismatch) {
    spdlog::warn("dropping peer {}: {}",
                 endpoint.to_string(),
                 activity.exit_message);
    m_banned.insert(endpoint);
    return;
  }

  auto& failures = m_connect_failures[endpoint];
  if (activity.bytes_received > 0) {
    failures = 0;
  } else {
    failures++;
  }

  if (failures < m_settings.max_candidate_failures) {
    queue_candidate(endpoint);
  } else {
    spdlog::debug("giving up on peer {} after {} failed attempts",
                  endpoint.to_string(),
                  failures);
  }
}

void SwarmCoordinator::on_piece_failed(uint32_t piece, PeerKey peer)
{
  auto failures = ++m_peer_hash_failures[peer];

  auto session = m_sessions.find(peer);
  auto name = session != m_sessions.end() ? session->second->endpoint().to_string()
                                          : fmt::format("#{}", peer);
  spdlog::warn("piece {} from peer {} failed its hash check", piece, name);

  if (failures >= m_settings.max_peer_hash_failures
      && session != m_sessions.end())
  {
    spdlog::warn("banning peer {} after {} corrupt pieces", name, failures);
    m_banned.insert(session->second->endpoint());
    session->second->stop();
  }

  wake_idle_sessions();
}

void SwarmCoordinator::wake_idle_sessions()
{
  for (auto& [key, session] : m_sessions) {
    if (session->phase() == SessionPhase::Idle) {
      session->wake();
    }
  }
}

std::optional<TransferError> SwarmCoordinator::failed_piece_error() const
{
  auto statuses = m_store.statuses();
  auto failed = std::find(statuses.begin(), statuses.end(), UnitStatus::Failed);
  if (failed == statuses.end()) {
    return make_error(ErrorKind::Integrity, "a piece failed verification");
  }

  auto piece = static_cast<size_t>(std::distance(statuses.begin(), failed));
  return make_error(
      ErrorKind::Integrity,
      fmt::format("piece {} failed its hash check {} times",
                  piece,
                  m_store.hash_failures(static_cast<uint32_t>(piece))),
      piece);
}
}  // namespace ftr
