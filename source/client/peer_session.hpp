#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include <boost/asio.hpp>
#include <boost/circular_buffer.hpp>

#include "auxiliary/peer_id.hpp"
#include "client/context.hpp"
#include "client/error.hpp"
#include "client/peer_endpoint.hpp"
#include "client/reactor/strategy/strategy.hpp"
#include "client/storage/piece_store.hpp"
#include "client/transmit/transmit.hpp"
#include "torrent/bitfield/bitfield.hpp"
#include "torrent/messages.hpp"

namespace ftr
{
enum class SessionPhase : uint8_t
{
  Connecting,
  Handshaking,
  Idle,
  Requesting,
  Disconnected
};

std::string_view to_string(SessionPhase phase);

struct SessionConfig
{
  InfoHash info_hash {};
  aux::PeerId peer_id;
  std::chrono::seconds connect_timeout {10};
  std::chrono::seconds handshake_timeout {10};
  std::chrono::seconds idle_timeout {120};
  uint32_t pipeline_depth = 5;
};

struct PeerActivity
{
  boost::circular_buffer<ParseError> latest_parse_errors {3};

  std::optional<ErrorKind> exit_kind;
  std::string exit_message;
  uint64_t bytes_received = 0;
  bool handshake_completed = false;
};

struct RequestIdentifier
{
  uint32_t piece_index;
  uint32_t piece_offset;
  uint32_t block_length;
  auto operator<=>(const RequestIdentifier&) const = default;
};

/*
 * One connection to a remote peer, download only.
 *
 * Connecting -> Handshaking -> Idle <-> Requesting -> Disconnected
 *
 * The session claims one piece at a time through the strategy and keeps up
 * to `pipeline_depth` block requests outstanding. Everything runs on the
 * socket's strand: a reader loop that handles incoming frames and a writer
 * that drains the outbox.
 */
class PeerSession : public std::enable_shared_from_this<PeerSession>
{
public:
  PeerSession(boost::asio::any_io_executor strand,
              PeerEndpoint endpoint,
              PeerKey key,
              SessionConfig config,
              PieceStore& store,
              IPieceStrategy& strategy);

  // Runs the session to completion. Failures end up in activity(), never
  // as exceptions.
  boost::asio::awaitable<void> run();

  // Thread safe. Closes the connection; run() returns soon after.
  void stop();

  // Thread safe. Asks an idle session to look for work again.
  void wake();

  SessionPhase phase() const { return m_phase.load(std::memory_order_acquire); }

  const boost::asio::any_io_executor& executor() const { return m_strand; }

  const PeerEndpoint& endpoint() const { return m_endpoint; }

  PeerKey key() const { return m_key; }

  // Stable once run() has returned.
  const PeerActivity& activity() const { return m_activity; }

  const std::optional<aux::PeerId>& remote_id() const { return m_remote_id; }

private:
  boost::asio::awaitable<void> handshake();

  boost::asio::awaitable<void> receive_loop();

  boost::asio::awaitable<void> send_loop();

  // Pieces verified so far, announced right after the handshake.
  aux::BitField held_pieces() const;

  TransferException timed_out() const;

  void handle_message(const TorrentMessage& message);

  void handle_bitfield(const BitFieldMessage& bitfield);

  void handle_have(const Have& have);

  void handle_piece(const Piece& piece);

  void requeue_requests();

  void fill_pipeline();

  void enqueue(TorrentMessage message);

  void shutdown();

  void set_phase(SessionPhase phase)
  {
    m_phase.store(phase, std::memory_order_release);
  }

  boost::asio::any_io_executor m_strand;
  boost::asio::ip::tcp::socket m_socket;
  boost::asio::steady_timer m_outbox_signal;

  PeerEndpoint m_endpoint;
  PeerKey m_key;
  SessionConfig m_config;
  PieceStore& m_store;
  IPieceStrategy& m_strategy;

  std::atomic<SessionPhase> m_phase {SessionPhase::Connecting};
  std::atomic<bool> m_stopping {false};
  PeerActivity m_activity;
  std::optional<aux::PeerId> m_remote_id;

  aux::BitField m_remote_pieces;
  bool m_bitfield_received = false;
  bool m_peer_choking = true;

  std::optional<uint32_t> m_current_piece;
  std::deque<Request> m_pending_requests;
  std::set<RequestIdentifier> m_active_requests;
  std::deque<TorrentMessage> m_outbox;
};
}  // namespace ftr
