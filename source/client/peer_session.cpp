#include <algorithm>
#include <iterator>
#include <vector>

#include "client/peer_session.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "auxiliary/timeout.hpp"
#include "auxiliary/variant_aux.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

namespace ftr
{
std::string_view to_string(SessionPhase phase)
{
  switch (phase) {
    case SessionPhase::Connecting:
      return "connecting";
    case SessionPhase::Handshaking:
      return "handshaking";
    case SessionPhase::Idle:
      return "idle";
    case SessionPhase::Requesting:
      return "requesting";
    case SessionPhase::Disconnected:
      return "disconnected";
  }

  return "unknown";
}

PeerSession::PeerSession(boost::asio::any_io_executor strand,
                         PeerEndpoint endpoint,
                         PeerKey key,
                         SessionConfig config,
                         PieceStore& store,
                         IPieceStrategy& strategy)
    : m_strand {std::move(strand)}
    , m_socket {m_strand}
    , m_outbox_signal {m_strand, boost::asio::steady_timer::time_point::max()}
    , m_endpoint {std::move(endpoint)}
    , m_key {key}
    , m_config {std::move(config)}
    , m_store {store}
    , m_strategy {strategy}
    , m_remote_pieces {store.piece_count()}
{
}

awaitable<void> PeerSession::run()
{
  auto self = shared_from_this();

  try {
    set_phase(SessionPhase::Connecting);
    if (!co_await aux::within(
            m_socket.async_connect(m_endpoint.as_tcp(), use_awaitable),
            aux::deadline_after(m_config.connect_timeout)))
    {
      throw timed_out();
    }

    set_phase(SessionPhase::Handshaking);
    if (!co_await aux::within(handshake(),
                              aux::deadline_after(m_config.handshake_timeout)))
    {
      throw timed_out();
    }

    set_phase(SessionPhase::Idle);
    enqueue(BitFieldMessage {held_pieces().as_raw()});
    enqueue(Interested {});

    boost::asio::co_spawn(
        m_strand,
        [self]() -> awaitable<void> { co_await self->send_loop(); },
        boost::asio::detached);

    co_await receive_loop();
  } catch (const TransferException& e) {
    m_activity.exit_kind = e.error().kind;
    m_activity.exit_message = e.error().message;
  } catch (const boost::system::system_error& e) {
    m_activity.exit_kind = ErrorKind::Transport;
    if (m_stopping.load(std::memory_order_acquire)) {
      m_activity.exit_message = "stopped";
    } else {
      m_activity.exit_message = e.what();
    }
  }

  set_phase(SessionPhase::Disconnected);
  shutdown();

  if (m_current_piece) {
    m_store.release(*m_current_piece, m_key);
    m_current_piece.reset();
  }
  m_strategy.remove_peer(m_remote_pieces);
  m_pending_requests.clear();
  m_active_requests.clear();
  m_outbox.clear();

  spdlog::debug("peer {} disconnected: {}",
                m_endpoint.to_string(),
                m_activity.exit_message);
}

void PeerSession::stop()
{
  m_stopping.store(true, std::memory_order_release);
  boost::asio::post(m_strand, [self = shared_from_this()] { self->shutdown(); });
}

void PeerSession::wake()
{
  boost::asio::post(m_strand,
                    [self = shared_from_this()] { self->fill_pipeline(); });
}

awaitable<void> PeerSession::handshake()
{
  co_await send_handshake(m_socket,
                          Handshake {m_config.info_hash, m_config.peer_id});

  auto reply = co_await read_handshake(m_socket);

  if (!reply.speaks_protocol()) {
    throw TransferException(ErrorKind::ProtocolMismatch,
                            "peer does not speak the BitTorrent protocol");
  }

  if (reply.info_hash() != m_config.info_hash) {
    throw TransferException(ErrorKind::ProtocolMismatch,
                            "peer serves a different info hash");
  }

  aux::PeerId::raw_type raw {};
  std::copy(std::begin(reply.peer_id), std::end(reply.peer_id), raw.begin());
  m_remote_id.emplace(raw);
  m_activity.handshake_completed = true;
}

awaitable<void> PeerSession::receive_loop()
{
  auto max_length = std::max<uint32_t>(
      m_store.block_bytes() + sizeof(PieceMetadata) - sizeof(uint32_t),
      static_cast<uint32_t>(aux::BitField::bytes_for(m_store.piece_count()))
          + 1);

  while (!m_stopping.load(std::memory_order_acquire)) {
    auto frame = co_await aux::within(
        read_message(m_socket, max_length),
        aux::deadline_after(m_config.idle_timeout));
    if (!frame) {
      throw timed_out();
    }

    auto& message = *frame;
    if (!message) {
      m_activity.latest_parse_errors.push_back(message.error());

      if (message.error() == ParseError::Oversized
          || m_activity.latest_parse_errors.full())
      {
        throw TransferException(
            ErrorKind::ProtocolMismatch,
            fmt::format("unreadable frames from peer: {}",
                        to_string(message.error())));
      }
      continue;
    }

    m_activity.latest_parse_errors.clear();
    handle_message(*message);
    fill_pipeline();
  }
}

awaitable<void> PeerSession::send_loop()
{
  try {
    while (m_socket.is_open()) {
      if (m_outbox.empty()) {
        boost::system::error_code ec;
        co_await m_outbox_signal.async_wait(
            boost::asio::redirect_error(use_awaitable, ec));
        continue;
      }

      auto message = std::move(m_outbox.front());
      m_outbox.pop_front();
      co_await send_message(m_socket, message);
    }
  } catch (const boost::system::system_error& e) {
    spdlog::debug("send to {} failed: {}", m_endpoint.to_string(), e.what());
    shutdown();
  }
}

aux::BitField PeerSession::held_pieces() const
{
  aux::BitField pieces {m_store.piece_count()};
  auto statuses = m_store.statuses();
  for (uint32_t piece = 0; piece < statuses.size(); piece++) {
    if (statuses[piece] == UnitStatus::Completed) {
      pieces.mark(piece, true);
    }
  }
  return pieces;
}

TransferException PeerSession::timed_out() const
{
  return TransferException(ErrorKind::Transport,
                           fmt::format("timed out while {}", to_string(phase())));
}

void PeerSession::handle_message(const TorrentMessage& message)
{
  std::visit(aux::overloaded {
                 [](const Keepalive&) {},
                 [this](const Choke&)
                 {
                   m_peer_choking = true;
                   requeue_requests();
                   if (m_current_piece) {
                     set_phase(SessionPhase::Idle);
                   }
                 },
                 [this](const Unchoke&) { m_peer_choking = false; },
                 [](const Interested&) {},
                 [](const NotInterested&) {},
                 [this](const Have& have) { handle_have(have); },
                 [this](const BitFieldMessage& bitfield)
                 { handle_bitfield(bitfield); },
                 [](const Request&) {},
                 [this](const Piece& piece) { handle_piece(piece); },
                 [](const Cancel&) {},
                 [](const Port&) {},
             },
             message);
}

void PeerSession::handle_bitfield(const BitFieldMessage& bitfield)
{
  aux::BitField pieces {bitfield.get_payload()};
  if (!pieces.fits(m_store.piece_count())) {
    throw TransferException(ErrorKind::ProtocolMismatch,
                            "bitfield does not match the piece count");
  }

  m_strategy.remove_peer(m_remote_pieces);
  m_remote_pieces = std::move(pieces);
  m_strategy.add_peer(m_remote_pieces);
  m_bitfield_received = true;
}

void PeerSession::handle_have(const Have& have)
{
  uint32_t piece = have.piece_index;
  if (piece >= m_store.piece_count()) {
    throw TransferException(ErrorKind::ProtocolMismatch,
                            fmt::format("have for unknown piece {}", piece));
  }

  if (!m_remote_pieces.get(piece)) {
    m_remote_pieces.mark(piece, true);
    m_strategy.add_piece(piece);
  }
}

void PeerSession::handle_piece(const Piece& piece)
{
  const auto& metadata = piece.get_metadata();
  const auto& block = piece.get_payload();
  uint32_t index = metadata.piece_index;
  uint32_t offset = metadata.offset_within_piece;

  RequestIdentifier id {index, offset, static_cast<uint32_t>(block.size())};

  if (m_active_requests.erase(id) == 0) {
    // may still answer a request that a choke moved back to pending
    auto pending = std::find_if(m_pending_requests.begin(),
                                m_pending_requests.end(),
                                [&id](const Request& request)
                                {
                                  return request.piece_index == id.piece_index
                                      && request.offset_within_piece
                                      == id.piece_offset
                                      && request.length == id.block_length;
                                });
    if (pending == m_pending_requests.end()) {
      spdlog::trace("unsolicited block {}:{} from {}",
                    index,
                    offset,
                    m_endpoint.to_string());
      return;
    }
    m_pending_requests.erase(pending);
  }

  m_activity.bytes_received += block.size();

  switch (m_store.record_block(index, offset, block, m_key)) {
    case BlockOutcome::PieceCompleted:
    case BlockOutcome::PieceFailed:
      m_current_piece.reset();
      m_pending_requests.clear();
      m_active_requests.clear();
      set_phase(SessionPhase::Idle);
      break;
    case BlockOutcome::Rejected:
      throw TransferException(
          ErrorKind::ProtocolMismatch,
          fmt::format("peer sent a malformed block {}:{}", index, offset));
    case BlockOutcome::Accepted:
    case BlockOutcome::Duplicate:
      break;
  }
}

void PeerSession::requeue_requests()
{
  std::vector<Request> outstanding;
  outstanding.reserve(m_active_requests.size());
  for (const auto& id : m_active_requests) {
    outstanding.emplace_back(id.piece_index, id.piece_offset, id.block_length);
  }
  m_active_requests.clear();

  m_pending_requests.insert(
      m_pending_requests.begin(), outstanding.begin(), outstanding.end());

  std::erase_if(m_outbox,
                [](const TorrentMessage& message)
                { return std::holds_alternative<Request>(message); });
}

void PeerSession::fill_pipeline()
{
  if (phase() == SessionPhase::Disconnected
      || m_stopping.load(std::memory_order_acquire)
      || !m_activity.handshake_completed || m_peer_choking)
  {
    return;
  }

  if (!m_current_piece) {
    auto piece = m_strategy.pick(m_remote_pieces, m_key);
    if (!piece) {
      set_phase(SessionPhase::Idle);
      return;
    }

    m_current_piece = *piece;
    for (uint32_t block = 0; block < m_store.block_count(*piece); block++) {
      m_pending_requests.emplace_back(*piece,
                                      block * m_store.block_bytes(),
                                      m_store.block_length(*piece, block));
    }
  }

  set_phase(SessionPhase::Requesting);

  while (m_active_requests.size() < m_config.pipeline_depth
         && !m_pending_requests.empty())
  {
    auto request = m_pending_requests.front();
    m_pending_requests.pop_front();

    m_active_requests.insert(RequestIdentifier {
        request.piece_index, request.offset_within_piece, request.length});
    enqueue(request);
  }
}

void PeerSession::enqueue(TorrentMessage message)
{
  m_outbox.push_back(std::move(message));
  m_outbox_signal.cancel_one();
}

void PeerSession::shutdown()
{
  boost::system::error_code ignored;
  m_socket.close(ignored);
  m_outbox_signal.cancel();
}
}  // namespace ftr
