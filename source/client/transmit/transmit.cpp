#include <cstring>
#include <utility>

#include "client/transmit/transmit.hpp"

#include "auxiliary/variant_aux.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

namespace ftr
{
namespace
{
constexpr size_t LENGTH_PREFIX_SIZE = sizeof(uint32_t);
constexpr size_t HEADER_SIZE = LENGTH_PREFIX_SIZE + 1;

template<typename PackedStruct>
void append_packed(std::vector<uint8_t>& out, const PackedStruct& message)
{
  auto bytes = reinterpret_cast<const uint8_t*>(&message);
  out.insert(out.end(), bytes, bytes + sizeof(message));
}

template<SupportsDynamicLength Metadata>
void append_dynamic(std::vector<uint8_t>& out,
                    const DynamicLengthMessage<Metadata>& message)
{
  append_packed(out, message.get_metadata());
  out.insert(out.end(),
             message.get_payload().begin(),
             message.get_payload().end());
}

template<typename T>
std::expected<T, ParseError> copy_packed(std::span<const uint8_t> frame)
{
  if (frame.size() != sizeof(T)) {
    return std::unexpected(ParseError::LengthMismatch);
  }

  T value {};
  std::memcpy(&value, frame.data(), sizeof(T));
  return value;
}

template<typename T>
std::expected<TorrentMessage, ParseError> status_message(
    std::span<const uint8_t> frame)
{
  if (frame.size() != HEADER_SIZE) {
    return std::unexpected(ParseError::LengthMismatch);
  }

  return T {};
}
}  // namespace

std::string_view to_string(ParseError error)
{
  switch (error) {
    case ParseError::LengthMismatch:
      return "length mismatch";
    case ParseError::UnknownId:
      return "unknown message id";
    case ParseError::Oversized:
      return "oversized message";
  }

  return "unknown parse error";
}

std::vector<uint8_t> encode_message(const TorrentMessage& message)
{
  std::vector<uint8_t> out;

  std::visit(aux::overloaded {
                 [&out](const BitFieldMessage& bitfield)
                 { append_dynamic(out, bitfield); },
                 [&out](const Piece& piece) { append_dynamic(out, piece); },
                 [&out](const auto& fixed) { append_packed(out, fixed); },
             },
             message);

  return out;
}

std::expected<TorrentMessage, ParseError> decode_frame(
    std::span<const uint8_t> frame)
{
  if (frame.size() < LENGTH_PREFIX_SIZE) {
    return std::unexpected(ParseError::LengthMismatch);
  }

  auto length = aux::load_big_endian<uint32_t>(frame.data());
  if (frame.size() - LENGTH_PREFIX_SIZE != length) {
    return std::unexpected(ParseError::LengthMismatch);
  }

  if (length == 0) {
    return Keepalive {};
  }

  switch (frame[LENGTH_PREFIX_SIZE]) {
    case ID_CHOKE:
      return status_message<Choke>(frame);
    case ID_UNCHOKE:
      return status_message<Unchoke>(frame);
    case ID_INTERESTED:
      return status_message<Interested>(frame);
    case ID_NOT_INTERESTED:
      return status_message<NotInterested>(frame);
    case ID_HAVE:
      return copy_packed<Have>(frame);
    case ID_BITFIELD:
      return BitFieldMessage {
          std::vector<uint8_t>(frame.begin() + HEADER_SIZE, frame.end())};
    case ID_REQUEST:
      return copy_packed<Request>(frame);
    case ID_PIECE: {
      if (frame.size() < sizeof(PieceMetadata)) {
        return std::unexpected(ParseError::LengthMismatch);
      }
      auto metadata =
          copy_packed<PieceMetadata>(frame.first(sizeof(PieceMetadata)));
      // the constructor re-adds the payload to the length field
      PieceMetadata fresh {};
      fresh.piece_index = metadata->piece_index;
      fresh.offset_within_piece = metadata->offset_within_piece;
      return Piece {std::vector<uint8_t>(
                        frame.begin() + sizeof(PieceMetadata), frame.end()),
                    fresh};
    }
    case ID_CANCEL:
      return copy_packed<Cancel>(frame);
    case ID_PORT:
      return copy_packed<Port>(frame);
    default:
      return std::unexpected(ParseError::UnknownId);
  }
}

awaitable<void> send_message(tcp::socket& socket, const TorrentMessage& message)
{
  auto bytes = encode_message(message);

  co_await boost::asio::async_write(
      socket, boost::asio::buffer(bytes), use_awaitable);
}

awaitable<std::expected<TorrentMessage, ParseError>> read_message(
    tcp::socket& socket, uint32_t max_length)
{
  std::array<uint8_t, LENGTH_PREFIX_SIZE> prefix {};

  co_await boost::asio::async_read(
      socket, boost::asio::buffer(prefix), use_awaitable);

  auto message_length = aux::load_big_endian<uint32_t>(prefix.data());

  if (message_length == 0) {
    co_return Keepalive {};
  }

  if (message_length > max_length) {
    co_return std::unexpected(ParseError::Oversized);
  }

  std::vector<uint8_t> buffer(message_length + LENGTH_PREFIX_SIZE);
  std::copy(prefix.begin(), prefix.end(), buffer.begin());

  co_await boost::asio::async_read(
      socket,
      boost::asio::buffer(buffer.data() + LENGTH_PREFIX_SIZE, message_length),
      use_awaitable);

  co_return decode_frame(buffer);
}

awaitable<Handshake> read_handshake(tcp::socket& socket)
{
  Handshake handshake {};

  co_await boost::asio::async_read(
      socket,
      boost::asio::buffer(&handshake, sizeof(handshake)),
      use_awaitable);

  co_return handshake;
}

awaitable<void> send_handshake(tcp::socket& socket, Handshake handshake)
{
  co_await boost::asio::async_write(
      socket,
      boost::asio::buffer(&handshake, sizeof(handshake)),
      use_awaitable);
}
}  // namespace ftr
