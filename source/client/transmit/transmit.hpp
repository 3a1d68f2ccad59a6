#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "torrent/messages.hpp"

namespace ftr
{
enum class ParseError : uint8_t
{
  LengthMismatch,
  UnknownId,
  Oversized,
};

std::string_view to_string(ParseError error);

// Serializes a message into its length-prefixed wire form.
std::vector<uint8_t> encode_message(const TorrentMessage& message);

// Parses one complete frame, including its four byte length prefix.
std::expected<TorrentMessage, ParseError> decode_frame(
    std::span<const uint8_t> frame);

boost::asio::awaitable<void> send_message(boost::asio::ip::tcp::socket& socket,
                                          const TorrentMessage& message);

/*
 * Reads the next frame. Frames longer than `max_length` are reported as
 * Oversized without consuming their payload; the connection is not usable
 * afterwards.
 */
boost::asio::awaitable<std::expected<TorrentMessage, ParseError>> read_message(
    boost::asio::ip::tcp::socket& socket, uint32_t max_length);

boost::asio::awaitable<Handshake> read_handshake(
    boost::asio::ip::tcp::socket& socket);

boost::asio::awaitable<void> send_handshake(boost::asio::ip::tcp::socket& socket,
                                            Handshake handshake);
}  // namespace ftr
