#include <charconv>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "torrent/metadata/bencode.hpp"

#include <fmt/format.h>

namespace ftr::bencode
{
constexpr char INT_PREFIX = 'i';
constexpr char LIST_PREFIX = 'l';
constexpr char DICT_PREFIX = 'd';
constexpr char SUFFIX = 'e';
constexpr char STRING_LENGTH_DELIMITER = ':';
constexpr int MINIMUM_BEVALUE_ENCODED_SIZE = 2;

std::string BEncoder::operator()(const BeValue& value) const
{
  return boost::apply_visitor(*this, value);
}

std::string BEncoder::operator()(std::int64_t value) const
{
  return INT_PREFIX + std::to_string(value) + SUFFIX;
}

std::string BEncoder::operator()(const std::string& value) const
{
  return std::to_string(value.length()) + STRING_LENGTH_DELIMITER + value;
}

std::string BEncoder::operator()(const List& values) const
{
  std::stringstream stream;
  stream << LIST_PREFIX;

  for (const auto& value : values) {
    stream << boost::apply_visitor(*this, value);
  }

  stream << SUFFIX;

  return stream.str();
}

std::string BEncoder::operator()(const Dict& values) const
{
  std::stringstream stream;
  stream << DICT_PREFIX;

  // std::map keeps keys in the byte order bencode requires
  for (const auto& [key, value] : values) {
    stream << (*this)(key) << boost::apply_visitor(*this, value);
  }

  stream << SUFFIX;

  return stream.str();
}

DecodeResult BDecoder::decode_int(std::string_view value) const
{
  auto end_index = value.find(SUFFIX);
  if (end_index == std::string_view::npos) {
    throw std::invalid_argument("Corrupted int encoding: no suffix");
  }

  std::int64_t int_value = 0;
  auto result =
      std::from_chars(value.data() + 1, value.data() + end_index, int_value);

  if (result.ec != std::errc {}) {
    throw std::invalid_argument(fmt::format(
        "Corrupted int encoding: couldn't decode value, error-code: {}",
        static_cast<int>(result.ec)));
  }

  if (result.ptr != value.data() + end_index) {
    throw std::invalid_argument("Corrupted int encoding: trailing characters");
  }

  return {.result = int_value, .used_chars = end_index + 1};
}

DecodeResult BDecoder::decode_string(std::string_view value) const
{
  auto index_of_delimiter = value.find(STRING_LENGTH_DELIMITER);

  if (index_of_delimiter == std::string_view::npos) {
    throw std::invalid_argument("Corrupted string encoding: no delimiter");
  }

  size_t length = 0;
  auto result =
      std::from_chars(value.data(), value.data() + index_of_delimiter, length);

  if (result.ec != std::errc {}) {
    throw std::invalid_argument(fmt::format(
        "Corrupted string encoding: couldn't decode string length, "
        "error-code: {}",
        static_cast<int>(result.ec)));
  }

  if (result.ptr != value.data() + index_of_delimiter) {
    throw std::invalid_argument("Corrupted string encoding: string length");
  }

  auto data_start = index_of_delimiter + 1;
  if (length > value.length() - data_start) {
    throw std::invalid_argument(
        "Corrupted string encoding: length doesn't match string");
  }

  return {.result = std::string(value.substr(data_start, length)),
          .used_chars = data_start + length};
}

DecodeResult BDecoder::decode_dict(std::string_view value, int max_depth) const
{
  Dict values {};
  size_t index = 1;

  while (true) {
    if (index >= value.length()) {
      throw std::invalid_argument("Corrupted dict encoding: no suffix");
    }
    if (value[index] == SUFFIX) {
      break;
    }

    auto [key, key_used_chars] = decode_string(value.substr(index));
    index += key_used_chars;

    auto [val, val_used_chars] = decode(value.substr(index), max_depth - 1);
    index += val_used_chars;

    values[boost::get<std::string>(key)] = std::move(val);
  }

  return {.result = std::move(values), .used_chars = index + 1};
}

DecodeResult BDecoder::decode_list(std::string_view value, int max_depth) const
{
  List values {};
  size_t index = 1;

  while (true) {
    if (index >= value.length()) {
      throw std::invalid_argument("Corrupted list encoding: no suffix");
    }
    if (value[index] == SUFFIX) {
      break;
    }

    auto [result, used_chars] = decode(value.substr(index), max_depth - 1);
    values.push_back(std::move(result));
    index += used_chars;
  }

  return {.result = std::move(values), .used_chars = index + 1};
}

DecodeResult BDecoder::decode(std::string_view value, int max_depth) const
{
  if (max_depth < 1) {
    throw std::runtime_error("Reached maximum decoding depth");
  }

  if (value.length() < MINIMUM_BEVALUE_ENCODED_SIZE) {
    throw std::invalid_argument("Input length must be greater than minimum");
  }

  switch (value.front()) {
    case INT_PREFIX:
      return decode_int(value);
    case DICT_PREFIX:
      return decode_dict(value, max_depth);
    case LIST_PREFIX:
      return decode_list(value, max_depth);
    default:
      if ('0' <= value.front() && value.front() <= '9') {
        return decode_string(value);
      }

      throw std::invalid_argument(
          fmt::format("Invalid token at front: {}", value.front()));
  }
}

DecodeResult BDecoder::decode_prefix(std::string_view value, int max_depth) const
{
  return decode(value, max_depth);
}

BeValue BDecoder::operator()(std::string_view value, int max_depth) const
{
  auto [result, used_chars] = decode(value, max_depth);

  if (used_chars != value.length()) {
    throw std::invalid_argument("Trailing data after bencoded value");
  }

  return result;
}

std::optional<std::string_view> raw_dict_value(std::string_view document,
                                               std::string_view key)
{
  if (document.empty() || document.front() != DICT_PREFIX) {
    return std::nullopt;
  }

  BDecoder decoder {};
  size_t index = 1;

  try {
    while (index < document.length() && document[index] != SUFFIX) {
      auto [current_key, key_used_chars] =
          decoder.decode_prefix(document.substr(index));
      index += key_used_chars;

      auto [value, value_used_chars] =
          decoder.decode_prefix(document.substr(index));

      if (current_key.which() == IString
          && boost::get<std::string>(current_key) == key)
      {
        return document.substr(index, value_used_chars);
      }

      index += value_used_chars;
    }
  } catch (const std::exception&) {
    return std::nullopt;
  }

  return std::nullopt;
}
}  // namespace ftr::bencode
