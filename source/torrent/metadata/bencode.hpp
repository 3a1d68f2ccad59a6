#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/variant.hpp>

namespace ftr::bencode
{
using BeValue = boost::make_recursive_variant<
    std::int64_t,
    std::string,
    std::map<std::string, boost::recursive_variant_>,
    std::vector<boost::recursive_variant_>>::type;

enum BeValueTypeIndex : uint8_t
{
  IInt64 = 0,
  IString = 1,
  IDict = 2,
  IList = 3,
};

using List = std::vector<BeValue>;

using Dict = std::map<std::string, BeValue>;

class BEncoder : public boost::static_visitor<std::string>
{
public:
  std::string operator()(const BeValue& value) const;
  std::string operator()(std::int64_t value) const;
  std::string operator()(const std::string& value) const;
  std::string operator()(const List& values) const;
  std::string operator()(const Dict& values) const;
};

struct DecodeResult
{
  BeValue result;
  size_t used_chars;
};

/*
 * Recursive-descent decoder. Malformed input raises std::invalid_argument,
 * nesting beyond `max_depth` raises std::runtime_error.
 */
class BDecoder
{
public:
  static constexpr int DEFAULT_MAX_DEPTH = 16;

  BeValue operator()(std::string_view value,
                     int max_depth = BDecoder::DEFAULT_MAX_DEPTH) const;

  // Decodes the first value in `value` and reports how much input it used.
  DecodeResult decode_prefix(std::string_view value,
                             int max_depth = BDecoder::DEFAULT_MAX_DEPTH) const;

private:
  DecodeResult decode_int(std::string_view value) const;
  DecodeResult decode_string(std::string_view value) const;
  DecodeResult decode_dict(std::string_view value, int max_depth) const;
  DecodeResult decode_list(std::string_view value, int max_depth) const;
  DecodeResult decode(std::string_view value, int max_depth) const;
};

/*
 * Returns the exact encoded bytes of `key` in the top-level dictionary of
 * `document`. Info hashes must be computed over these bytes, not over a
 * re-encoding.
 */
std::optional<std::string_view> raw_dict_value(std::string_view document,
                                               std::string_view key);
}  // namespace ftr::bencode
