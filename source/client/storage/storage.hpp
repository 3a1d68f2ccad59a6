#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/asio/random_access_file.hpp>

#include "client/context.hpp"

namespace ftr
{
constexpr std::string_view PART_SUFFIX = ".part";

// Appends increments to one part file and tracks its length.
class PartWriter
{
  boost::asio::random_access_file m_file;
  uint64_t m_size;

public:
  PartWriter(boost::asio::random_access_file file, uint64_t size);

  boost::asio::awaitable<void> append(std::span<const uint8_t> data);

  uint64_t size() const { return m_size; }

  void sync() { m_file.sync_data(); }
};

/*
 * One directory of part files per job, "<index>.part" per unit. Parts are
 * only ever addressed by unit index; the merge order comes from the work
 * plan, never from a directory listing.
 */
class PartDirectory
{
  std::filesystem::path m_vault;

public:
  explicit PartDirectory(std::filesystem::path vault);

  const std::filesystem::path& vault() const { return m_vault; }

  std::filesystem::path part_path(size_t index) const;

  // 0 when the part does not exist.
  uint64_t part_size(size_t index) const;

  /*
   * Opens part `index` for appending, truncated to `checkpoint` bytes.
   * Throws TransferException(StateCorruption) when the part is shorter than
   * the checkpoint.
   */
  boost::asio::awaitable<PartWriter> open(size_t index, uint64_t checkpoint);

  /*
   * Concatenates the parts into `destination` in plan order through a
   * temporary file and a rename. Throws TransferException(Integrity) when a
   * part's length disagrees with its range.
   */
  boost::asio::awaitable<uint64_t> merge(
      const WorkPlan& plan,
      const std::filesystem::path& destination,
      size_t chunk_bytes) const;

  void remove_all();
};
}  // namespace ftr
