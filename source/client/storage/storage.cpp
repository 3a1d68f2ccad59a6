#include <string>
#include <vector>

#include "client/storage/storage.hpp"

#include <boost/asio/stream_file.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "client/error.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace ftr
{
namespace
{
constexpr std::string_view MERGE_SUFFIX = ".merging";
}  // namespace

PartWriter::PartWriter(boost::asio::random_access_file file, uint64_t size)
    : m_file {std::move(file)}
    , m_size {size}
{
}

awaitable<void> PartWriter::append(std::span<const uint8_t> data)
{
  co_await boost::asio::async_write_at(m_file,
                                       m_size,
                                       boost::asio::buffer(data.data(), data.size()),
                                       use_awaitable);
  m_size += data.size();
}

PartDirectory::PartDirectory(std::filesystem::path vault)
    : m_vault {std::move(vault)}
{
}

std::filesystem::path PartDirectory::part_path(size_t index) const
{
  return m_vault / (std::to_string(index) + std::string(PART_SUFFIX));
}

uint64_t PartDirectory::part_size(size_t index) const
{
  std::error_code ec;
  auto size = std::filesystem::file_size(part_path(index), ec);
  return ec ? 0 : size;
}

awaitable<PartWriter> PartDirectory::open(size_t index, uint64_t checkpoint)
{
  std::filesystem::create_directories(m_vault);

  boost::asio::random_access_file file {
      co_await boost::asio::this_coro::executor,
      part_path(index).string(),
      boost::asio::random_access_file::flags::read_write
          | boost::asio::random_access_file::flags::create};

  auto size = file.size();
  if (size < checkpoint) {
    throw TransferException(
        make_error(ErrorKind::StateCorruption,
                   fmt::format("part {} holds {} bytes, state records {}",
                               index,
                               size,
                               checkpoint),
                   index));
  }
  file.resize(checkpoint);

  co_return PartWriter {std::move(file), checkpoint};
}

awaitable<uint64_t> PartDirectory::merge(const WorkPlan& plan,
                                         const std::filesystem::path& destination,
                                         size_t chunk_bytes) const
{
  auto executor = co_await boost::asio::this_coro::executor;

  auto staging = destination;
  staging += MERGE_SUFFIX;

  uint64_t offset = 0;
  {
    boost::asio::stream_file output {
        executor,
        staging.string(),
        boost::asio::stream_file::flags::write_only
            | boost::asio::stream_file::flags::create
            | boost::asio::stream_file::flags::truncate};
    std::vector<uint8_t> buffer(chunk_bytes);

    for (size_t index = 0; index < plan.size(); index++) {
      const auto& range = plan.ranges[index];
      auto size = part_size(index);

      if (!range.is_open() && size != range.length()) {
        throw TransferException(make_error(
            ErrorKind::Integrity,
            fmt::format("part {} holds {} bytes, range [{}, {}) needs {}",
                        index,
                        size,
                        range.begin,
                        range.end,
                        range.length()),
            index));
      }
      if (size == 0) {
        continue;
      }

      boost::asio::random_access_file input {
          executor,
          part_path(index).string(),
          boost::asio::random_access_file::flags::read_only};

      uint64_t position = 0;
      while (position < size) {
        boost::system::error_code ec;
        auto received = co_await input.async_read_some_at(
            position,
            boost::asio::buffer(buffer),
            boost::asio::redirect_error(use_awaitable, ec));
        if (ec == boost::asio::error::eof || received == 0) {
          break;
        }
        if (ec) {
          throw boost::system::system_error(ec);
        }

        co_await boost::asio::async_write(
            output, boost::asio::buffer(buffer.data(), received), use_awaitable);
        position += received;
        offset += received;
      }
    }

    output.sync_all();
  }

  std::filesystem::rename(staging, destination);
  spdlog::debug("merged {} parts into {}", plan.size(), destination.string());
  co_return offset;
}

void PartDirectory::remove_all()
{
  std::error_code ec;
  std::filesystem::remove_all(m_vault, ec);
  if (ec) {
    spdlog::warn("cannot remove {}: {}", m_vault.string(), ec.message());
  }
}
}  // namespace ftr
