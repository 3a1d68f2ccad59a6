#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "client/context.hpp"
#include "client/error.hpp"

namespace ftr
{
struct UnitRecord
{
  ByteRange range;
  UnitStatus status = UnitStatus::Pending;
  uint64_t bytes_received = 0;
  std::string failure;
};

/*
 * Durable snapshot of one job. Units are stored in plan order, so the
 * table itself is the work plan of the job.
 */
struct PersistedState
{
  static constexpr int VERSION = 1;

  std::string locator;
  std::optional<uint64_t> total_size;
  UnitKind kind = UnitKind::Range;
  std::string content_id;  // hex info hash for swarm jobs
  std::filesystem::path destination;
  std::vector<UnitRecord> units;

  WorkPlan plan() const;

  uint64_t bytes_received() const;

  static PersistedState fresh(std::string locator,
                              std::optional<uint64_t> total_size,
                              const WorkPlan& plan,
                              std::filesystem::path destination);
};

std::string serialize_state(const PersistedState& state);

// StateCorruption when the document is unreadable or its unit table does not
// tile the resource.
Result<PersistedState> parse_state(std::string_view text);

/*
 * The state file of one job, written with write-temp-then-rename. Saves from
 * concurrent units are serialized. `executor` only hosts the file handle of
 * a save; saves write synchronously.
 */
class StateJournal
{
  boost::asio::any_io_executor m_executor;
  std::filesystem::path m_path;
  mutable std::mutex m_mutex;

public:
  StateJournal(boost::asio::any_io_executor executor,
               std::filesystem::path path);

  static std::filesystem::path path_for(const std::filesystem::path& directory,
                                        std::string_view job_key);

  const std::filesystem::path& path() const { return m_path; }

  bool exists() const;

  // nullopt when no state file exists.
  Result<std::optional<PersistedState>> load() const;

  // Throws boost::system::system_error when the file can't be written.
  void save(const PersistedState& state) const;

  void remove() const;
};
}  // namespace ftr
