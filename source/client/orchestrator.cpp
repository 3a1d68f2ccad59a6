#include <algorithm>
#include <exception>

#include "client/orchestrator.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "auxiliary/random.hpp"
#include "auxiliary/wait_group.hpp"
#include "client/downloader/chunk_worker.hpp"
#include "client/downloader/range_splitter.hpp"
#include "client/journal/state_journal.hpp"
#include "client/reactor/swarm_coordinator.hpp"
#include "client/storage/piece_store.hpp"
#include "client/storage/storage.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using std::chrono::steady_clock;

namespace ftr
{
namespace
{
awaitable<void> sleep_for(std::chrono::milliseconds delay)
{
  boost::asio::steady_timer timer {co_await boost::asio::this_coro::executor};
  timer.expires_after(delay);
  co_await timer.async_wait(use_awaitable);
}

// Torrent names come from the network; keep them inside the target directory.
std::string sanitize_file_name(std::string_view name)
{
  std::string clean {name};
  std::replace(clean.begin(), clean.end(), '/', '_');
  std::replace(clean.begin(), clean.end(), '\\', '_');

  if (clean.empty() || clean == "." || clean == "..") {
    return "tmp.bin";
  }
  return clean;
}

std::string describe_size(std::optional<uint64_t> size)
{
  return size ? fmt::format("{} bytes", *size) : std::string("unknown size");
}

void add_failure(TransferReport& report, const TransferError& error)
{
  if (!error.unit) {
    return;
  }

  auto known = std::find_if(report.failed_units.begin(),
                            report.failed_units.end(),
                            [&error](const UnitFailure& failure)
                            { return failure.unit == *error.unit; });
  if (known == report.failed_units.end()) {
    report.failed_units.push_back(UnitFailure {*error.unit, error.message});
  }
}

ProgressSnapshot swarm_snapshot(TransferPhase phase,
                                const PieceStore& store,
                                const SwarmCoordinator& coordinator,
                                RateEstimator& rate)
{
  ProgressSnapshot snapshot {};
  snapshot.phase = phase;
  snapshot.bytes_done = store.completed_bytes();
  snapshot.connected_peers = coordinator.connected_peers();

  uint64_t total = 0;
  auto statuses = store.statuses();
  snapshot.units.reserve(statuses.size());
  for (uint32_t piece = 0; piece < statuses.size(); piece++) {
    auto length = store.descriptor(piece).length;
    total += length;
    snapshot.units.push_back(UnitProgress {
        statuses[piece],
        statuses[piece] == UnitStatus::Completed ? length : 0});
  }
  snapshot.bytes_total = total;

  rate.sample(steady_clock::now(), snapshot.bytes_done);
  snapshot.rate = rate.rate();
  snapshot.eta = rate.eta(total - std::min(total, snapshot.bytes_done));
  return snapshot;
}
}  // namespace

struct TransferOrchestrator::Job
{
  Job(Locator p_locator,
      Transport p_transport,
      boost::asio::any_io_executor p_pool,
      boost::asio::any_io_executor p_strand,
      const Settings& settings)
      : locator {std::move(p_locator)}
      , transport {std::move(p_transport)}
      , pool {std::move(p_pool)}
      , strand {std::move(p_strand)}
      , journal {pool,
                 StateJournal::path_for(settings.resolved_state_directory(),
                                        locator.key())}
      , parts {settings.resolved_state_directory()
               / fmt::format("{}.parts", locator.key())}
  {
  }

  Locator locator;
  Transport transport;
  boost::asio::any_io_executor pool;
  boost::asio::any_io_executor strand;
  std::optional<std::filesystem::path> requested_destination;

  std::filesystem::path destination;
  StateJournal journal;
  PartDirectory parts;
  std::optional<TorrentFile> torrent;
  ResourceMetadata metadata;

  std::optional<PersistedState> loaded;  // left behind by an earlier run
  std::mutex state_mutex;
  PersistedState state;

  TransferReport report;

  // Callers hold state_mutex, so saves land on disk in the order they were
  // made.
  void save_locked()
  {
    try {
      journal.save(state);
    } catch (const boost::system::system_error& e) {
      spdlog::error("cannot persist state to {}: {}",
                    journal.path().string(),
                    e.what());
    } catch (const std::filesystem::filesystem_error& e) {
      spdlog::error("cannot persist state to {}: {}",
                    journal.path().string(),
                    e.what());
    }
  }

  void save()
  {
    std::lock_guard lock {state_mutex};
    save_locked();
  }
};

struct TransferOrchestrator::BulkRun
{
  BulkRun(size_t unit_count, boost::asio::any_io_executor strand)
      : received {std::make_unique<std::atomic<uint64_t>[]>(unit_count)}
      , statuses {std::make_unique<std::atomic<UnitStatus>[]>(unit_count)}
      , unit_count {unit_count}
      , lanes {std::move(strand)}
  {
  }

  std::unique_ptr<std::atomic<uint64_t>[]> received;
  std::unique_ptr<std::atomic<UnitStatus>[]> statuses;
  size_t unit_count;

  std::vector<size_t> pending;
  std::atomic<size_t> next {0};
  uint64_t initial_bytes = 0;

  std::mutex failures_mutex;
  std::vector<UnitFailure> failures;
  std::optional<TransferError> first_error;

  aux::WaitGroup lanes;

  uint64_t bytes_done() const
  {
    uint64_t total = 0;
    for (size_t unit = 0; unit < unit_count; unit++) {
      total += received[unit].load(std::memory_order_relaxed);
    }
    return total;
  }

  bool all_completed() const
  {
    for (size_t unit = 0; unit < unit_count; unit++) {
      if (statuses[unit].load(std::memory_order_acquire)
          != UnitStatus::Completed)
      {
        return false;
      }
    }
    return true;
  }

  void record_failure(const TransferError& error)
  {
    std::lock_guard lock {failures_mutex};
    if (!first_error) {
      first_error = error;
    }
    if (error.unit) {
      failures.push_back(UnitFailure {*error.unit, error.message});
    }
  }

  ProgressSnapshot snapshot(TransferPhase phase,
                            std::optional<uint64_t> total,
                            RateEstimator& rate) const
  {
    ProgressSnapshot snapshot {};
    snapshot.phase = phase;
    snapshot.bytes_total = total;
    snapshot.units.reserve(unit_count);
    for (size_t unit = 0; unit < unit_count; unit++) {
      snapshot.units.push_back(
          UnitProgress {statuses[unit].load(std::memory_order_relaxed),
                        received[unit].load(std::memory_order_relaxed)});
    }
    snapshot.bytes_done = bytes_done();

    rate.sample(steady_clock::now(), snapshot.bytes_done);
    snapshot.rate = rate.rate();
    if (total) {
      snapshot.eta =
          rate.eta(*total - std::min(*total, snapshot.bytes_done));
    }
    return snapshot;
  }
};

TransferOrchestrator::TransferOrchestrator(Settings settings,
                                           std::shared_ptr<IProgressSink> sink)
    : m_settings {std::move(settings)}
    , m_sink {std::move(sink)}
{
}

TransferReport TransferOrchestrator::run(
    std::string_view text, std::optional<std::filesystem::path> destination)
{
  auto started = steady_clock::now();

  auto locator = Locator::parse(text);
  if (!locator) {
    spdlog::error("{}", locator.error().describe());
    TransferReport report {};
    report.phase = TransferPhase::Failed;
    report.error = locator.error();
    return report;
  }

  boost::asio::thread_pool pool {m_settings.resolved_threads()};
  boost::asio::any_io_executor strand =
      boost::asio::make_strand(pool.get_executor());

  auto job = std::make_shared<Job>(*locator,
                                   make_transport(*locator, m_settings),
                                   pool.get_executor(),
                                   strand,
                                   m_settings);
  job->requested_destination = std::move(destination);

  auto future =
      boost::asio::co_spawn(strand, run_job(job), boost::asio::use_future);
  auto report = future.get();

  // Tracker announces still in flight are abandoned here.
  pool.stop();
  pool.join();

  {
    std::lock_guard lock {m_peers_mutex};
    m_coordinator.reset();
  }
  m_stop.store(false, std::memory_order_release);
  m_pause_requested.store(false, std::memory_order_release);

  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      steady_clock::now() - started);
  return report;
}

void TransferOrchestrator::request_pause()
{
  if (!m_pause_requested.exchange(true, std::memory_order_acq_rel)) {
    spdlog::info("pause requested");
  }
  m_stop.store(true, std::memory_order_release);
}

void TransferOrchestrator::add_peers(std::vector<PeerEndpoint> peers)
{
  std::lock_guard lock {m_peers_mutex};
  m_injected_peers.insert(m_injected_peers.end(), peers.begin(), peers.end());
  if (m_coordinator) {
    m_coordinator->add_peers(std::move(peers));
  }
}

awaitable<TransferReport> TransferOrchestrator::run_job(std::shared_ptr<Job> job)
{
  std::optional<TransferError> failure;

  try {
    set_phase(*job, TransferPhase::Initializing);
    spdlog::info("{} via {} transport",
                 job->locator.text,
                 to_string(kind_of(job->transport)));
    co_await prepare(*job);

    if (auto* swarm = std::get_if<SwarmTransport>(&job->transport)) {
      co_await run_swarm(job, *swarm);
    } else if (auto* http = std::get_if<HttpTransport>(&job->transport)) {
      co_await run_bulk(job, *http);
    } else {
      co_await run_bulk(job, std::get<FileTransport>(job->transport));
    }
  } catch (const TransferException& e) {
    failure = e.error();
  } catch (const boost::system::system_error& e) {
    failure = make_error(ErrorKind::Transport, e.what());
  } catch (const std::system_error& e) {
    failure = make_error(ErrorKind::Transport, e.what());
  }

  if (failure) {
    spdlog::error("{}: {}", job->locator.text, failure->describe());
    add_failure(job->report, *failure);
    job->report.error = std::move(failure);
    set_phase(*job, TransferPhase::Failed);
  }

  co_return job->report;
}

awaitable<void> TransferOrchestrator::prepare(Job& job)
{
  std::string default_name;
  if (auto* swarm = std::get_if<SwarmTransport>(&job.transport)) {
    auto torrent = swarm->resolve_descriptor();
    if (!torrent) {
      throw TransferException(torrent.error());
    }
    default_name = sanitize_file_name(torrent->metadata.name);
    job.torrent = std::move(*torrent);
  } else {
    default_name = job.locator.file_name();
  }

  auto loaded = job.journal.load();
  if (!loaded) {
    discard_state(job, loaded.error());
  } else if (*loaded && !m_settings.resume) {
    spdlog::info("resume disabled, starting {} over", job.locator.text);
    job.loaded = std::move(**loaded);
    discard_state(job, make_error(ErrorKind::StateCorruption, "resume disabled"));
  } else if (*loaded) {
    job.loaded = std::move(**loaded);
  }

  job.destination = job.requested_destination
      ? *job.requested_destination
      : m_settings.target_directory / default_name;

  if (job.loaded && job.loaded->destination != job.destination) {
    spdlog::info("resuming into {} as recorded",
                 job.loaded->destination.string());
    job.destination = job.loaded->destination;
  }
  job.report.destination = job.destination;

  if (!job.loaded && std::filesystem::exists(job.destination)) {
    if (!m_settings.overwrite) {
      throw TransferException(
          ErrorKind::InvalidInput,
          fmt::format("file exists: {}", job.destination.string()));
    }
    spdlog::info("overwriting {}", job.destination.string());
    std::filesystem::remove(job.destination);
  }

  if (job.destination.has_parent_path()) {
    std::filesystem::create_directories(job.destination.parent_path());
  }

  co_return;
}

void TransferOrchestrator::discard_state(Job& job, const TransferError& reason)
{
  bool voluntary = !m_settings.resume;
  if (!voluntary && !m_settings.discard_corrupt_state) {
    throw TransferException(reason);
  }

  if (!voluntary) {
    spdlog::warn("discarding state of {}: {}",
                 job.locator.text,
                 reason.message);
  }

  // a swarm job writes straight into its destination
  if (job.loaded && job.loaded->kind == UnitKind::Piece) {
    std::error_code ec;
    std::filesystem::remove(job.loaded->destination, ec);
  }

  job.journal.remove();
  job.parts.remove_all();
  job.loaded.reset();
}

template<typename T>
awaitable<ResourceMetadata> TransferOrchestrator::resolve_with_retry(
    T& transport)
{
  for (uint32_t attempt = 0;; attempt++) {
    std::optional<TransferError> failure;

    try {
      co_return co_await transport.resolve_metadata();
    } catch (const TransferException& e) {
      if (e.error().kind != ErrorKind::Transport) {
        throw;
      }
      failure = e.error();
    } catch (const boost::system::system_error& e) {
      failure = make_error(ErrorKind::Transport, e.what());
    }

    if (attempt + 1 >= m_settings.retry_budget
        || m_stop.load(std::memory_order_acquire))
    {
      throw TransferException(*failure);
    }

    auto delay = aux::jittered_backoff(
        m_settings.backoff_base, m_settings.backoff_cap, attempt);
    spdlog::warn("metadata request failed ({}), retrying in {} ms",
                 failure->message,
                 delay.count());
    co_await sleep_for(delay);
  }
}

template<typename T>
awaitable<void> TransferOrchestrator::run_bulk(std::shared_ptr<Job> job,
                                               T& transport)
{
  job->metadata = co_await resolve_with_retry(transport);
  const auto& metadata = job->metadata;
  job->report.total_size = metadata.size;
  set_phase(*job, TransferPhase::MetadataResolved);
  spdlog::info("{}: {}, {}",
               job->locator.text,
               describe_size(metadata.size),
               metadata.resumable ? "resumable" : "not resumable");

  if (job->loaded) {
    const auto& loaded = *job->loaded;
    if (loaded.kind != UnitKind::Range || loaded.locator != job->locator.text)
    {
      discard_state(*job,
                    make_error(ErrorKind::StateCorruption,
                               "state was written for a different job"));
    } else if (metadata.size && loaded.total_size
               && *metadata.size != *loaded.total_size)
    {
      discard_state(
          *job,
          make_error(ErrorKind::StateCorruption,
                     fmt::format("resource size changed from {} to {} bytes",
                                 *loaded.total_size,
                                 *metadata.size)));
    }
  }

  if (job->loaded) {
    job->state = std::move(*job->loaded);
    job->loaded.reset();
    job->report.resumed = true;
  } else {
    auto plan = whole_resource_plan(metadata.size);
    if (metadata.size && metadata.resumable && *metadata.size > 0) {
      auto split = split_ranges(metadata.size, m_settings.workers);
      if (split) {
        plan = std::move(*split);
      } else {
        spdlog::debug("not splitting: {}", split.error().message);
      }
    }

    job->parts.remove_all();
    job->state = PersistedState::fresh(
        job->locator.text, metadata.size, plan, job->destination);
    job->save();
  }

  auto unit_count = job->state.units.size();
  auto run = std::make_shared<BulkRun>(unit_count, job->strand);

  for (size_t unit = 0; unit < unit_count; unit++) {
    const auto& record = job->state.units[unit];

    if (record.status == UnitStatus::Completed) {
      if (!record.range.is_open()
          && job->parts.part_size(unit) != record.range.length())
      {
        throw TransferException(make_error(
            ErrorKind::StateCorruption,
            fmt::format("part {} of a completed range is missing or truncated",
                        unit),
            unit));
      }
      run->received[unit] = record.bytes_received;
      run->statuses[unit] = UnitStatus::Completed;
      continue;
    }

    if (metadata.resumable && !record.range.is_open()) {
      run->received[unit] = record.bytes_received;
    }
    run->pending.push_back(unit);
  }
  run->initial_bytes = run->bytes_done();

  job->report.scheduled_units = run->pending.size();
  set_phase(*job, TransferPhase::Transferring);
  spdlog::info("{} of {} units to fetch, {} bytes already on disk",
               run->pending.size(),
               unit_count,
               run->initial_bytes);

  auto lanes = std::min<size_t>(m_settings.max_concurrent_units,
                                run->pending.size());
  for (size_t lane = 0; lane < lanes; lane++) {
    run->lanes.add();
    boost::asio::co_spawn(
        job->pool,
        run_lane(job, transport, run),
        [this, run](std::exception_ptr error)
        {
          if (error) {
            try {
              std::rethrow_exception(error);
            } catch (const std::exception& e) {
              spdlog::error("worker aborted: {}", e.what());
              run->record_failure(make_error(ErrorKind::Transport, e.what()));
              m_stop.store(true, std::memory_order_release);
            }
          }
          boost::asio::post(run->lanes.executor(), [run] { run->lanes.done(); });
        });
  }

  RateEstimator rate;
  while (true) {
    auto drained = co_await run->lanes.wait_until(
        steady_clock::now() + m_settings.progress_interval);
    publish(run->snapshot(job->report.phase, metadata.size, rate));

    if (drained) {
      break;
    }

    if (m_stop.load(std::memory_order_acquire)) {
      if (!co_await run->lanes.wait_until(steady_clock::now()
                                          + m_settings.pause_timeout))
      {
        spdlog::warn("{} workers still running after {} ms",
                     run->lanes.running(),
                     m_settings.pause_timeout.count());
      }
      break;
    }
  }

  co_await finish_bulk(*job, *run);
}

template<typename T>
awaitable<void> TransferOrchestrator::run_lane(std::shared_ptr<Job> job,
                                               T& transport,
                                               std::shared_ptr<BulkRun> run)
{
  while (!m_stop.load(std::memory_order_acquire)) {
    auto slot = run->next.fetch_add(1, std::memory_order_relaxed);
    if (slot >= run->pending.size()) {
      break;
    }
    co_await run_unit(job, transport, run, run->pending[slot]);
  }
}

template<typename T>
awaitable<void> TransferOrchestrator::run_unit(std::shared_ptr<Job> job,
                                               T& transport,
                                               std::shared_ptr<BulkRun> run,
                                               size_t unit)
{
  ByteRange range {};
  {
    std::lock_guard lock {job->state_mutex};
    range = job->state.units[unit].range;
  }

  auto& received = run->received[unit];
  auto& status = run->statuses[unit];
  bool resumable = job->metadata.resumable && !range.is_open();

  ChunkWorker worker {m_stop, received};
  status.store(UnitStatus::InFlight, std::memory_order_release);

  for (uint32_t attempt = 0;; attempt++) {
    std::optional<TransferError> failure;

    try {
      uint64_t checkpoint =
          resumable ? received.load(std::memory_order_relaxed) : 0;
      auto part = co_await job->parts.open(unit, checkpoint);
      received.store(checkpoint, std::memory_order_relaxed);

      auto missing = range.is_open()
          ? range
          : ByteRange {range.begin + checkpoint, range.end};

      if (missing.is_open() || missing.length() > 0) {
        auto result = co_await worker.fetch(transport, missing, part);
        if (result.outcome == FetchOutcome::Stopped) {
          status.store(UnitStatus::Pending, std::memory_order_release);
          spdlog::debug("unit {} stopped at {} bytes", unit, part.size());
          co_return;
        }
      }

      {
        std::lock_guard lock {job->state_mutex};
        auto& record = job->state.units[unit];
        if (record.range.is_open()) {
          record.range.end = record.range.begin + part.size();
          job->state.total_size = record.range.end;
        }
        record.status = UnitStatus::Completed;
        record.bytes_received = part.size();
        record.failure.clear();
        job->save_locked();
      }

      status.store(UnitStatus::Completed, std::memory_order_release);
      spdlog::debug("unit {} completed ({} bytes)", unit, part.size());
      co_return;
    } catch (const TransferException& e) {
      failure = e.error();
    } catch (const boost::system::system_error& e) {
      failure = make_error(ErrorKind::Transport, e.what());
    } catch (const std::system_error& e) {
      failure = make_error(ErrorKind::Transport, e.what());
    }

    failure->unit = unit;
    bool stopping = m_stop.load(std::memory_order_acquire);

    if (failure->kind == ErrorKind::Transport && stopping) {
      status.store(UnitStatus::Pending, std::memory_order_release);
      co_return;
    }

    if (failure->kind != ErrorKind::Transport
        || attempt + 1 >= m_settings.retry_budget)
    {
      spdlog::warn("unit {} failed after {} attempts: {}",
                   unit,
                   attempt + 1,
                   failure->message);
      status.store(UnitStatus::Failed, std::memory_order_release);
      run->record_failure(*failure);
      m_stop.store(true, std::memory_order_release);
      co_return;
    }

    auto delay = aux::jittered_backoff(
        m_settings.backoff_base, m_settings.backoff_cap, attempt);
    spdlog::warn("unit {} attempt {} of {} failed ({}), retrying in {} ms",
                 unit,
                 attempt + 1,
                 m_settings.retry_budget,
                 failure->message,
                 delay.count());
    co_await sleep_for(delay);
  }
}

awaitable<void> TransferOrchestrator::finish_bulk(Job& job, BulkRun& run)
{
  auto done = run.bytes_done();
  job.report.bytes_transferred =
      done > run.initial_bytes ? done - run.initial_bytes : 0;

  std::vector<UnitFailure> failures;
  std::optional<TransferError> first_error;
  {
    std::lock_guard lock {run.failures_mutex};
    failures = run.failures;
    first_error = run.first_error;
  }

  {
    std::lock_guard lock {job.state_mutex};
    for (size_t unit = 0; unit < run.unit_count; unit++) {
      auto status = run.statuses[unit].load(std::memory_order_acquire);
      if (status == UnitStatus::Completed) {
        continue;
      }

      auto& record = job.state.units[unit];
      record.status =
          status == UnitStatus::Failed ? UnitStatus::Failed : UnitStatus::Pending;
      record.bytes_received =
          job.metadata.resumable && !record.range.is_open()
          ? run.received[unit].load(std::memory_order_relaxed)
          : 0;
    }
    for (const auto& failure : failures) {
      job.state.units[failure.unit].failure = failure.reason;
    }
    job.save_locked();
  }

  if (first_error) {
    job.report.failed_units = std::move(failures);
    throw TransferException(*first_error);
  }

  if (!run.all_completed()) {
    set_phase(job, TransferPhase::Paused);
    spdlog::info("paused {}: {} bytes on disk, state in {}",
                 job.locator.text,
                 done,
                 job.journal.path().string());
    co_return;
  }

  set_phase(job, TransferPhase::Merging);
  auto written = co_await job.parts.merge(
      job.state.plan(), job.destination, m_settings.increment_bytes);
  job.report.total_size = written;

  set_phase(job, TransferPhase::Verifying);
  verify_destination(job);

  job.journal.remove();
  if (!m_settings.keep_parts) {
    job.parts.remove_all();
  }
  set_phase(job, TransferPhase::Complete);
}

awaitable<void> TransferOrchestrator::run_swarm(std::shared_ptr<Job> job,
                                                SwarmTransport& transport)
{
  const auto& torrent = *job->torrent;
  auto pieces = torrent.pieces();
  auto content_id = aux::to_hex(torrent.info_hash);

  job->metadata = ResourceMetadata {torrent.file_length, true};
  job->report.total_size = torrent.file_length;
  set_phase(*job, TransferPhase::MetadataResolved);
  spdlog::info("{}: {} pieces of {} bytes, {} total, {} trackers",
               transport.descriptor_path().string(),
               pieces.size(),
               torrent.piece_length,
               torrent.file_length,
               torrent.trackers.size());

  if (job->loaded) {
    const auto& loaded = *job->loaded;
    if (loaded.kind != UnitKind::Piece || loaded.content_id != content_id
        || loaded.units.size() != pieces.size()
        || loaded.total_size != std::optional<uint64_t> {torrent.file_length})
    {
      discard_state(*job,
                    make_error(ErrorKind::StateCorruption,
                               "state does not match the torrent descriptor"));
    }
  }

  if (job->loaded) {
    job->state = std::move(*job->loaded);
    job->loaded.reset();
    job->report.resumed = true;
  } else {
    WorkPlan plan {.kind = UnitKind::Piece, .ranges = {}};
    for (const auto& piece : pieces) {
      plan.ranges.push_back({piece.offset, piece.offset + piece.length});
    }
    job->state = PersistedState::fresh(
        job->locator.text, torrent.file_length, plan, job->destination);
    job->state.content_id = content_id;
    job->save();
  }

  boost::asio::random_access_file backing {
      job->pool,
      job->destination.string(),
      boost::asio::random_access_file::flags::read_write
          | boost::asio::random_access_file::flags::create};
  backing.resize(torrent.file_length);

  auto store = std::make_shared<PieceStore>(pieces,
                                            std::move(backing),
                                            m_settings.block_bytes,
                                            m_settings.max_piece_hash_failures);
  for (uint32_t piece = 0; piece < pieces.size(); piece++) {
    if (job->state.units[piece].status == UnitStatus::Completed) {
      store->mark_completed(piece);
    }
  }
  auto initial_bytes = store->completed_bytes();

  job->report.scheduled_units = store->piece_count() - store->completed_count();
  set_phase(*job, TransferPhase::Transferring);

  std::vector<PeerEndpoint> peers;
  {
    std::lock_guard lock {m_peers_mutex};
    peers = m_injected_peers;
  }

  auto coordinator = std::make_shared<SwarmCoordinator>(
      job->pool,
      torrent,
      *store,
      m_settings,
      m_stop,
      std::move(peers),
      [job](uint32_t piece)
      {
        std::lock_guard lock {job->state_mutex};
        auto& record = job->state.units[piece];
        record.status = UnitStatus::Completed;
        record.bytes_received = record.range.length();
        record.failure.clear();
        job->save_locked();
      });
  {
    std::lock_guard lock {m_peers_mutex};
    m_coordinator = coordinator;
  }

  auto finished = std::make_shared<aux::WaitGroup>(job->strand);
  auto result = std::make_shared<SwarmResult>();
  finished->add();
  boost::asio::co_spawn(
      coordinator->executor(),
      coordinator->run(),
      [finished, result](std::exception_ptr error, SwarmResult outcome)
      {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception& e) {
            outcome.phase = TransferPhase::Failed;
            outcome.error = make_error(ErrorKind::Transport, e.what());
          }
        }
        boost::asio::post(finished->executor(),
                          [finished, result, outcome = std::move(outcome)]
                          {
                            *result = outcome;
                            finished->done();
                          });
      });

  // The coordinator holds references to the store, so wait it out even when
  // pausing.
  RateEstimator rate;
  while (!co_await finished->wait_until(steady_clock::now()
                                        + m_settings.progress_interval))
  {
    publish(swarm_snapshot(job->report.phase, *store, *coordinator, rate));
  }
  publish(swarm_snapshot(job->report.phase, *store, *coordinator, rate));

  {
    std::lock_guard lock {m_peers_mutex};
    m_coordinator.reset();
  }

  store->sync();
  job->report.bytes_transferred = store->completed_bytes() - initial_bytes;

  switch (result->phase) {
    case TransferPhase::Complete:
      break;
    case TransferPhase::Paused:
      job->save();
      set_phase(*job, TransferPhase::Paused);
      spdlog::info("paused {}: {} of {} pieces verified",
                   job->locator.text,
                   store->completed_count(),
                   store->piece_count());
      co_return;
    default: {
      auto error = result->error.value_or(
          make_error(ErrorKind::Transport, "swarm transfer failed"));
      {
        std::lock_guard lock {job->state_mutex};
        if (error.unit && *error.unit < job->state.units.size()) {
          auto& record = job->state.units[*error.unit];
          record.status = UnitStatus::Failed;
          record.failure = error.message;
        }
        job->save_locked();
      }
      throw TransferException(std::move(error));
    }
  }

  set_phase(*job, TransferPhase::Verifying);
  for (uint32_t piece = 0; piece < store->piece_count(); piece++) {
    if (!store->verify(piece)) {
      {
        std::lock_guard lock {job->state_mutex};
        auto& record = job->state.units[piece];
        record.status = UnitStatus::Pending;
        record.bytes_received = 0;
        job->save_locked();
      }
      throw TransferException(make_error(
          ErrorKind::Integrity,
          fmt::format("piece {} no longer matches its hash on disk", piece),
          piece));
    }
  }
  verify_destination(*job);

  job->journal.remove();
  set_phase(*job, TransferPhase::Complete);
}

void TransferOrchestrator::verify_destination(Job& job)
{
  auto digest = aux::sha256_file(job.destination, m_settings.increment_bytes);
  job.report.sha256 = digest;

  if (m_settings.expected_sha256 && *m_settings.expected_sha256 != digest) {
    job.journal.remove();
    job.parts.remove_all();
    std::error_code ec;
    std::filesystem::remove(job.destination, ec);

    throw TransferException(
        ErrorKind::Integrity,
        fmt::format("SHA-256 mismatch: expected {}, got {}",
                    aux::to_hex(*m_settings.expected_sha256),
                    aux::to_hex(digest)));
  }

  spdlog::info("SHA-256 of {}: {}", job.destination.string(), aux::to_hex(digest));
}

void TransferOrchestrator::set_phase(Job& job, TransferPhase phase)
{
  job.report.phase = phase;
  spdlog::info("{}: {}", job.locator.text, to_string(phase));
  if (m_sink) {
    m_sink->on_phase(phase);
  }
}

void TransferOrchestrator::publish(const ProgressSnapshot& snapshot)
{
  if (m_sink) {
    m_sink->on_progress(snapshot);
  }
}
}  // namespace ftr
