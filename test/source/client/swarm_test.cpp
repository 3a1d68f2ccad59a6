#include <thread>

#include <catch2/catch_test_macros.hpp>

#include "client/journal/state_journal.hpp"
#include "client/orchestrator.hpp"
#include "client/transmit/transmit.hpp"
#include "torrent/bitfield/bitfield.hpp"
#include "torrent/metadata/torrentfile.hpp"
#include "test_support.hpp"

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;
using ftr::TransferOrchestrator;
using ftr::TransferPhase;

namespace
{
constexpr uint32_t PIECE_LENGTH = 64;

enum class SeederMode : uint8_t
{
  Honest,
  WrongInfoHash,
  Corrupt,
  ChokeMidPiece,  // drops its second request and chokes, then unchokes
  Silent,  // accepts requests but never answers them
  Slow,  // waits a few milliseconds before each block
};

/*
 * Minimal seeding peer on a loopback port: answers the handshake, announces
 * every piece, unchokes and serves each request from `content`.
 */
class FakeSeeder
{
  boost::asio::io_context m_io;
  tcp::acceptor m_acceptor;
  std::vector<uint8_t> m_content;
  ftr::InfoHash m_info_hash;
  SeederMode m_mode;
  std::thread m_thread;

public:
  std::atomic<size_t> blocks_served {0};
  std::atomic<size_t> requests_seen {0};
  std::atomic<size_t> chokes_sent {0};
  std::atomic<size_t> most_pieces_announced {0};

  FakeSeeder(std::vector<uint8_t> content,
             const ftr::InfoHash& info_hash,
             SeederMode mode)
      : m_acceptor {m_io, tcp::endpoint {boost::asio::ip::address_v4::loopback(), 0}}
      , m_content {std::move(content)}
      , m_info_hash {info_hash}
      , m_mode {mode}
  {
    boost::asio::co_spawn(m_io, accept_loop(), boost::asio::detached);
    m_thread = std::thread([this] { m_io.run(); });
  }

  FakeSeeder(const FakeSeeder&) = delete;
  FakeSeeder& operator=(const FakeSeeder&) = delete;

  ~FakeSeeder()
  {
    m_io.stop();
    m_thread.join();
  }

  ftr::PeerEndpoint endpoint() const
  {
    auto local = m_acceptor.local_endpoint();
    return {.address = local.address(), .port = local.port()};
  }

private:
  uint32_t piece_count() const
  {
    return static_cast<uint32_t>(
        (m_content.size() + PIECE_LENGTH - 1) / PIECE_LENGTH);
  }

  awaitable<void> accept_loop()
  {
    while (true) {
      auto socket = co_await m_acceptor.async_accept(use_awaitable);
      boost::asio::co_spawn(m_io, serve(std::move(socket)), boost::asio::detached);
    }
  }

  awaitable<void> serve(tcp::socket socket)
  {
    try {
      co_await ftr::read_handshake(socket);

      auto info_hash = m_info_hash;
      if (m_mode == SeederMode::WrongInfoHash) {
        info_hash[0] ^= 0xff;
      }
      co_await ftr::send_handshake(socket,
                                   ftr::Handshake {info_hash, ftr::aux::PeerId {}});

      ftr::aux::BitField pieces {piece_count()};
      for (uint32_t piece = 0; piece < piece_count(); piece++) {
        pieces.mark(piece, true);
      }
      co_await ftr::send_message(socket, ftr::BitFieldMessage {pieces.as_raw()});
      co_await ftr::send_message(socket, ftr::Unchoke {});

      size_t requests = 0;
      while (true) {
        auto message = co_await ftr::read_message(socket, 1024);
        if (!message) {
          co_return;
        }

        if (const auto* bitfield = std::get_if<ftr::BitFieldMessage>(&*message)) {
          auto held = ftr::aux::BitField {bitfield->get_payload()}.count();
          if (held > most_pieces_announced) {
            most_pieces_announced = held;
          }
          continue;
        }

        const auto* request = std::get_if<ftr::Request>(&*message);
        if (request == nullptr) {
          continue;
        }
        requests_seen++;
        requests++;

        if (m_mode == SeederMode::Silent) {
          continue;
        }
        if (m_mode == SeederMode::ChokeMidPiece && requests == 2) {
          co_await ftr::send_message(socket, ftr::Choke {});
          chokes_sent++;
          co_await ftr::send_message(socket, ftr::Unchoke {});
          continue;
        }

        uint64_t begin = static_cast<uint64_t>(
                             static_cast<uint32_t>(request->piece_index))
                * PIECE_LENGTH
            + static_cast<uint32_t>(request->offset_within_piece);
        uint64_t end = begin + static_cast<uint32_t>(request->length);
        if (end > m_content.size()) {
          co_return;
        }

        std::vector<uint8_t> block(m_content.begin() + begin,
                                   m_content.begin() + end);
        if (m_mode == SeederMode::Slow) {
          boost::asio::steady_timer delay {m_io, std::chrono::milliseconds(5)};
          co_await delay.async_wait(use_awaitable);
        }
        if (m_mode == SeederMode::Corrupt) {
          for (auto& byte : block) {
            byte ^= 0x5a;
          }
        }

        co_await ftr::send_message(
            socket,
            ftr::make_piece(request->piece_index,
                            request->offset_within_piece,
                            std::move(block)));
        blocks_served++;
      }
    } catch (const boost::system::system_error&) {
      // the downloader hung up
    }
  }
};

struct SwarmFixture
{
  ftr::test::TempDirectory directory;
  std::vector<uint8_t> content = ftr::test::pattern_bytes(1000, 3);
  std::filesystem::path descriptor = directory / "payload.torrent";
  ftr::TorrentFile torrent;
  ftr::Settings settings;

  SwarmFixture()
  {
    auto encoded = ftr::test::make_torrent(content, PIECE_LENGTH, "payload.bin");
    ftr::test::write_file(descriptor, encoded);
    torrent = *ftr::load_torrent_file(encoded);

    settings.target_directory = directory / "downloads";
    settings.threads = 2;
    settings.block_bytes = 16;
    settings.pipeline_depth = 4;
    settings.connect_timeout = std::chrono::seconds(2);
    settings.handshake_timeout = std::chrono::seconds(2);
    settings.progress_interval = std::chrono::milliseconds(20);
  }

  std::filesystem::path destination() const
  {
    return settings.target_directory / "payload.bin";
  }

  ftr::aux::Sha256Digest digest() const
  {
    ftr::aux::Sha256 hasher;
    hasher.update(content);
    return hasher.finish();
  }
};

class PauseOnTransfer : public ftr::IProgressSink
{
public:
  TransferOrchestrator* orchestrator = nullptr;
  bool armed = true;

  void on_phase(TransferPhase phase) override
  {
    if (armed && phase == TransferPhase::Transferring) {
      armed = false;
      orchestrator->request_pause();
    }
  }

  void on_progress(const ftr::ProgressSnapshot&) override {}
};
}  // namespace

TEST_CASE("A swarm job completes from a loopback seeder", "[swarm]")
{
  SwarmFixture fixture;
  FakeSeeder impostor {fixture.content, fixture.torrent.info_hash, SeederMode::WrongInfoHash};
  FakeSeeder seeder {fixture.content, fixture.torrent.info_hash, SeederMode::Honest};

  TransferOrchestrator orchestrator {fixture.settings};
  orchestrator.add_peers({impostor.endpoint(), seeder.endpoint()});

  auto report = orchestrator.run(fixture.descriptor.string());

  REQUIRE(report.phase == TransferPhase::Complete);
  REQUIRE(report.destination == fixture.destination());
  REQUIRE(report.total_size == fixture.content.size());
  REQUIRE(report.bytes_transferred == fixture.content.size());
  REQUIRE(report.scheduled_units == fixture.torrent.piece_count());
  REQUIRE(report.sha256 == fixture.digest());
  REQUIRE(ftr::test::read_file(fixture.destination()) == fixture.content);
  REQUIRE(impostor.blocks_served.load() == 0);

  auto locator = ftr::Locator::parse(fixture.descriptor.string());
  boost::asio::io_context io;
  ftr::StateJournal journal {
      io.get_executor(),
      ftr::StateJournal::path_for(fixture.settings.resolved_state_directory(),
                                  locator->key())};
  REQUIRE_FALSE(journal.exists());
}

TEST_CASE("Corrupt blocks from one peer do not spoil the download", "[swarm]")
{
  SwarmFixture fixture;
  FakeSeeder corrupt {fixture.content, fixture.torrent.info_hash, SeederMode::Corrupt};
  FakeSeeder seeder {fixture.content, fixture.torrent.info_hash, SeederMode::Honest};

  TransferOrchestrator orchestrator {fixture.settings};
  orchestrator.add_peers({corrupt.endpoint(), seeder.endpoint()});

  auto report = orchestrator.run(fixture.descriptor.string());

  REQUIRE(report.phase == TransferPhase::Complete);
  REQUIRE(ftr::test::read_file(fixture.destination()) == fixture.content);
}

TEST_CASE("A paused swarm job resumes into the same file", "[swarm]")
{
  SwarmFixture fixture;
  FakeSeeder seeder {fixture.content, fixture.torrent.info_hash, SeederMode::Honest};

  auto sink = std::make_shared<PauseOnTransfer>();
  TransferOrchestrator orchestrator {fixture.settings, sink};
  sink->orchestrator = &orchestrator;
  orchestrator.add_peers({seeder.endpoint()});

  auto paused = orchestrator.run(fixture.descriptor.string());
  REQUIRE(paused.phase == TransferPhase::Paused);
  REQUIRE(std::filesystem::exists(fixture.destination()));

  auto resumed = orchestrator.run(fixture.descriptor.string());
  REQUIRE(resumed.phase == TransferPhase::Complete);
  REQUIRE(resumed.resumed);
  REQUIRE(ftr::test::read_file(fixture.destination()) == fixture.content);
}

class PauseAfterBytes : public ftr::IProgressSink
{
  uint64_t m_threshold;

public:
  TransferOrchestrator* orchestrator = nullptr;
  bool armed = true;

  explicit PauseAfterBytes(uint64_t threshold)
      : m_threshold {threshold}
  {
  }

  void on_phase(TransferPhase) override {}

  void on_progress(const ftr::ProgressSnapshot& snapshot) override
  {
    if (armed && snapshot.bytes_done >= m_threshold) {
      armed = false;
      orchestrator->request_pause();
    }
  }
};

TEST_CASE("A resumed session announces the pieces it already holds", "[swarm]")
{
  SwarmFixture fixture;
  FakeSeeder seeder {fixture.content, fixture.torrent.info_hash, SeederMode::Slow};

  auto sink = std::make_shared<PauseAfterBytes>(3 * PIECE_LENGTH);
  TransferOrchestrator orchestrator {fixture.settings, sink};
  sink->orchestrator = &orchestrator;
  orchestrator.add_peers({seeder.endpoint()});

  auto paused = orchestrator.run(fixture.descriptor.string());
  REQUIRE(paused.phase == TransferPhase::Paused);

  auto resumed = orchestrator.run(fixture.descriptor.string());
  REQUIRE(resumed.phase == TransferPhase::Complete);
  REQUIRE(seeder.most_pieces_announced.load() >= 3);
  REQUIRE(ftr::test::read_file(fixture.destination()) == fixture.content);
}

TEST_CASE("A swarm without peers or trackers fails", "[swarm]")
{
  SwarmFixture fixture;

  TransferOrchestrator orchestrator {fixture.settings};
  auto report = orchestrator.run(fixture.descriptor.string());

  REQUIRE(report.phase == TransferPhase::Failed);
  REQUIRE(report.error->kind == ftr::ErrorKind::Transport);
}

TEST_CASE("Requests cut off by a choke are sent again after the unchoke",
          "[swarm]")
{
  SwarmFixture fixture;
  // a lost request would only come back through an idle reconnect
  fixture.settings.peer_idle_timeout = std::chrono::seconds(10);
  FakeSeeder seeder {fixture.content, fixture.torrent.info_hash, SeederMode::ChokeMidPiece};

  TransferOrchestrator orchestrator {fixture.settings};
  orchestrator.add_peers({seeder.endpoint()});

  auto started = std::chrono::steady_clock::now();
  auto report = orchestrator.run(fixture.descriptor.string());

  REQUIRE(report.phase == TransferPhase::Complete);
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(8));
  REQUIRE(seeder.chokes_sent.load() >= 1);
  REQUIRE(ftr::test::read_file(fixture.destination()) == fixture.content);
}

TEST_CASE("A silent peer times out and another peer takes over its piece",
          "[swarm]")
{
  SwarmFixture fixture;
  fixture.settings.peer_idle_timeout = std::chrono::seconds(1);
  fixture.settings.max_candidate_failures = 1;
  FakeSeeder silent {fixture.content, fixture.torrent.info_hash, SeederMode::Silent};
  FakeSeeder seeder {fixture.content, fixture.torrent.info_hash, SeederMode::Honest};

  TransferOrchestrator orchestrator {fixture.settings};
  orchestrator.add_peers({silent.endpoint(), seeder.endpoint()});

  auto report = orchestrator.run(fixture.descriptor.string());

  REQUIRE(report.phase == TransferPhase::Complete);
  REQUIRE(silent.requests_seen.load() > 0);
  REQUIRE(silent.blocks_served.load() == 0);
  REQUIRE(ftr::test::read_file(fixture.destination()) == fixture.content);
}

TEST_CASE("A swarm whose only peer stays silent fails once the peer idles out",
          "[swarm]")
{
  SwarmFixture fixture;
  fixture.settings.peer_idle_timeout = std::chrono::seconds(1);
  fixture.settings.max_candidate_failures = 1;
  FakeSeeder silent {fixture.content, fixture.torrent.info_hash, SeederMode::Silent};

  TransferOrchestrator orchestrator {fixture.settings};
  orchestrator.add_peers({silent.endpoint()});

  auto started = std::chrono::steady_clock::now();
  auto report = orchestrator.run(fixture.descriptor.string());

  REQUIRE(report.phase == TransferPhase::Failed);
  REQUIRE(report.error->kind == ftr::ErrorKind::Transport);
  REQUIRE(silent.requests_seen.load() > 0);
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(30));
}

TEST_CASE("Trackers that cannot be reached are given up and the swarm fails",
          "[swarm]")
{
  ftr::test::TempDirectory directory;
  auto content = ftr::test::pattern_bytes(256, 5);
  auto descriptor = directory / "tracked.torrent";

  // the first cannot be resolved, the second never answers
  boost::asio::io_context io;
  boost::asio::ip::udp::socket mute {
      io, boost::asio::ip::udp::endpoint {boost::asio::ip::address_v4::loopback(), 0}};
  ftr::test::write_file(
      descriptor,
      ftr::test::make_torrent(
          content,
          PIECE_LENGTH,
          "tracked.bin",
          {"udp://127.0.0.1:no-such-service",
           fmt::format("udp://127.0.0.1:{}", mute.local_endpoint().port())}));

  ftr::Settings settings;
  settings.target_directory = directory / "downloads";
  settings.threads = 2;
  settings.tracker_timeout = std::chrono::seconds(1);
  settings.announce_backoff_base = std::chrono::seconds(1);
  settings.announce_backoff_cap = std::chrono::seconds(1);
  settings.max_announce_failures = 2;
  settings.progress_interval = std::chrono::milliseconds(20);

  TransferOrchestrator orchestrator {settings};

  auto started = std::chrono::steady_clock::now();
  auto report = orchestrator.run(descriptor.string());

  REQUIRE(report.phase == TransferPhase::Failed);
  REQUIRE(report.error->kind == ftr::ErrorKind::Transport);
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(30));
}

TEST_CASE("A missing descriptor fails the job", "[swarm]")
{
  SwarmFixture fixture;

  TransferOrchestrator orchestrator {fixture.settings};
  auto report =
      orchestrator.run((fixture.directory / "absent.torrent").string());

  REQUIRE(report.phase == TransferPhase::Failed);
  REQUIRE(report.error);
}
