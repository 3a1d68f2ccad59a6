#include <csignal>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "auxiliary/hash.hpp"
#include "auxiliary/logging.hpp"
#include "client/peer_endpoint.hpp"
#include "client/settings.hpp"

namespace po = boost::program_options;

namespace
{
void print_usage(const po::options_description& options)
{
  fmt::print("usage: fetcher [options] <locator>\n\n"
             "  <locator>  http(s)://..., file://<path>, a local path,\n"
             "             torrent://<path> or a path ending in .torrent\n\n");
  fmt::print("{}\n", fmt::streamed(options));
}

ftr::Result<ftr::Settings> apply_options(const po::variables_map& vm)
{
  ftr::Settings settings {};

  if (vm.count("config")) {
    auto loaded = ftr::load_settings(vm["config"].as<std::string>());
    if (!loaded) {
      return loaded;
    }
    settings = std::move(*loaded);
  }

  if (vm.count("target-dir")) {
    settings.target_directory = vm["target-dir"].as<std::string>();
  }
  if (vm.count("state-dir")) {
    settings.state_directory = vm["state-dir"].as<std::string>();
  }
  if (vm.count("workers")) {
    settings.workers = vm["workers"].as<uint32_t>();
  }
  if (vm.count("chunk-size")) {
    settings.increment_bytes = vm["chunk-size"].as<uint32_t>();
  }
  if (vm.count("threads")) {
    settings.threads = vm["threads"].as<uint32_t>();
  }
  if (vm.count("resume")) {
    settings.resume = true;
  }
  if (vm.count("no-resume")) {
    settings.resume = false;
  }
  if (vm.count("overwrite")) {
    settings.overwrite = true;
  }
  if (vm.count("no-cleanup")) {
    settings.keep_parts = true;
  }
  if (vm.count("discard-corrupt-state")) {
    settings.discard_corrupt_state = true;
  }
  if (vm.count("log-level")) {
    settings.log_level = vm["log-level"].as<std::string>();
  }
  if (vm.count("log-file")) {
    settings.log_file = vm["log-file"].as<std::string>();
  }

  if (vm.count("sha256")) {
    auto digest = ftr::aux::sha256_from_hex(vm["sha256"].as<std::string>());
    if (!digest) {
      return std::unexpected(ftr::make_error(
          ftr::ErrorKind::InvalidInput, "--sha256 needs a 64 digit hex digest"));
    }
    settings.expected_sha256 = *digest;
  }

  if (settings.workers == 0 || settings.increment_bytes == 0) {
    return std::unexpected(ftr::make_error(
        ftr::ErrorKind::InvalidInput, "--workers and --chunk-size must be positive"));
  }

  return settings;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
  po::options_description options {"Options"};
  // clang-format off
  options.add_options()
      ("help,h", "show this help")
      ("config,c", po::value<std::string>(), "JSON settings file")
      ("target-dir,d", po::value<std::string>(), "directory for downloads")
      ("state-dir", po::value<std::string>(), "directory for state and part files")
      ("output,o", po::value<std::string>(), "destination file")
      ("workers,w", po::value<uint32_t>(), "ranges to split a bulk download into")
      ("chunk-size", po::value<uint32_t>(), "bytes per read increment")
      ("threads", po::value<uint32_t>(), "worker threads")
      ("resume", "resume from saved state (default)")
      ("no-resume", "discard saved state and start over")
      ("overwrite", "replace an existing destination")
      ("no-cleanup", "keep part files after a successful merge")
      ("sha256", po::value<std::string>(), "expected SHA-256 of the result")
      ("log-level", po::value<std::string>(), "trace, debug, info, warn or error")
      ("log-file", po::value<std::string>(), "also log to this file")
      ("discard-corrupt-state", "start over when saved state is unreadable")
      ("peer", po::value<std::vector<std::string>>(), "extra swarm peer host:port");
  // clang-format on

  po::options_description hidden;
  hidden.add_options()("locator", po::value<std::string>());

  po::options_description all;
  all.add(options).add(hidden);

  po::positional_options_description positional;
  positional.add("locator", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    fmt::print(stderr, "fetcher: {}\n", e.what());
    return ftr::EXIT_USAGE;
  }

  if (vm.count("help") || !vm.count("locator")) {
    print_usage(options);
    return vm.count("help") ? ftr::EXIT_COMPLETE : ftr::EXIT_USAGE;
  }

  auto settings = apply_options(vm);
  if (!settings) {
    fmt::print(stderr, "fetcher: {}\n", settings.error().describe());
    return ftr::EXIT_USAGE;
  }

  std::vector<ftr::PeerEndpoint> peers;
  if (vm.count("peer")) {
    for (const auto& text : vm["peer"].as<std::vector<std::string>>()) {
      auto peer = ftr::PeerEndpoint::parse(text);
      if (!peer) {
        fmt::print(stderr, "fetcher: {}\n", peer.error().describe());
        return ftr::EXIT_USAGE;
      }
      peers.push_back(*peer);
    }
  }

  ftr::init_logging(settings->log_level, settings->log_file);

  std::optional<std::filesystem::path> output;
  if (vm.count("output")) {
    output = vm["output"].as<std::string>();
  }

  ftr::App app {std::move(*settings)};
  app.print_banner();
  if (!peers.empty()) {
    app.orchestrator().add_peers(std::move(peers));
  }

  // The first signal pauses the job; later ones are ignored until it has.
  boost::asio::io_context signal_io;
  boost::asio::signal_set signals {signal_io, SIGINT, SIGTERM};
  std::function<void(const boost::system::error_code&, int)> on_signal =
      [&](const boost::system::error_code& ec, int signal)
  {
    if (ec) {
      return;
    }
    spdlog::info("received signal {}, pausing", signal);
    app.request_pause();
    signals.async_wait(on_signal);
  };
  signals.async_wait(on_signal);
  std::thread signal_thread {[&signal_io] { signal_io.run(); }};

  auto code = app.run(vm["locator"].as<std::string>(), std::move(output));

  signal_io.stop();
  signal_thread.join();
  spdlog::shutdown();

  return code;
}
