#include <algorithm>
#include <array>
#include <cstdio>

#include "app.hpp"

#include <boost/version.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <openssl/opensslv.h>
#include <spdlog/version.h>

#include "auxiliary/hash.hpp"

namespace ftr
{
std::string format_bytes(uint64_t bytes)
{
  constexpr std::array<const char*, 5> UNITS {"B", "KiB", "MiB", "GiB", "TiB"};

  auto value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < UNITS.size()) {
    value /= 1024.0;
    unit++;
  }

  if (unit == 0) {
    return fmt::format("{} B", bytes);
  }
  return fmt::format("{:.1f} {}", value, UNITS[unit]);
}

void ConsoleProgressSink::on_phase(TransferPhase phase)
{
  std::lock_guard lock {m_mutex};
  if (m_line_open) {
    fmt::print("\n");
    m_line_open = false;
  }

  fmt::print(fg(fmt::color::antique_white) | fmt::emphasis::italic,
             "{}...\n",
             to_string(phase));
  std::fflush(stdout);
}

void ConsoleProgressSink::on_progress(const ProgressSnapshot& snapshot)
{
  if (snapshot.phase != TransferPhase::Transferring) {
    return;
  }

  auto completed = std::count_if(snapshot.units.begin(),
                                 snapshot.units.end(),
                                 [](const UnitProgress& unit)
                                 { return unit.status == UnitStatus::Completed; });

  std::string amount = format_bytes(snapshot.bytes_done);
  if (snapshot.bytes_total) {
    auto percent = *snapshot.bytes_total == 0
        ? 100.0
        : 100.0 * static_cast<double>(snapshot.bytes_done)
            / static_cast<double>(*snapshot.bytes_total);
    amount = fmt::format("{} / {} {:5.1f}%",
                         amount,
                         format_bytes(*snapshot.bytes_total),
                         percent);
  }

  auto eta = snapshot.eta ? fmt::format("{}s", snapshot.eta->count())
                          : std::string("--");
  auto peers = snapshot.connected_peers > 0
      ? fmt::format("  peers {}", snapshot.connected_peers)
      : std::string();

  std::lock_guard lock {m_mutex};
  fmt::print("\r");
  fmt::print(fg(fmt::color::aqua), "{}", amount);
  fmt::print("  {}/s  eta {}  units {}/{}{}    ",
             format_bytes(static_cast<uint64_t>(snapshot.rate)),
             eta,
             completed,
             snapshot.units.size(),
             peers);
  std::fflush(stdout);
  m_line_open = true;
}

void ConsoleProgressSink::close_line()
{
  std::lock_guard lock {m_mutex};
  if (m_line_open) {
    fmt::print("\n");
    m_line_open = false;
  }
}

App::App(Settings settings)
    : m_progress {std::make_shared<ConsoleProgressSink>()}
    , m_orchestrator {std::move(settings), m_progress}
{
}

void App::print_banner() const
{
  fmt::print(fg(fmt::color::aqua) | fmt::emphasis::bold | fmt::emphasis::italic,
             "Welcome to fetcher!\n");

  fmt::print(fg(fmt::color::antique_white) | fmt::emphasis::bold
                 | fmt::emphasis::italic,
             "Built with:\n");
  fmt::print(fg(fmt::color::orange) | fmt::emphasis::italic,
             " *Boost Version: {}\n",
             BOOST_LIB_VERSION);

  fmt::print(fg(fmt::color::rebecca_purple) | fmt::emphasis::italic,
             " *FMT Version: {}\n",
             FMT_VERSION);

  fmt::print(fg(fmt::color::medium_violet_red) | fmt::emphasis::italic,
             " *OPENSSL Version: {}\n",
             OPENSSL_VERSION_STR);

  fmt::print(fg(fmt::color::steel_blue) | fmt::emphasis::italic,
             " *spdlog Version: {}.{}.{}\n",
             SPDLOG_VER_MAJOR,
             SPDLOG_VER_MINOR,
             SPDLOG_VER_PATCH);
}

int App::run(const std::string& locator,
             std::optional<std::filesystem::path> output)
{
  fmt::print(fg(fmt::color::antique_white) | fmt::emphasis::bold
                 | fmt::emphasis::italic,
             "\nFetching {}\n",
             locator);

  auto report = m_orchestrator.run(locator, std::move(output));
  m_progress->close_line();
  print_report(report);

  switch (report.phase) {
    case TransferPhase::Complete:
      return EXIT_COMPLETE;
    case TransferPhase::Paused:
      return EXIT_PAUSED;
    default:
      return EXIT_FAILED;
  }
}

void App::print_report(const TransferReport& report)
{
  auto seconds = std::chrono::duration<double>(report.elapsed).count();

  if (report.ok()) {
    fmt::print(fg(fmt::color::lime_green) | fmt::emphasis::bold,
               "Saved {}\n",
               report.destination.string());
    fmt::print(" {} in {:.2f}s{}\n",
               format_bytes(report.total_size.value_or(0)),
               seconds,
               report.resumed ? " (resumed)" : "");
    if (report.sha256) {
      fmt::print(" SHA-256: {}\n", aux::to_hex(*report.sha256));
    }
    return;
  }

  if (report.phase == TransferPhase::Paused) {
    fmt::print(fg(fmt::color::gold) | fmt::emphasis::bold,
               "Paused after {:.2f}s; run the same command again to resume.\n",
               seconds);
    return;
  }

  fmt::print(fg(fmt::color::red) | fmt::emphasis::bold,
             "Transfer failed: {}\n",
             report.error ? report.error->describe()
                          : std::string("unknown error"));
  for (const auto& failure : report.failed_units) {
    fmt::print(fg(fmt::color::red), " unit {}: {}\n", failure.unit, failure.reason);
  }
}
}  // namespace ftr
