#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "client/orchestrator.hpp"
#include "client/progress.hpp"
#include "client/settings.hpp"

namespace ftr
{
constexpr int EXIT_COMPLETE = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_PAUSED = 3;

// Redraws one status line on stdout.
class ConsoleProgressSink : public IProgressSink
{
  std::mutex m_mutex;
  bool m_line_open = false;

public:
  void on_phase(TransferPhase phase) override final;

  void on_progress(const ProgressSnapshot& snapshot) override final;

  void close_line();
};

class App
{
  std::shared_ptr<ConsoleProgressSink> m_progress;
  TransferOrchestrator m_orchestrator;

public:
  explicit App(Settings settings);

  void print_banner() const;

  // Thread safe, for signal handlers.
  void request_pause() { m_orchestrator.request_pause(); }

  TransferOrchestrator& orchestrator() { return m_orchestrator; }

  // Returns the process exit code.
  int run(const std::string& locator,
          std::optional<std::filesystem::path> output);

private:
  void print_report(const TransferReport& report);
};

std::string format_bytes(uint64_t bytes);
}  // namespace ftr
