#include <memory>
#include <string>
#include <vector>

#include "auxiliary/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ftr
{
void init_logging(std::string_view level, const std::filesystem::path& log_file)
{
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!log_file.empty()) {
    if (log_file.has_parent_path()) {
      std::filesystem::create_directories(log_file.parent_path());
    }
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        log_file.string(), false));
  }

  auto logger =
      std::make_shared<spdlog::logger>("fetcher", sinks.begin(), sinks.end());

  auto parsed = spdlog::level::from_str(std::string(level));
  if (parsed == spdlog::level::off && level != "off") {
    parsed = spdlog::level::info;
  }

  logger->set_level(parsed);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(std::move(logger));
}
}  // namespace ftr
