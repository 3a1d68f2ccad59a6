#pragma once

#include <filesystem>
#include <string_view>

namespace ftr
{
// Installs the process-wide spdlog logger: colored console output plus an
// optional log file. Unknown level names fall back to "info".
void init_logging(std::string_view level,
                  const std::filesystem::path& log_file = {});
}  // namespace ftr
