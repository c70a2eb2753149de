#include "util/LoggingUtil.hpp"

#include "util/Exception.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <map>
#include <memory>
#include <vector>

namespace util {

void Logging::init(const Params& params) {
  spdlog::level::level_enum level = parse_level(params.log_level);
  const char* format = params.omit_timestamps ? "%v" : "%Y-%m-%d %H:%M:%S.%f %v";

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!params.log_filename.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename,
                                                                        !params.append_mode));
  }
  for (auto& sink : sinks) {
    sink->set_pattern(format);
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::debug);

  // LOG_DEBUG and LOG_TRACE are additionally filtered at compile time
  spdlog::set_level(level);
}

spdlog::level::level_enum Logging::parse_level(const std::string& level) {
  using namespace spdlog::level;
  static const std::map<std::string, level_enum> kLevels = {
    {"trace", trace}, {"debug", debug}, {"info", info},
    {"warn", warn},   {"error", err},   {"off", off},
  };

  auto it = kLevels.find(level);
  if (it == kLevels.end()) {
    throw util::CleanException(
      "Invalid --log-level: \"{}\" (expected trace|debug|info|warn|error|off)", level);
  }
  return it->second;
}

}  // namespace util
