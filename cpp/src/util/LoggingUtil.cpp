#include "util/LoggingUtil.hpp"

#include "util/Exception.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace util {

void Logging::init(const Params& params) {
  spdlog::level::level_enum level = spdlog::level::from_str(params.log_level);
  if (level == spdlog::level::off && params.log_level != "off") {
    throw util::CleanException("Unknown log level \"{}\"", params.log_level);
  }

  std::vector<spdlog::sink_ptr> sinks;

  const char* format = params.omit_timestamps ? "%v" : "%Y-%m-%d %H:%M:%S.%f %v";

  // Console sink
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern(format);
  sinks.push_back(console_sink);

  // File sink, if needed
  if (!params.log_filename.empty()) {
    auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, !params.append_mode);
    file_sink->set_pattern(format);
    sinks.push_back(file_sink);
  }

  auto logger = std::make_shared<spdlog::logger>("loopwalk", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);

  spdlog::flush_on(spdlog::level::debug);

  // LOG_DEBUG() and LOG_TRACE() are also filtered at compile-time, see LoggingUtil.hpp
  spdlog::set_level(level);
}

}  // namespace util
