#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "aegis/config/v1/config.pb.h"

namespace aegis::observability {
namespace {

constexpr const char* kLoggerName     = "aegis-watch";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
constexpr std::size_t kDefaultFileMb  = 10;
constexpr std::size_t kDefaultFiles   = 5;

std::string FromEnvOr(const char* name, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuotes(const std::string& value) {
  return value.empty() || value.find_first_of(" \"=\t") != std::string::npos;
}

void AppendValue(std::ostringstream& out, const std::string& value) {
  if (!NeedsQuotes(value)) {
    out << value;
    return;
  }
  out << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out << '\\';
    out << c;
  }
  out << '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) out << ' ';
    first = false;
    out << field.key << '=';
    AppendValue(out, field.value);
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField PathField(std::string_view key, const std::filesystem::path& value) {
  return {std::string(key), value.string()};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

bool IsValidLevel(std::string_view level) {
  for (const char* name : {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"}) {
    if (level == name) return true;
  }
  return false;
}

void InitializeLogging(const aegis::config::v1::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!logging.file().empty()) {
    const std::size_t max_mb    = logging.max_file_mb() > 0 ? logging.max_file_mb() : kDefaultFileMb;
    const std::size_t max_files = logging.max_files() > 0 ? logging.max_files() : kDefaultFiles;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file(), max_mb * 1024 * 1024, max_files));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(FromEnvOr("AEGIS_LOG_PATTERN", logging.pattern(), kDefaultPattern));

  auto level = FromEnvOr("AEGIS_LOG_LEVEL", logging.level(), "info");
  if (!IsValidLevel(level)) level = "info";
  logger->set_level(spdlog::level::from_str(level));

  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  const auto serialized = SerializeFields(fields);
  if (serialized.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized);
}

} // namespace aegis::observability
