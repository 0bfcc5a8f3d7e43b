#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

namespace aegis::config::v1 {
class RuntimeConfig;
}

namespace aegis::observability {

/*
  One key=value pair appended to a log line. Values containing spaces,
  quotes or '=' are quoted so file names stay a single token.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField PathField(std::string_view key, const std::filesystem::path& value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// "aegis-watch" logger on stdout, plus a rotating file when logging.file is set.
void InitializeLogging(const aegis::config::v1::RuntimeConfig& config);
void ShutdownLogging();

// false for names spdlog would silently map to "off"
bool IsValidLevel(std::string_view level);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace aegis::observability

#define AEGIS_LOG_DEBUG(message, ...) ::aegis::observability::LogDebug((message), ##__VA_ARGS__)
#define AEGIS_LOG_INFO(message, ...) ::aegis::observability::LogInfo((message), ##__VA_ARGS__)
#define AEGIS_LOG_WARN(message, ...) ::aegis::observability::LogWarn((message), ##__VA_ARGS__)
#define AEGIS_LOG_ERROR(message, ...) ::aegis::observability::LogError((message), ##__VA_ARGS__)
