#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tending::runtime::config {
class RuntimeConfig;
}

namespace tending::observability {

/*
  Structured logging on the spdlog default logger "tending-manager".

  A line is the message followed by key=value fields:

    instance created sync_id=kitchen-42
    rpc failed route=TendingService.AddTender sync_id=home code=INVALID_ARGUMENT error="Tender name is required"

  Level and pattern come from the logging config section, overridable by
  TENDING_LOG_LEVEL and TENDING_LOG_PATTERN.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

inline LogField SyncIdField(std::string_view sync_id) {
  return StringField("sync_id", sync_id);
}

void InitializeLogging(const tending::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

bool ShouldLog(spdlog::level::level_enum level);
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace tending::observability

// Fields are only built when the level is enabled.
#define TENDING_LOG_AT(level, message, ...)                                   \
  do {                                                                        \
    if (::tending::observability::ShouldLog(level)) {                         \
      ::tending::observability::Log((level), (message), ##__VA_ARGS__);       \
    }                                                                         \
  } while (0)

#define TENDING_LOG_DEBUG(message, ...) TENDING_LOG_AT(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define TENDING_LOG_INFO(message, ...) TENDING_LOG_AT(::spdlog::level::info, (message), ##__VA_ARGS__)
#define TENDING_LOG_WARN(message, ...) TENDING_LOG_AT(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define TENDING_LOG_ERROR(message, ...) TENDING_LOG_AT(::spdlog::level::err, (message), ##__VA_ARGS__)
