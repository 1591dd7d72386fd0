#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace uptally::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

QString processName();

// Path of the JSON-lines log file for the current process.
QString logFilePath();

// Structured log event, one JSON object per line. Debug events are dropped
// unless tracing is enabled.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context = nlohmann::json::object());

} // namespace uptally::logging

#define ULOG_DEBUG(component, where, what, ctxJson) \
    ::uptally::logging::logEvent(::uptally::logging::LogLevel::Debug, \
                                 (component), (where), (what), (ctxJson))

#define ULOG_INFO(component, where, what, ctxJson) \
    ::uptally::logging::logEvent(::uptally::logging::LogLevel::Info, \
                                 (component), (where), (what), (ctxJson))

#define ULOG_WARN(component, where, what, ctxJson) \
    ::uptally::logging::logEvent(::uptally::logging::LogLevel::Warn, \
                                 (component), (where), (what), (ctxJson))

#define ULOG_ERROR(component, where, what, ctxJson) \
    ::uptally::logging::logEvent(::uptally::logging::LogLevel::Error, \
                                 (component), (where), (what), (ctxJson))
