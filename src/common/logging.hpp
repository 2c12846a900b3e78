#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace sessionwatch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory holding <process>.log and <process>-trace.log.
QString logsDirPath();

// Structured log event written as a single JSON line.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace sessionwatch::logging

#define SWLOG_DEBUG(component, where, what, why, ctxJson) \
    ::sessionwatch::logging::logEvent(::sessionwatch::logging::LogLevel::Debug, \
                                      (component), (where), (what), (why), (ctxJson))

#define SWLOG_INFO(component, where, what, why, ctxJson) \
    ::sessionwatch::logging::logEvent(::sessionwatch::logging::LogLevel::Info, \
                                      (component), (where), (what), (why), (ctxJson))

#define SWLOG_WARN(component, where, what, why, ctxJson) \
    ::sessionwatch::logging::logEvent(::sessionwatch::logging::LogLevel::Warn, \
                                      (component), (where), (what), (why), (ctxJson))

#define SWLOG_ERROR(component, where, what, why, ctxJson) \
    ::sessionwatch::logging::logEvent(::sessionwatch::logging::LogLevel::Error, \
                                      (component), (where), (what), (why), (ctxJson))
