#pragma once

#include <string>

namespace llmguard {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
// guardctl switches this on from LLMGUARD_LOG_FORMAT=json or --log-json.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are dropped. Defaults to INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Parses "debug", "info", "warn"/"warning" or "error" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool ParseLevel(const std::string &text, Level *out);

// Emit a log entry at the given level. `component` identifies the guard or
// subsystem (e.g. "pipeline", "corpus", "redactor"). `extra` is an optional
// key=value string appended to the JSON object or the text line.
// Callers must never pass raw user text or PII values here.
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace llmguard
