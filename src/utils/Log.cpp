#include "utils/Log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>

#include "Params.h"

namespace {

std::mutex g_sink_mutex;
LogSink g_sink;
std::atomic<int> g_min_level{LOG_MIN_LEVEL};

const char* levelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "D";
    case LogLevel::INFO:  return "I";
    case LogLevel::WARN:  return "W";
    case LogLevel::ERROR: return "E";
  }
  return "?";
}

}  // namespace

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
  if ((int)level < g_min_level.load()) return;

  char body[LOG_LINE_BYTES];
  va_list args;
  va_start(args, fmt);
  vsnprintf(body, sizeof(body), fmt, args);
  va_end(args);

  char line[LOG_LINE_BYTES + 32];
  snprintf(line, sizeof(line), "[%s] %s", tag ? tag : "-", body);

  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if (g_sink) {
    g_sink(level, line);
    return;
  }
  fprintf(stderr, "%s %s\n", levelName(level), line);
}

void setLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(sink);
}

void setLogMinLevel(LogLevel level) {
  g_min_level.store((int)level);
}

LogLevel logMinLevel() {
  return (LogLevel)g_min_level.load();
}
