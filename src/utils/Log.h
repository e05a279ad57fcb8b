#pragma once

#include <functional>

/*
===============================================================================
  Log.h
===============================================================================

  PURPOSE
  -------
  printf-style log notes, formatted into a fixed buffer and handed to a sink.
  The default sink writes "[tag] message" lines to stderr.

  Tests can swap the sink to capture or silence output.
===============================================================================
*/

enum class LogLevel : int {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
};

using LogSink = std::function<void(LogLevel level, const char* line)>;

void logf(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
  __attribute__((format(printf, 3, 4)))
#endif
  ;

// Replace the output sink. Passing an empty function restores stderr.
void setLogSink(LogSink sink);

// Messages below this level are dropped before formatting.
void setLogMinLevel(LogLevel level);
LogLevel logMinLevel();
