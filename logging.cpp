#include "logging.h"
#include <cstdio>
#include <cstdarg>

// Global state
bool gDebugEnabled = false;
std::vector<std::string> gDeferredWarnings;

static void emit(const char* prefix, const char* fmt, va_list args) {
  fprintf(stderr, "%s ", prefix);
  vfprintf(stderr, fmt, args);
  fprintf(stderr, "\n");
}

// Module paths in skip notices can be arbitrarily long; size the buffer to fit
static void defer(const char* prefix, const char* fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int n = vsnprintf(nullptr, 0, fmt, sizing);
  va_end(sizing);
  if (n < 0) return;

  std::string message(prefix);
  message += ' ';
  size_t offset = message.size();
  message.resize(offset + (size_t)n + 1);
  vsnprintf(&message[offset], (size_t)n + 1, fmt, args);
  message.resize(offset + (size_t)n);
  gDeferredWarnings.push_back(std::move(message));
}

void logDebugf(const char* fmt, ...) {
  if (!gDebugEnabled) return;
  va_list args;
  va_start(args, fmt);
  emit("[+]", fmt, args);
  va_end(args);
}

void logWarnf(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  emit("[*]", fmt, args);
  va_end(args);
}

void logErrorf(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  emit("[-]", fmt, args);
  va_end(args);
}

void deferWarnf(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  defer("[*]", fmt, args);
  va_end(args);
}

void deferDebugf(const char* fmt, ...) {
  if (!gDebugEnabled) return;
  va_list args;
  va_start(args, fmt);
  defer("[+]", fmt, args);
  va_end(args);
}

void flushDeferredWarnings() {
  if (gDeferredWarnings.empty()) return;
  logDebugf("%zu deferred notices", gDeferredWarnings.size());
  for (const auto& warning : gDeferredWarnings) {
    fprintf(stderr, "%s\n", warning.c_str());
  }
  gDeferredWarnings.clear();
}
