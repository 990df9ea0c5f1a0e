#include "log_ctrl.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace log_ctrl {

namespace {

std::mutex g_mutex;
LogSink g_sink;
std::atomic<bool> g_debug{false};

void emit(const char* tag, const char* fmt, va_list ap) {
  char body[512];
  vsnprintf(body, sizeof(body), fmt, ap);
  char line[600];
  snprintf(line, sizeof(line), "[%s] %s", tag, body);

  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_sink) {
    g_sink(line);
  } else {
    std::fputs(line, stdout);
    std::fputc('\n', stdout);
  }
}

} // namespace

void setSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_sink = std::move(sink);
}

void enableDebug(bool on) { g_debug = on; }
bool debugEnabled() { return g_debug; }

void printf(const char* tag, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(tag, fmt, ap);
  va_end(ap);
}

void debugf(const char* tag, const char* fmt, ...) {
  if (!g_debug) return;
  va_list ap;
  va_start(ap, fmt);
  emit(tag, fmt, ap);
  va_end(ap);
}

} // namespace log_ctrl
