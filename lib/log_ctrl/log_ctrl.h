/*
 * log_ctrl.h | Zeilenbasierte Log-Ausgabe mit Tag
 *
 * Format wie auf der Firmware üblich: "[TAG] Nachricht".
 * Ausgabeziel ist austauschbar (Firmware: Serial, Host: stdout, Tests: Capture).
 */

#pragma once

#include <functional>
#include <string>

namespace log_ctrl {

typedef std::function<void(const char* line)> LogSink;

// Ausgabeziel setzen; nullptr stellt stdout wieder her
void setSink(LogSink sink);

// Debug-Zeilen (debugf) ein-/ausschalten
void enableDebug(bool on);
bool debugEnabled();

void printf(const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

void debugf(const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace log_ctrl
