#pragma once

namespace replistore {

/// Enable or disable log_debug output (off by default).
void set_verbose(bool verbose);
bool is_verbose();

/// printf-style logging. Info/debug lines go to stdout, warnings and
/// errors to stderr. Every call writes exactly one newline-terminated line.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace replistore
