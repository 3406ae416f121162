#pragma once

namespace s3io {

/// Enable or disable log_debug() output (off by default).
void set_log_verbose(bool verbose);
bool log_verbose();

/// printf-style logging. Info goes to stdout, errors to stderr.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only emitted when verbose logging is enabled.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace s3io
