#pragma once

namespace gmailup {

/// Enable or disable log_debug output (process-wide).
void set_verbose_logging(bool enabled);
bool verbose_logging();

// printf-style helpers: info goes to stdout, errors to stderr.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace gmailup
