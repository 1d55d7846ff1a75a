#pragma once

#include <string>

namespace litepub {

// --- Console logging ---
// One line per call, "[YYYY-mm-dd HH:MM:SS] LEVEL message". Safe to call from
// the httplib worker threads.

void set_verbose(bool verbose);

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

// ANSI color is only used on a real terminal without NO_COLOR.
bool supports_color();

std::string colorize_green(const std::string& s);
std::string colorize_yellow(const std::string& s);
std::string colorize_red(const std::string& s);

// "[19/Oct/2026:10:04:59]" for the access log.
std::string access_log_time();

} // namespace litepub
