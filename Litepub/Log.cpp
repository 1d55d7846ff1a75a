#include "Log.h"

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>

#include <unistd.h>

namespace litepub {

namespace {

std::mutex g_log_mutex;
std::atomic<bool> g_verbose{false};

std::string timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm;
    localtime_r(&t, &tm);
    char time_str[32];
    std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &tm);
    return time_str;
}

void write_line(const char* level, const std::string& msg, std::string (*color)(const std::string&)) {
    std::string line = "[" + timestamp() + "] " + level + " " + msg;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (color && supports_color()) {
        line = color(line);
    }
    std::cout << line << "\n";
    std::cout.flush();
}

} // namespace

void set_verbose(bool verbose) {
    g_verbose = verbose;
}

void log_debug(const std::string& msg) {
    if (!g_verbose) return;
    write_line("DEBUG", msg, nullptr);
}

void log_info(const std::string& msg) {
    write_line("INFO ", msg, nullptr);
}

void log_warn(const std::string& msg) {
    write_line("WARN ", msg, colorize_yellow);
}

void log_error(const std::string& msg) {
    write_line("ERROR", msg, colorize_red);
}

bool supports_color() {
    // Respect NO_COLOR and avoid coloring when not a TTY or in "dumb" term
    if (std::getenv("NO_COLOR")) return false;
    if (!isatty(STDOUT_FILENO)) return false;
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") return false;
    return true;
}

std::string colorize_green(const std::string& s) {
    static const char* GREEN = "\x1b[32m";
    static const char* RESET = "\x1b[0m";
    return std::string(GREEN) + s + RESET;
}

std::string colorize_yellow(const std::string& s) {
    static const char* YELLOW = "\x1b[33m";
    static const char* RESET = "\x1b[0m";
    return std::string(YELLOW) + s + RESET;
}

std::string colorize_red(const std::string& s) {
    static const char* RED = "\x1b[31m";
    static const char* RESET = "\x1b[0m";
    return std::string(RED) + s + RESET;
}

std::string access_log_time() {
    std::time_t t = std::time(nullptr);
    std::tm tm;
    localtime_r(&t, &tm);
    char time_str[100];
    std::strftime(time_str, sizeof(time_str), "[%d/%b/%Y:%H:%M:%S]", &tm);
    return time_str;
}

} // namespace litepub
