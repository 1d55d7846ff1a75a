#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace litepub {

namespace fs = std::filesystem;

// --- Version number ---
extern const char VERSION[];

// Everything the server needs, fixed at startup.
struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8181;
    std::string cert_path = "tests/example-keys/server.crt";
    std::string key_path = "tests/example-keys/server.key";
    fs::path content_root = "tests/example-content";
    bool use_tls = true;
    bool directory_listing = true;
    bool verbose = false;
};

struct CommandLine {
    ServerConfig config;
    bool show_help = false;
    std::string error; // non-empty when the arguments are unusable
};

CommandLine parse_command_line(int argc, const char* const argv[]);

void print_usage(const char* progname);

// Makes `content_root` absolute and canonical, creating the directory if it
// does not exist. Returns false with `error` filled in on failure.
bool prepare_content_root(ServerConfig& config, std::string& error);

} // namespace litepub
