#include "ServerConfig.h"

#include <iostream>
#include <system_error>

namespace litepub {

const char VERSION[] = "v1.0";

namespace {

bool parse_port(const std::string& s, uint16_t& port) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 5) {
        return false;
    }
    unsigned long value = std::stoul(s);
    if (value == 0 || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

} // namespace

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine cl;
    ServerConfig& cfg = cl.config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        bool takes_value =
            arg == "-H" || arg == "--host" || arg == "-p" || arg == "--port" ||
            arg == "-r" || arg == "--root" || arg == "-c" || arg == "--cert" ||
            arg == "-k" || arg == "--key";
        if (takes_value && !has_value) {
            cl.error = "Missing value for " + arg;
            return cl;
        }

        if (arg == "-h" || arg == "--help") { cl.show_help = true; }
        else if (arg == "-H" || arg == "--host") { cfg.host = argv[++i]; }
        else if (arg == "-p" || arg == "--port") {
            if (!parse_port(argv[++i], cfg.port)) {
                cl.error = "Invalid port value: " + std::string(argv[i]);
                return cl;
            }
        }
        else if (arg == "-r" || arg == "--root") { cfg.content_root = fs::u8path(argv[++i]); }
        else if (arg == "-c" || arg == "--cert") { cfg.cert_path = argv[++i]; }
        else if (arg == "-k" || arg == "--key") { cfg.key_path = argv[++i]; }
        else if (arg == "--http") { cfg.use_tls = false; }
        else if (arg == "--no-listing") { cfg.directory_listing = false; }
        else if (arg == "-v" || arg == "--verbose") { cfg.verbose = true; }
        else {
            cl.error = "Unknown option: " + arg;
            return cl;
        }
    }
    return cl;
}

// Help/usage
void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n"
        << "Options:\n"
        << "  -h, --help               Print this help message\n"
        << "  -H, --host HOST          Address to bind (default: 127.0.0.1)\n"
        << "  -p, --port PORT          Set the port (default: 8181)\n"
        << "  -r, --root DIR           Content root (default: tests/example-content)\n"
        << "  -c, --cert CERT_PATH     TLS certificate (default: tests/example-keys/server.crt)\n"
        << "  -k, --key KEY_PATH       TLS private key (default: tests/example-keys/server.key)\n"
        << "      --http               Serve plain HTTP instead of HTTPS\n"
        << "      --no-listing         Answer 404 for directories without an index page\n"
        << "  -v, --verbose            Also log debug lines\n";
}

bool prepare_content_root(ServerConfig& config, std::string& error) {
    std::error_code ec;
    fs::path root = fs::absolute(config.content_root, ec);
    if (ec) {
        error = "Cannot resolve content root " + config.content_root.string() + ": " + ec.message();
        return false;
    }
    if (!fs::exists(root, ec)) {
        fs::create_directories(root, ec);
        if (ec) {
            error = "Cannot create content root " + root.string() + ": " + ec.message();
            return false;
        }
    }
    if (!fs::is_directory(root, ec)) {
        error = "Content root is not a directory: " + root.string();
        return false;
    }
    root = fs::canonical(root, ec);
    if (ec) {
        error = "Cannot resolve content root " + config.content_root.string() + ": " + ec.message();
        return false;
    }
    config.content_root = root;
    return true;
}

} // namespace litepub
