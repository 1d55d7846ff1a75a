#include "Log.h"
#include "RequestDispatcher.h"
#include "ServerConfig.h"

#include <httplib.h>

#include <clocale>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace litepub;

namespace {

//Logo
std::string make_startup_logo() {
    std::string ver = VERSION;
    if (!ver.empty() && (ver[0] == 'v' || ver[0] == 'V')) {
        ver.erase(0, 1);
    }

    std::ostringstream s;
    s << R"(
 _    _ _                   _
| |  (_) |_ ___ _ __  _  _| |__
| |__| |  _/ -_) '_ \| || | '_ \
|____|_|\__\___| .__/ \_,_|_.__/
               |_|
)" << "Litepub ver " << ver << "\n\n";
    return s.str();
}

void print_logo() {
    std::string logo = make_startup_logo();
    if (supports_color()) {
        logo = colorize_green(logo);
    }
    std::cout << logo;
}

// Check if a port is free by attempting to bind
bool is_port_free(const std::string& host, int port) {
    int sockfd = socket(AF_INET, SOCK_STREAM, 0);
    if (sockfd < 0) {
        return false;
    }
    int opt = 1;
    setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        // Not an IPv4 literal (hostname or IPv6); let listen() decide
        close(sockfd);
        return true;
    }
    int result = bind(sockfd, (struct sockaddr*)&addr, sizeof(addr));
    close(sockfd);
    return (result == 0);
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // namespace

int main(int argc, char* argv[]) {
    std::setlocale(LC_ALL, "");

    CommandLine cl = parse_command_line(argc, argv);
    if (cl.show_help) { print_usage(argv[0]); return 0; }
    if (!cl.error.empty()) {
        std::cerr << "Error: " << cl.error << "\n";
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig config = cl.config;
    set_verbose(config.verbose);

    print_logo();

    std::string error;
    if (!prepare_content_root(config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    if (config.use_tls) {
        if (!file_exists(config.cert_path)) {
            std::cerr << "Error: Certificate file not found: " << config.cert_path << std::endl;
            return 1;
        }
        if (!file_exists(config.key_path)) {
            std::cerr << "Error: Key file not found: " << config.key_path << std::endl;
            return 1;
        }
    }

    if (!is_port_free(config.host, config.port)) {
        std::cerr << "Error: Port " << config.port << " is already in use." << std::endl;
        return 1;
    }

    std::unique_ptr<httplib::Server> svr;
    if (config.use_tls) {
        auto ssl = std::make_unique<httplib::SSLServer>(config.cert_path.c_str(), config.key_path.c_str());
        if (!ssl->is_valid()) {
            std::cerr << "Error: Could not load certificate " << config.cert_path
                << " with key " << config.key_path << std::endl;
            return 1;
        }
        svr = std::move(ssl);
    }
    else {
        svr = std::make_unique<httplib::Server>();
    }

    const RequestDispatcher dispatcher(config);

    svr->Get(R"(/(.*))", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        dispatcher.handle(req, res);
    });
    svr->Post(R"(/(.*))", RequestDispatcher::reject_method);
    svr->Put(R"(/(.*))", RequestDispatcher::reject_method);
    svr->Delete(R"(/(.*))", RequestDispatcher::reject_method);
    svr->Patch(R"(/(.*))", RequestDispatcher::reject_method);

    svr->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::ostringstream line;
        line << req.remote_addr << " - - " << access_log_time() << " \""
            << req.method << " " << req.path << " HTTP/1.1\" "
            << res.status << " " << res.body.size();
        log_info(line.str());
    });

    log_info(std::string("Starting ") + (config.use_tls ? "HTTPS" : "HTTP")
        + " server on " + config.host + ":" + std::to_string(config.port));
    log_info("Serving documents from " + config.content_root.string());

    if (!svr->listen(config.host, config.port)) {
        std::cerr << "Error: Failed to start " << (config.use_tls ? "HTTPS" : "HTTP")
            << " server on port " << config.port << ". It might be busy." << std::endl;
        return 1;
    }

    return 0;
}
