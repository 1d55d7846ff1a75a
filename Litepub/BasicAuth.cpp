#include "BasicAuth.h"
#include "ConversionError.h"
#include "FileUtil.h"
#include "Log.h"

#include <system_error>

#include <openssl/crypto.h>

namespace litepub {

namespace {

const char AUTH_FILE_NAME[] = ".auth";
const char REALM_HEADER[] = "Basic realm=\"Litepub\"";

const std::string base64_chars =
"ABCDEFGHIJKLMNOPQRSTUVWXYZ"
"abcdefghijklmnopqrstuvwxyz"
"0123456789+/";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

void deny(httplib::Response& res) {
    res.status = 401;
    res.set_header("WWW-Authenticate", REALM_HEADER);
    res.set_content("Unauthorized", "text/plain");
}

} // namespace

std::string base64_encode(const std::string& in) {
    std::string out;
    int val = 0, valb = -6;
    for (unsigned char c : in) {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0) {
            out.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) out.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (out.size() % 4) out.push_back('=');
    return out;
}

fs::path auth_file_in(const fs::path& directory) {
    return directory / AUTH_FILE_NAME;
}

bool credentials_match(const std::string& auth_file_contents, const std::string& authorization) {
    std::string line = auth_file_contents.substr(0, auth_file_contents.find('\n'));
    line = trim(line);
    if (line.find(':') == std::string::npos) {
        return false;
    }
    const std::string expected = "Basic " + base64_encode(line);
    if (authorization.size() != expected.size()) {
        return false;
    }
    return CRYPTO_memcmp(authorization.data(), expected.data(), expected.size()) == 0;
}

bool authenticate(const fs::path& directory, const httplib::Request& req, httplib::Response& res) {
    const fs::path auth_file = auth_file_in(directory);
    std::error_code ec;
    if (!fs::exists(auth_file, ec) && !ec) {
        return true;
    }

    std::string stored;
    try {
        stored = read_file(auth_file);
    } catch (const ConversionError& e) {
        log_warn(std::string("Denying access, credentials unreadable: ") + e.what());
        deny(res);
        return false;
    }
    if (stored.find(':') == std::string::npos) {
        log_warn("Denying access, malformed " + auth_file.string());
    }

    if (!credentials_match(stored, req.get_header_value("Authorization"))) {
        deny(res);
        return false;
    }
    return true;
}

} // namespace litepub
