#include "utils/http_client.hpp"

#include <algorithm>
#include <cctype>

#include "httplib.h"
#include "utils/common.hpp"

namespace shellpilot::utils {
namespace {

bool ParsePort(const std::string& text, int& port) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        port = std::stoi(text);
    } catch (const std::exception&) {
        return false;
    }
    return port > 0 && port < 65536;
}

// "scheme://host:port/..." -> host, port. False when the value carries no port.
bool ProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    auto rest = proxy;
    if (const auto scheme = rest.find("://"); scheme != std::string::npos) {
        rest.erase(0, scheme + 3);
    }
    rest = rest.substr(0, rest.find('/'));
    const auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        return false;
    }
    host = rest.substr(0, colon);
    return !host.empty() && ParsePort(rest.substr(colon + 1), port);
}

}  // namespace

std::string Endpoint::Origin() const {
    return std::string(https ? "https://" : "http://") + host + ":" + std::to_string(port);
}

std::string Endpoint::Target() const {
    return path.empty() ? "/" : path;
}

std::string Endpoint::Resolve(const std::string& suffix) const {
    auto prefix = path;
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return prefix + suffix;
}

Endpoint ParseEndpoint(const std::string& url) {
    Endpoint endpoint{};
    auto rest = Trim(url);
    if (rest.rfind("https://", 0) == 0) {
        endpoint.https = true;
        endpoint.port = 443;
        rest.erase(0, 8);
    } else if (rest.rfind("http://", 0) == 0) {
        rest.erase(0, 7);
    }

    const auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.path = rest.substr(slash);
    }

    const auto colon = authority.find(':');
    endpoint.host = authority.substr(0, colon);
    if (colon != std::string::npos && !ParsePort(authority.substr(colon + 1), endpoint.port)) {
        endpoint.host.clear();
    }
    return endpoint;
}

std::unique_ptr<httplib::Client> MakeHttpClient(const Endpoint& endpoint, const HttpClientOptions& options) {
    auto client = std::make_unique<httplib::Client>(endpoint.Origin());
    client->set_connection_timeout(std::min(options.connect_timeout_s, options.timeout_s));
    client->set_read_timeout(options.timeout_s);
    client->set_write_timeout(options.timeout_s);
    client->set_follow_location(options.follow_redirects);
    if (options.use_env_proxy) {
        std::string host;
        int port = 0;
        for (const char* name : {"HTTPS_PROXY", "https_proxy", "HTTP_PROXY", "http_proxy"}) {
            if (ProxyHostPort(GetEnv(name), host, port)) {
                client->set_proxy(host, port);
                break;
            }
        }
    }
    return client;
}

}  // namespace shellpilot::utils
