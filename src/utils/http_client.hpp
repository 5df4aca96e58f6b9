#pragma once

#include <memory>
#include <string>

namespace httplib {
class Client;
}

namespace shellpilot::utils {

// Pieces of an http(s) URL that httplib needs to open a connection.
struct Endpoint {
    bool https = false;
    std::string host;
    int port = 80;
    std::string path;

    bool Valid() const { return !host.empty() && port > 0; }
    // "scheme://host:port"
    std::string Origin() const;
    // Request target for the URL itself; "/" when the URL had no path.
    std::string Target() const;
    // Path prefix of the URL with `suffix` appended, without a doubled slash.
    std::string Resolve(const std::string& suffix) const;
};

// Accepts "http://", "https://" or no scheme (treated as http). The host is
// cleared when the port is not a number.
Endpoint ParseEndpoint(const std::string& url);

struct HttpClientOptions {
    int timeout_s = 30;
    int connect_timeout_s = 10;
    bool follow_redirects = false;
    // Honour HTTPS_PROXY / HTTP_PROXY from the environment.
    bool use_env_proxy = false;
};

std::unique_ptr<httplib::Client> MakeHttpClient(const Endpoint& endpoint, const HttpClientOptions& options);

}  // namespace shellpilot::utils
