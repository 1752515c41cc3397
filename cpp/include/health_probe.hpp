#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <chrono>
#include <string>

namespace asio = boost::asio;
namespace ssl = asio::ssl;

namespace rollout {

struct HealthProbeResult {
    bool healthy = false;
    unsigned status = 0;               // 0 when no HTTP response arrived
    std::string detail;
    std::chrono::milliseconds elapsed{0};
};

// A single bounded liveness check. Refused connections, timeouts and
// non-2xx answers are all reported as unhealthy.
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    virtual HealthProbeResult probe() = 0;
    virtual std::string target() const = 0;
};

struct HealthEndpoint {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool tls() const { return scheme == "https"; }
    std::string url() const;

    // Accepts http(s)://host[:port][/path]; throws std::invalid_argument
    static HealthEndpoint parse(const std::string& url);
};

class HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe(HealthEndpoint endpoint, std::chrono::milliseconds timeout, bool verify_tls);

    HealthProbeResult probe() override;
    std::string target() const override { return endpoint_.url(); }

private:
    HealthEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
    bool verify_tls_;
    ssl::context ssl_ctx_;
};

} // namespace rollout
