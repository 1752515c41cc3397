#include "health_probe.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace rollout {

namespace {

bool all_digits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

std::string default_port(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

// One GET request/response exchange. Every stage arms the stream's expiry,
// so a silent peer ends the chain with beast::error::timeout.
class ProbeSession : public std::enable_shared_from_this<ProbeSession> {
public:
    ProbeSession(
        asio::io_context& ioc,
        ssl::context& ssl_ctx,
        const HealthEndpoint& endpoint,
        std::chrono::milliseconds timeout,
        bool verify_tls
    )
        : resolver_(ioc)
        , endpoint_(endpoint)
        , timeout_(timeout)
        , verify_tls_(verify_tls)
    {
        if (endpoint_.tls()) {
            tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc, ssl_ctx);
        } else {
            plain_ = std::make_unique<beast::tcp_stream>(ioc);
        }
    }

    void start() {
        request_.method(http::verb::get);
        request_.target(endpoint_.target);
        request_.version(11);
        request_.set(http::field::host, endpoint_.host);
        request_.set(http::field::user_agent, "rollout-health/1.0");
        request_.set(http::field::connection, "close");
        resolve();
    }

    void cancel() {
        resolver_.cancel();
        beast::error_code ec;
        lowest().socket().close(ec);
    }

    bool finished() const { return finished_; }
    const HealthProbeResult& result() const { return result_; }

private:
    beast::tcp_stream& lowest() {
        return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
    }

    void resolve() {
        resolver_.async_resolve(
            endpoint_.host,
            endpoint_.port,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    self->fail("resolve", ec);
                    return;
                }
                self->connect(results);
            }
        );
    }

    void connect(const tcp::resolver::results_type& results) {
        lowest().expires_after(timeout_);
        lowest().async_connect(
            results,
            [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
                if (ec) {
                    self->fail("connect", ec);
                    return;
                }
                if (self->tls_) {
                    self->tls_handshake();
                } else {
                    self->write();
                }
            }
        );
    }

    void tls_handshake() {
        // Set SNI hostname
        if (!SSL_set_tlsext_host_name(tls_->native_handle(), endpoint_.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
            fail("SNI", ec);
            return;
        }
        if (verify_tls_) {
            tls_->set_verify_callback(ssl::host_name_verification(endpoint_.host));
        }

        lowest().expires_after(timeout_);
        tls_->async_handshake(
            ssl::stream_base::client,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    self->fail("TLS handshake", ec);
                    return;
                }
                self->write();
            }
        );
    }

    void write() {
        lowest().expires_after(timeout_);
        auto on_write = [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                self->fail("write", ec);
                return;
            }
            self->read();
        };
        if (tls_) {
            http::async_write(*tls_, request_, std::move(on_write));
        } else {
            http::async_write(*plain_, request_, std::move(on_write));
        }
    }

    void read() {
        lowest().expires_after(timeout_);
        auto on_read = [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                self->fail("read", ec);
                return;
            }
            self->complete();
        };
        if (tls_) {
            http::async_read(*tls_, buffer_, response_, std::move(on_read));
        } else {
            http::async_read(*plain_, buffer_, response_, std::move(on_read));
        }
    }

    void complete() {
        const auto reason = response_.reason();
        result_.status = response_.result_int();
        result_.healthy = result_.status >= 200 && result_.status < 300;
        result_.detail = "HTTP " + std::to_string(result_.status) + " "
                       + std::string(reason.data(), reason.size());
        finished_ = true;

        beast::error_code ec;
        lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    void fail(const char* what, beast::error_code ec) {
        if (finished_) {
            return;
        }
        result_.healthy = false;
        if (ec == beast::error::timeout) {
            result_.detail = std::string(what) + ": timed out after "
                           + std::to_string(timeout_.count()) + " ms";
        } else {
            result_.detail = std::string(what) + ": " + ec.message();
        }
        finished_ = true;
    }

    tcp::resolver resolver_;
    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
    http::request<http::empty_body> request_;
    http::response<http::string_body> response_;
    beast::flat_buffer buffer_;

    HealthEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
    bool verify_tls_;
    bool finished_ = false;
    HealthProbeResult result_;
};

}

std::string HealthEndpoint::url() const {
    std::string url = scheme + "://";
    url += host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != default_port(scheme)) {
        url += ":" + port;
    }
    return url + target;
}

HealthEndpoint HealthEndpoint::parse(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("missing scheme in '" + url + "'");
    }

    HealthEndpoint endpoint;
    endpoint.scheme = url.substr(0, scheme_end);
    std::transform(endpoint.scheme.begin(), endpoint.scheme.end(), endpoint.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (endpoint.scheme != "http" && endpoint.scheme != "https") {
        throw std::invalid_argument("unsupported scheme '" + endpoint.scheme + "'");
    }

    std::string rest = url.substr(scheme_end + 3);
    const auto fragment = rest.find('#');
    if (fragment != std::string::npos) {
        rest.erase(fragment);
    }

    const auto path_pos = rest.find_first_of("/?");
    const std::string authority = rest.substr(0, path_pos);
    endpoint.target = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
    if (endpoint.target.front() == '?') {
        endpoint.target.insert(0, "/");
    }

    if (authority.find('@') != std::string::npos) {
        throw std::invalid_argument("credentials in health URL are not supported");
    }

    std::string port;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("unterminated IPv6 literal in '" + url + "'");
        }
        endpoint.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument("malformed authority in '" + url + "'");
            }
            port = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            endpoint.host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        } else {
            endpoint.host = authority;
        }
    }

    if (endpoint.host.empty()) {
        throw std::invalid_argument("missing host in '" + url + "'");
    }
    if (port.empty()) {
        port = default_port(endpoint.scheme);
    }
    if (!all_digits(port) || port.size() > 5 || std::stoi(port) == 0 || std::stoi(port) > 65535) {
        throw std::invalid_argument("invalid port '" + port + "'");
    }
    endpoint.port = port;
    return endpoint;
}

HttpHealthProbe::HttpHealthProbe(HealthEndpoint endpoint, std::chrono::milliseconds timeout, bool verify_tls)
    : endpoint_(std::move(endpoint))
    , timeout_(timeout)
    , verify_tls_(verify_tls)
    , ssl_ctx_(ssl::context::tls_client)
{
    if (verify_tls_) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    } else {
        // Local endpoints usually sit behind a self-signed certificate
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
}

HealthProbeResult HttpHealthProbe::probe() {
    const auto started = std::chrono::steady_clock::now();

    asio::io_context ioc;
    auto session = std::make_shared<ProbeSession>(ioc, ssl_ctx_, endpoint_, timeout_, verify_tls_);
    session->start();
    ioc.run_for(timeout_);

    // The resolver has no expiry of its own; the overall deadline covers it
    const bool timed_out = !session->finished();
    if (timed_out) {
        session->cancel();
        ioc.restart();
        ioc.run();
    }

    HealthProbeResult result = session->result();
    if (timed_out) {
        result.healthy = false;
        result.status = 0;
        result.detail = "timed out after " + std::to_string(timeout_.count()) + " ms";
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );
    return result;
}

} // namespace rollout
