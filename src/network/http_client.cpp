#include "network/http_client.hpp"
#include "network/url.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>
#include <functional>
#include <optional>
#include <type_traits>

// Helper to set SNI hostname without old-style cast warning
namespace {
inline bool set_sni_hostname(SSL* ssl, const char* hostname) {
    // SSL_set_tlsext_host_name is a macro with old-style cast
    // Use SSL_ctrl directly to avoid warning
    return SSL_ctrl(ssl, SSL_CTRL_SET_TLSEXT_HOSTNAME,
                    TLSEXT_NAMETYPE_host_name,
                    const_cast<char*>(hostname)) != 0;
}
}  // namespace

namespace mirage::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr std::uint32_t kHeaderLimit = 64 * 1024;
constexpr std::chrono::seconds kShutdownTimeout{1};

using ResponseHandler = std::function<void(Result<model::RecordedResponse, Error>)>;

std::string_view to_std(beast::string_view sv) noexcept {
    return {sv.data(), sv.size()};
}

/// One request/response exchange over a fresh connection
/// Secure selects TLS over TCP, otherwise plain TCP
template <bool Secure>
class HttpExchange : public std::enable_shared_from_this<HttpExchange<Secure>> {
public:
    using stream_type = std::conditional_t<
        Secure,
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    >;

    HttpExchange(
        asio::io_context& ioc,
        asio::ssl::context* ssl_ctx,
        std::chrono::milliseconds timeout,
        std::uint64_t max_body_bytes
    )
        : resolver_(ioc)
        , stream_(make_stream(ioc, ssl_ctx))
        , timeout_(timeout)
    {
        parser_.body_limit(max_body_bytes);
        parser_.header_limit(kHeaderLimit);
    }

    void start(Url url, http::request<http::string_body> req, ResponseHandler handler) {
        url_ = std::move(url);
        req_ = std::move(req);
        handler_ = std::move(handler);

        // Responses to HEAD carry Content-Length but no body
        if (req_.method() == http::verb::head) {
            parser_.skip(true);
        }

        spdlog::debug("Upstream {} {}://{}:{}{}", to_std(req_.method_string()),
                      url_.scheme, url_.host, url_.port, to_std(req_.target()));

        do_resolve();
    }

private:
    static stream_type make_stream(asio::io_context& ioc, asio::ssl::context* ssl_ctx) {
        if constexpr (Secure) {
            return stream_type(ioc, *ssl_ctx);
        } else {
            (void)ssl_ctx;
            return stream_type(ioc);
        }
    }

    void do_resolve() {
        resolver_.async_resolve(
            url_.host,
            url_.port,
            [self = this->shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, std::move(results));
            }
        );
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail("resolve", ec);
        }

        if constexpr (Secure) {
            if (!set_sni_hostname(stream_.native_handle(), url_.host.c_str())) {
                beast::error_code ssl_ec{
                    static_cast<int>(::ERR_get_error()),
                    asio::error::get_ssl_category()
                };
                return fail("ssl_sni", ssl_ec);
            }
            // Only consulted when the context verifies peers
            stream_.set_verify_callback(asio::ssl::host_name_verification(url_.host));
        }

        beast::get_lowest_layer(stream_).expires_after(timeout_);
        beast::get_lowest_layer(stream_).async_connect(
            results,
            [self = this->shared_from_this()](beast::error_code connect_ec, const tcp::endpoint&) {
                self->on_connect(connect_ec);
            }
        );
    }

    void on_connect(beast::error_code ec) {
        if (ec) {
            return fail("connect", ec);
        }

        if constexpr (Secure) {
            do_ssl_handshake();
        } else {
            do_write();
        }
    }

    void do_ssl_handshake() {
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        stream_.async_handshake(
            asio::ssl::stream_base::client,
            [self = this->shared_from_this()](beast::error_code ec) {
                self->on_ssl_handshake(ec);
            }
        );
    }

    void on_ssl_handshake(beast::error_code ec) {
        if (ec) {
            return fail("ssl_handshake", ec);
        }

        do_write();
    }

    void do_write() {
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        http::async_write(
            stream_,
            req_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t bytes) {
                self->on_write(ec, bytes);
            }
        );
    }

    void on_write(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
            return fail("write", ec);
        }

        do_read();
    }

    void do_read() {
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        http::async_read(
            stream_,
            buffer_,
            parser_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            }
        );
    }

    void on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
            return fail("read", ec);
        }

        auto& res = parser_.get();

        model::RecordedResponse recorded;
        recorded.status_code = static_cast<int>(res.result_int());
        for (const auto& field : res) {
            auto name = canonical_header_key(to_std(field.name_string()));
            // Body is fully buffered, the original framing no longer applies
            if (name == "Transfer-Encoding") {
                continue;
            }
            recorded.headers[name].emplace_back(to_std(field.value()));
        }
        recorded.body = std::move(res.body());

        spdlog::debug("Upstream response: {} ({} bytes)", recorded.status_code, recorded.body.size());
        complete(Result<model::RecordedResponse, Error>::Ok(std::move(recorded)));

        do_shutdown();
    }

    void do_shutdown() {
        if constexpr (Secure) {
            beast::get_lowest_layer(stream_).expires_after(kShutdownTimeout);
            stream_.async_shutdown(
                [self = this->shared_from_this()](beast::error_code ec) {
                    self->on_shutdown(ec);
                }
            );
        } else {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
            on_shutdown(ec);
        }
    }

    void on_shutdown(beast::error_code ec) {
        // Peers commonly close without a clean shutdown
        if (ec && ec != asio::error::eof && ec != asio::error::not_connected &&
            ec != asio::ssl::error::stream_truncated) {
            spdlog::debug("Upstream shutdown: {}", ec.message());
        }
    }

    void fail(const std::string& what, beast::error_code ec) {
        spdlog::warn("Upstream {} error for {}:{}: {}", what, url_.host, url_.port, ec.message());
        complete(Result<model::RecordedResponse, Error>::Err(
            Error::upstream(what + ": " + ec.message())
        ));
    }

    void complete(Result<model::RecordedResponse, Error> result) {
        if (handler_) {
            auto handler = std::move(handler_);
            handler_ = nullptr;
            handler(std::move(result));
        }
    }

    tcp::resolver resolver_;
    stream_type stream_;
    std::chrono::milliseconds timeout_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response_parser<http::string_body> parser_;

    Url url_;
    ResponseHandler handler_;
};

}  // namespace

bool is_hop_by_hop_header(std::string_view name) noexcept {
    static constexpr std::string_view kHopByHop[] = {
        "Host", "Connection", "Content-Length", "Transfer-Encoding", "Keep-Alive",
        "Proxy-Connection", "Upgrade", "Te", "Trailer"
    };
    for (auto h : kHopByHop) {
        if (iequals(name, h)) {
            return true;
        }
    }
    return false;
}

HttpClient::HttpClient(
    std::shared_ptr<asio::ssl::context> ssl_ctx,
    std::chrono::milliseconds timeout,
    std::uint64_t max_body_bytes
)
    : ssl_ctx_(std::move(ssl_ctx))
    , timeout_(timeout)
    , max_body_bytes_(max_body_bytes)
{}

Result<model::RecordedResponse, Error> HttpClient::send(const model::RecordedRequest& request) {
    using R = Result<model::RecordedResponse, Error>;

    auto url = parse_url(request.url);
    if (url.is_err()) {
        return R::Err(Error::upstream("failed to parse target URL: " + url.error()));
    }
    auto target = normalize_target(url.value().target);
    if (target.is_err()) {
        return R::Err(Error::upstream(target.error()));
    }

    http::request<http::string_body> req;
    req.method_string(request.method);
    req.target(target.value());
    req.version(11);
    for (const auto& [name, values] : request.headers) {
        if (is_hop_by_hop_header(name)) {
            continue;
        }
        for (const auto& value : values) {
            req.insert(name, value);
        }
    }
    req.set(http::field::host, url.value().host_header());
    req.body() = request.body;
    req.prepare_payload();

    asio::io_context ioc;
    std::optional<R> outcome;
    auto on_done = [&outcome](R result) {
        outcome.emplace(std::move(result));
    };

    if (url.value().is_secure()) {
        if (!ssl_ctx_) {
            return R::Err(Error::upstream("https target but no TLS context configured"));
        }
        std::make_shared<HttpExchange<true>>(ioc, ssl_ctx_.get(), timeout_, max_body_bytes_)
            ->start(url.value(), std::move(req), on_done);
    } else {
        std::make_shared<HttpExchange<false>>(ioc, nullptr, timeout_, max_body_bytes_)
            ->start(url.value(), std::move(req), on_done);
    }

    ioc.run();

    if (!outcome) {
        return R::Err(Error::upstream("exchange with " + request.url + " ended without a response"));
    }
    return std::move(*outcome);
}

}  // namespace mirage::network
