#include "server/http_server.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <spdlog/spdlog.h>

namespace mirage::server {

namespace beast = boost::beast;

namespace {

/// Limit for reading one request or writing one response
constexpr std::chrono::seconds kIoTimeout{60};

}  // namespace

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(
    std::string host,
    std::uint16_t port,
    std::size_t threads,
    std::uint64_t max_body_bytes,
    RequestHandler handler,
    std::shared_ptr<output::ConsoleLogger> console
)
    : host_(std::move(host))
    , port_(port)
    , thread_count_(threads == 0 ? 1 : threads)
    , max_body_bytes_(max_body_bytes)
    , handler_(std::move(handler))
    , console_(std::move(console))
    , acceptor_(ioc_)
{}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    try {
        tcp::endpoint endpoint(boost::asio::ip::make_address(host_), port_.load());
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);

        // Resolve an ephemeral port request
        port_ = acceptor_.local_endpoint().port();

        spdlog::info("HTTP server listening on {}:{}", host_, port_.load());

        do_accept();

        threads_.reserve(thread_count_);
        for (std::size_t i = 0; i < thread_count_; ++i) {
            threads_.emplace_back([this]() {
                ioc_.run();
            });
        }

    } catch (const std::exception& e) {
        spdlog::error("Failed to start HTTP server: {}", e.what());
        running_ = false;
        boost::system::error_code ec;
        acceptor_.close(ec);
        throw;
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    spdlog::info("HTTP server stopping");

    ioc_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // No worker is left, so the acceptor can be closed from here
    boost::system::error_code ec;
    acceptor_.close(ec);
}

std::uint16_t HttpServer::port() const noexcept {
    return port_.load();
}

void HttpServer::do_accept() {
    // Each connection gets its own strand so its timer and socket never race
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        }
    );
}

void HttpServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            spdlog::warn("Accept error: {}", ec.message());
        }
    } else {
        std::make_shared<HttpSession>(std::move(socket), *this)->start();
    }

    // Continue accepting
    if (running_ && acceptor_.is_open()) {
        do_accept();
    }
}

// ============================================================================
// HttpSession
// ============================================================================

HttpSession::HttpSession(tcp::socket socket, HttpServer& server)
    : stream_(std::move(socket))
    , server_(server)
{
    boost::system::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        remote_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    } else {
        remote_ = "unknown";
    }
}

void HttpSession::start() {
    spdlog::debug("Client connected: {}", remote_);
    do_read();
}

void HttpSession::do_read() {
    // A fresh parser per request; the body limit applies to each one
    parser_.emplace();
    parser_->body_limit(server_.max_body_bytes_);

    stream_.expires_after(kIoTimeout);

    http::async_read(
        stream_,
        buffer_,
        *parser_,
        beast::bind_front_handler(&HttpSession::on_read, shared_from_this())
    );
}

void HttpSession::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }

    if (ec) {
        // Headers arrived but the body did not (too large, truncated or timed out)
        if (parser_->is_header_done()) {
            spdlog::warn("Failed to read request body from {}: {}", remote_, ec.message());
            const auto& partial = parser_->get();
            auto response = make_error_response(
                http::status::bad_request, "Failed to read request body", partial.version()
            );
            response.keep_alive(false);
            if (server_.console_) {
                server_.console_->log_request(
                    remote_, to_std(partial.method_string()), to_std(partial.target()),
                    response.result_int(), std::chrono::milliseconds{0}
                );
            }
            send(std::move(response));
            return;
        }
        if (ec != beast::error::timeout) {
            spdlog::debug("HTTP read error from {}: {}", remote_, ec.message());
        }
        do_close();
        return;
    }

    HttpRequest request = parser_->release();

    auto started = std::chrono::steady_clock::now();
    HttpResponse response = dispatch(request);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    if (server_.console_) {
        server_.console_->log_request(
            remote_, to_std(request.method_string()), to_std(request.target()),
            response.result_int(), elapsed
        );
    }

    send(std::move(response));
}

HttpResponse HttpSession::dispatch(const HttpRequest& request) {
    try {
        HttpResponse response = server_.handler_(request);
        response.version(request.version());
        response.keep_alive(request.keep_alive());
        // A HEAD reply may carry the length of the body it omits
        if (request.method() != http::verb::head || response.count(http::field::content_length) == 0) {
            response.prepare_payload();
        }
        return response;
    } catch (const std::exception& e) {
        spdlog::error("Handler failed for {} {}: {}",
                      to_std(request.method_string()), to_std(request.target()), e.what());
    }

    auto response = make_error_response(
        http::status::internal_server_error, "Internal server error", request.version()
    );
    response.keep_alive(request.keep_alive());
    return response;
}

void HttpSession::send(HttpResponse response) {
    bool close = response.need_eof();
    response_ = std::make_shared<HttpResponse>(std::move(response));

    stream_.expires_after(kIoTimeout);

    http::async_write(
        stream_,
        *response_,
        beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), close)
    );
}

void HttpSession::on_write(bool close, boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        spdlog::debug("HTTP write error to {}: {}", remote_, ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    response_.reset();
    do_read();
}

void HttpSession::do_close() {
    boost::system::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    spdlog::debug("Client disconnected: {}", remote_);
}

}  // namespace mirage::server
