#pragma once

#include "output/console_logger.hpp"
#include "server/http_message.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mirage::server {

class HttpSession;

/// HTTP/1.1 server
/// Accepts on its own io_context, run by a pool of worker threads.
/// Each request is handled synchronously on the thread that read it.
class HttpServer {
public:
    using tcp = boost::asio::ip::tcp;

    /// Create an HTTP server
    /// @param host Address to bind
    /// @param port Port to listen on (0 picks an ephemeral port)
    /// @param threads Worker threads running the io_context
    /// @param max_body_bytes Largest request body accepted
    /// @param handler Produces the response for every request
    /// @param console Access log; nullptr disables it
    HttpServer(
        std::string host,
        std::uint16_t port,
        std::size_t threads,
        std::uint64_t max_body_bytes,
        RequestHandler handler,
        std::shared_ptr<output::ConsoleLogger> console = nullptr
    );

    ~HttpServer();

    // Non-copyable, non-movable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and launch the worker threads
    /// @throws boost::system::system_error when the address cannot be bound
    void start();

    /// Stop accepting, abandon open connections and join the workers
    void stop();

    /// Bound port, valid after start()
    [[nodiscard]] std::uint16_t port() const noexcept;

private:
    friend class HttpSession;

    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);

    std::string host_;
    std::atomic<std::uint16_t> port_;
    std::size_t thread_count_;
    std::uint64_t max_body_bytes_;
    RequestHandler handler_;
    std::shared_ptr<output::ConsoleLogger> console_;

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
};

/// One client connection, reading requests until the client closes
/// or asks not to keep the connection alive
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using tcp = boost::asio::ip::tcp;

    HttpSession(tcp::socket socket, HttpServer& server);

    /// Start reading the first request
    void start();

private:
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void send(HttpResponse response);
    void on_write(bool close, boost::system::error_code ec, std::size_t bytes_transferred);
    void do_close();

    /// Run the handler, converting exceptions into a 500
    [[nodiscard]] HttpResponse dispatch(const HttpRequest& request);

    boost::beast::tcp_stream stream_;
    HttpServer& server_;
    boost::beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<HttpResponse> response_;
    std::string remote_;
};

}  // namespace mirage::server
