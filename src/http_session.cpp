#include "http_session.hpp"
#include "security_logger.hpp"

#include <chrono>

namespace auvctl {

// HTTPS session (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    ControlApi& api,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , api_(api)
    , conn_guard_(std::move(conn_guard))
{
    resolve_remote_addr();
}

// Plaintext HTTP session (behind a local proxy or for development)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    ControlApi& api,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , api_(api)
    , conn_guard_(std::move(conn_guard))
{
    resolve_remote_addr();
}

beast::tcp_stream& HttpSession::lowest_layer() {
    if (is_tls_) {
        return beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_));
    }
    return std::get<beast::tcp_stream>(stream_);
}

void HttpSession::resolve_remote_addr() {
    beast::error_code ec;
    auto ep = lowest_layer().socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

void HttpSession::run() {
    if (is_tls_) {
        lowest_layer().expires_after(std::chrono::seconds(config_.request_timeout_sec));
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Scanners and plaintext clients: drop silently.
        return;
    }
    do_read();
}

void HttpSession::do_read() {
    // Bounded read time stops slow-loris style clients holding a slot.
    lowest_layer().expires_after(std::chrono::seconds(config_.request_timeout_sec));

    parser_.emplace();
    parser_->body_limit(config_.max_request_bytes);
    parser_->header_limit(static_cast<std::uint32_t>(config_.max_header_bytes));

    auto self = shared_from_this();
    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec == http::error::body_limit || ec == http::error::header_limit) {
        send_response(api_.handle_oversize(parser_->get().version(), remote_addr_,
                                           "read aborted after " + std::to_string(bytes_transferred) +
                                           " bytes: " + ec.message()));
        return;
    }

    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec) {
        // Timeouts and resets abandon the session; nothing was applied.
        return;
    }

    http::request<http::string_body> req = parser_->release();
    send_response(api_.handle(req, remote_addr_));
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    lowest_layer().expires_after(std::chrono::seconds(config_.request_timeout_sec));

    auto self = shared_from_this();
    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    lowest_layer().socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
