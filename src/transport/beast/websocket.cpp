#include "cirisstream/core/transport/beast/websocket.hpp"

#include <chrono>
#include <utility>
#include <exception>

#include <openssl/ssl.h>

#include "cirisstream/core/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace cirisstream::core::transport::beast {

namespace net       = boost::asio;
namespace ssl       = boost::asio::ssl;
namespace bb        = boost::beast;
namespace bws       = boost::beast::websocket;
namespace http      = boost::beast::http;

namespace {

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(30);
constexpr const char* USER_AGENT = "cirisstream/1.0";

// Maps a failed read to the transport classification
Error classify_receive_error(const bb::error_code& ec) noexcept {
    if (ec == bws::error::closed) {
        CS_INFO("[WS] Received WebSocket close frame.");
        return Error::RemoteClosed;
    }
    if (ec == net::error::operation_aborted) {
        CS_TRACE("[WS] Receive cancelled (local shutdown)");
        return Error::LocalShutdown;
    }
    if (ec == net::error::eof || ec == net::error::connection_reset ||
        ec == net::error::connection_aborted || ec == ssl::error::stream_truncated) {
        CS_INFO("[WS] Connection closed by peer");
        return Error::RemoteClosed;
    }
    if (ec == bb::error::timeout || ec == net::error::timed_out) {
        CS_WARN("[WS] Receive timeout");
        return Error::Timeout;
    }
    CS_ERROR("[WS] Receive failed: " << ec.message());
    return Error::TransportFailure;
}

} // namespace


WebSocket::WebSocket(telemetry::WebSocket& telemetry)
    : telemetry_(telemetry)
{
}

WebSocket::~WebSocket() {
    close();
}

template <class Stream>
Error WebSocket::handshake_(Stream& ws, const ParsedUrl& url, const std::string& bearer_token) {
    // The tcp_stream deadline only guards connect/TLS; the websocket stream
    // manages its own timeouts from here on
    bb::get_lowest_layer(ws).expires_never();
    ws.set_option(bws::stream_base::timeout::suggested(bb::role_type::client));
    ws.set_option(bws::stream_base::decorator([token = bearer_token](bws::request_type& req) {
        req.set(http::field::user_agent, USER_AGENT);
        if (!token.empty()) {
            req.set(http::field::authorization, "Bearer " + token);
        }
    }));

    const bool default_port = (url.secure && url.port == "443") || (!url.secure && url.port == "80");
    const std::string host = default_port ? url.host : url.host + ":" + url.port;

    bb::error_code ec;
    bws::response_type res;
    ws.async_handshake(res, host, url.path, [&ec](const bb::error_code& e) { ec = e; });
    if (!run_step_()) {
        return Error::Cancelled;
    }
    if (ec) {
        if (ec == bws::error::upgrade_declined &&
            (res.result() == http::status::unauthorized || res.result() == http::status::forbidden)) {
            CS_ERROR("[WS] Upgrade rejected by server (HTTP " << res.result_int() << ")");
            return Error::AuthFailed;
        }
        CS_ERROR("[WS] WebSocket handshake failed: " << ec.message());
        return Error::HandshakeFailed;
    }
    ws.text(true);
    return Error::None;
}

template <class Stream>
Error WebSocket::connect_tcp_(Stream& ws, const tcp::resolver::results_type& endpoints) {
    bb::error_code ec;
    auto& stream = bb::get_lowest_layer(ws);
    stream.expires_after(CONNECT_TIMEOUT);
    stream.async_connect(endpoints, [&ec](const bb::error_code& e, const tcp::endpoint&) { ec = e; });
    if (!run_step_()) {
        return Error::Cancelled;
    }
    if (ec) {
        CS_ERROR("[WS] TCP connect failed: " << ec.message());
        return (ec == bb::error::timeout) ? Error::Timeout : Error::ConnectionFailed;
    }
    stream.socket().set_option(net::socket_base::keep_alive(true), ec);
    stream.socket().set_option(tcp::no_delay(true), ec);
    return Error::None;
}

// Runs the pending asynchronous step on the calling thread until it
// completes. Returns false when cancel() stopped the io_context.
bool WebSocket::run_step_() {
    ioc_.restart();
    if (cancelled_.load(std::memory_order_acquire)) {
        return false;
    }
    ioc_.run();
    return !cancelled_.load(std::memory_order_acquire);
}

Error WebSocket::connect(const ParsedUrl& url, const std::string& bearer_token) noexcept {
    if (running_.load(std::memory_order_acquire) || ws_ || wss_) {
        CS_ERROR("[WS] connect() called on an active WebSocket");
        return Error::InvalidState;
    }
    Error err = Error::None;
    try {
        bb::error_code ec;
        tcp::resolver::results_type endpoints;
        tcp::resolver resolver(ioc_);
        CS_TRACE("[WS] Resolving " << url.host << ":" << url.port << " ...");
        resolver.async_resolve(url.host, url.port,
            [&ec, &endpoints](const bb::error_code& e, tcp::resolver::results_type results) {
                ec = e;
                endpoints = std::move(results);
            });
        if (!run_step_()) {
            err = Error::Cancelled;
        }
        else if (ec) {
            CS_ERROR("[WS] Resolve failed for " << url.host << ": " << ec.message());
            err = Error::ConnectionFailed;
        }
        else if (url.secure) {
            ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
            ssl_ctx_->set_default_verify_paths();
            ssl_ctx_->set_verify_mode(ssl::verify_peer);
            wss_ = std::make_unique<tls_ws_t>(ioc_, *ssl_ctx_);

            err = connect_tcp_(*wss_, endpoints);
            if (err == Error::None) {
                // SNI is required by most TLS-terminating proxies
                if (!::SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), url.host.c_str())) {
                    CS_ERROR("[WS] Failed to set SNI host name");
                    err = Error::HandshakeFailed;
                }
            }
            if (err == Error::None) {
                wss_->next_layer().set_verify_callback(ssl::host_name_verification(url.host));
                bb::get_lowest_layer(*wss_).expires_after(CONNECT_TIMEOUT);
                wss_->next_layer().async_handshake(ssl::stream_base::client,
                    [&ec](const bb::error_code& e) { ec = e; });
                if (!run_step_()) {
                    err = Error::Cancelled;
                }
                else if (ec) {
                    CS_ERROR("[WS] TLS handshake failed: " << ec.message());
                    err = Error::HandshakeFailed;
                }
            }
            if (err == Error::None) {
                err = handshake_(*wss_, url, bearer_token);
            }
        }
        else {
            ws_ = std::make_unique<plain_ws_t>(ioc_);
            err = connect_tcp_(*ws_, endpoints);
            if (err == Error::None) {
                err = handshake_(*ws_, url, bearer_token);
            }
        }
    }
    catch (const std::exception& e) {
        CS_ERROR("[WS] connect() failed: " << e.what());
        err = Error::TransportFailure;
    }

    if (err != Error::None) {
        if (err == Error::Cancelled) {
            CS_DEBUG("[WS] Connection attempt cancelled");
        }
        shutdown_socket_();
        return err;
    }

    CS_DEBUG("[WS] Connected to " << (url.secure ? "wss://" : "ws://") << url.host << ":" << url.port << url.path);
    closed_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    recv_thread_ = std::thread(&WebSocket::receive_loop_, this);
    return Error::None;
}

void WebSocket::cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
    ioc_.stop();
}

bool WebSocket::send(std::string_view msg) noexcept {
    if (!running_.load(std::memory_order_acquire)) {
        CS_ERROR("[WS] send() called on unconnected WebSocket");
        return false;
    }
    CS_TRACE("[WS] Sending message ... (size " << msg.size() << ")");
    bb::error_code ec;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (wss_) {
            wss_->write(net::buffer(msg.data(), msg.size()), ec);
        }
        else if (ws_) {
            ws_->write(net::buffer(msg.data(), msg.size()), ec);
        }
        else {
            return false;
        }
    }
    if (ec) [[unlikely]] {
        CS_ERROR("[WS] write failed: " << ec.message());
        CS_TL1( telemetry_.send_errors_total.inc() );
        return false;
    }
    CS_TL1( telemetry_.bytes_tx_total.inc(msg.size()) );
    CS_TL1( telemetry_.messages_tx_total.inc() );
    return true;
}

void WebSocket::close() noexcept {
    // Stop the receive loop (idempotent)
    const bool was_running = running_.exchange(false, std::memory_order_acq_rel);
    if (was_running) {
        CS_TRACE("[WS] Closing WebSocket ...");
    }
    // Unblocks a pending read
    shutdown_socket_();
    if (recv_thread_.joinable()) {
        recv_thread_.join();
    }
    // Only this thread touches the event ring from here on
    signal_close_();
    messages_.clear();
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        wss_.reset();
        ws_.reset();
    }
    ssl_ctx_.reset();
}

void WebSocket::receive_loop_() noexcept {
    bb::flat_buffer buffer;
    buffer.reserve(config::RX_BUFFER_SIZE);
    while (running_.load(std::memory_order_acquire)) {
        bb::error_code ec;
        std::size_t bytes = 0;
        if (wss_) {
            bytes = wss_->read(buffer, ec);
        } else {
            bytes = ws_->read(buffer, ec);
        }
        if (ec) [[unlikely]] {
            if (running_.load(std::memory_order_acquire)) { // abnormal termination
                CS_TL1( telemetry_.receive_errors_total.inc() );
                signal_error_(classify_receive_error(ec));
            }
            running_.store(false, std::memory_order_release);
            break;
        }
        CS_TL1( telemetry_.bytes_rx_total.inc(bytes) );
        CS_TL1( telemetry_.messages_rx_total.inc() );

        std::string frame = bb::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());

        // The pump never blocks, so waiting here is bounded
        if (!messages_.push(std::move(frame))) {
            CS_TL1( telemetry_.rx_ring_full_total.inc() );
            CS_DEBUG("[WS] Receive ring full, waiting for consumer");
            while (!messages_.push(std::move(frame))) {
                if (!running_.load(std::memory_order_acquire)) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::microseconds(50));
            }
        }
    }
    signal_close_();
}

void WebSocket::shutdown_socket_() noexcept {
    bb::error_code ec;
    if (wss_) {
        auto& sock = bb::get_lowest_layer(*wss_).socket();
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }
    if (ws_) {
        auto& sock = bb::get_lowest_layer(*ws_).socket();
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }
}

void WebSocket::signal_error_(Error error) noexcept {
    if (!events_.push(websocket::Event::make_error(error))) {
        CS_WARN("[WS] Event ring full, dropping error " << to_string(error));
    }
}

void WebSocket::signal_close_() noexcept {
    // Close is always signaled exactly once
    if (closed_.exchange(true)) {
        return;
    }
    CS_TL1( telemetry_.close_events_total.inc() );
    if (!events_.push(websocket::Event::make_close())) {
        CS_WARN("[WS] Event ring full, dropping close event");
    }
}

} // namespace cirisstream::core::transport::beast
