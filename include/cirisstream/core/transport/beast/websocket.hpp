#pragma once

#include <string>
#include <string_view>
#include <thread>
#include <atomic>
#include <mutex>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "cirisstream/core/config/transport.hpp"
#include "cirisstream/core/transport/websocket_concept.hpp"
#include "cirisstream/core/transport/error.hpp"
#include "cirisstream/core/transport/parse_url.hpp"
#include "cirisstream/core/transport/websocket/events.hpp"
#include "cirisstream/core/transport/telemetry/websocket.hpp"
#include "lcr/lockfree/spsc_ring.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast, blocking I/O on a dedicated receive thread)
================================================================================

Single-connection transport primitive. No retries, no reconnection logic:
recovery and subscription replay live above, in Connection and Session.

  • connect() resolves, connects TCP, performs the TLS handshake for wss
    (with SNI) and the WebSocket upgrade with an optional bearer token.
    Each step runs asynchronously on the calling thread under a deadline
  • cancel() may be called from any thread. It stops the io_context so a
    blocked connect() returns Error::Cancelled
  • A receive thread reads complete frames into the message ring
  • Failures are surfaced as an Error event followed by exactly one Close
    event, both via poll_event()
  • close() is idempotent and joins the receive thread

An upgrade rejected with HTTP 401 or 403 is reported as Error::AuthFailed.
================================================================================
*/

namespace cirisstream::core::transport::beast {

class WebSocket {
    using tcp        = boost::asio::ip::tcp;
    using plain_ws_t = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using tls_ws_t   = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

public:
    explicit WebSocket(telemetry::WebSocket& telemetry);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const ParsedUrl& url, const std::string& bearer_token) noexcept;

    // Returns true once the frame was written to the socket.
    // Failures are also reported asynchronously through the receive path.
    [[nodiscard]]
    bool send(std::string_view msg) noexcept;

    void close() noexcept;

    // Any thread
    void cancel() noexcept;

    [[nodiscard]]
    inline bool poll_event(websocket::Event& out) noexcept {
        return events_.pop(out);
    }

    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        return messages_.pop(out);
    }

private:
    void receive_loop_() noexcept;
    void shutdown_socket_() noexcept;
    bool run_step_();
    void signal_error_(Error error) noexcept;
    void signal_close_() noexcept;

    template <class Stream>
    Error connect_tcp_(Stream& ws, const tcp::resolver::results_type& endpoints);

    template <class Stream>
    Error handshake_(Stream& ws, const ParsedUrl& url, const std::string& bearer_token);

private:
    telemetry::WebSocket& telemetry_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::unique_ptr<plain_ws_t> ws_;
    std::unique_ptr<tls_ws_t> wss_;

    std::mutex send_mutex_;

    lcr::lockfree::spsc_ring<std::string, config::WS_MESSAGE_RING_CAPACITY> messages_;
    lcr::lockfree::spsc_ring<websocket::Event, config::WS_EVENT_RING_CAPACITY> events_;

    std::thread recv_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> cancelled_{false};
};

// Check that WebSocket conforms to the WebSocketConcept concept
static_assert(WebSocketConcept<WebSocket>);

} // namespace cirisstream::core::transport::beast
