/*
Vantage — BeastWsTransport
Role: Plain (ws://) WebSocket client for the indicator push channel.
Inputs/Outputs: connect(host, port, target) / send(text); delivers frames, status and errors
  through the WsTransport callbacks.
Threading: Owns its io_context and a dedicated I/O thread; all stream access runs on one strand.
  Callbacks fire on the I/O thread. The destructor blocks until frames queued before it have been
  written and the close handshake has completed (at most kShutdownTimeout), then stops the context
  and joins the thread, so no handler runs after destruction.
Performance: Asynchronous reads with a single reusable buffer; queued writes.
Integration: Created per connection by the RealtimeUpdateRouter transport factory.
Observability: vLog_Channel lines tagged "ws#<n>" in the vantage.data category.
Related: BeastWsTransport.cpp, WsTransport.hpp.
Assumptions: Callbacks are installed before connect().
*/
#pragma once
#include "WsTransport.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vantage {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class BeastWsTransport : public WsTransport {
public:
    static constexpr std::chrono::milliseconds kShutdownTimeout{2000};

    BeastWsTransport();
    ~BeastWsTransport() override;

    void connect(std::string host, std::string port, std::string target) override;
    void close() override;
    void send(std::string msg) override;

    void onMessage(MessageCb cb) override;
    void onStatus(StatusCb cb) override;
    void onError(ErrorCb cb) override;

private:
    // Callbacks (guarded: installed on the caller thread, fired on the I/O thread)
    std::mutex m_cbMutex;
    MessageCb m_onMessage;
    StatusCb  m_onStatus;
    ErrorCb   m_onError;

    // Beast state
    net::io_context m_ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> m_workGuard;
    std::thread m_ioThread;
    net::strand<net::io_context::executor_type> m_strand;
    tcp::resolver m_resolver;
    websocket::stream<beast::tcp_stream> m_ws;
    beast::flat_buffer m_buffer;
    net::steady_timer m_pingTimer;
    std::deque<std::string> m_writeQueue;
    bool m_open = false;
    bool m_closing = false;       // close requested; no new connection steps start
    bool m_closeStarted = false;  // async_close issued
    bool m_closed = false;        // handshake finished or nothing to close
    std::vector<std::function<void()>> m_closeWaiters;
    std::size_t m_framesWritten = 0;

    std::string m_tag;

    std::string m_host;
    std::string m_port;
    std::string m_target;

    // Handlers
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep);
    void onWsHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void schedulePing();
    void requestClose();
    void startClose();
    void finishClose();
    void fail(const char* stage, beast::error_code ec);

    void emitStatus(bool connected);
    void emitError(std::string message);
    void emitMessage(std::string payload);
};

} // namespace vantage
