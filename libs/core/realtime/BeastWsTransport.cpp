#include "BeastWsTransport.hpp"
#include "../ChannelLog.hpp"

#include <future>

namespace vantage {

BeastWsTransport::BeastWsTransport()
    : m_strand(m_ioc.get_executor())
    , m_resolver(m_strand)
    , m_ws(m_strand)
    , m_pingTimer(m_strand)
    , m_tag(channel_log::nextTag())
{}

BeastWsTransport::~BeastWsTransport() {
    {
        std::lock_guard<std::mutex> lock(m_cbMutex);
        m_onMessage = nullptr;
        m_onStatus = nullptr;
        m_onError = nullptr;
    }
    if (!m_ioThread.joinable()) return;

    // Frames posted before this point (an unsubscribe) go out, then the close handshake runs
    std::promise<void> drained;
    std::future<void> done = drained.get_future();
    net::post(m_strand, [this, &drained]() {
        m_closeWaiters.push_back([&drained]() { drained.set_value(); });
        requestClose();
    });
    if (done.wait_for(kShutdownTimeout) != std::future_status::ready) {
        vLog_Channel(Warning, m_tag, "Close did not finish within {} ms, dropping the connection",
                     kShutdownTimeout.count());
    }

    m_workGuard.reset();
    m_ioc.stop();
    m_ioThread.join();
}

void BeastWsTransport::onMessage(MessageCb cb) {
    std::lock_guard<std::mutex> lock(m_cbMutex);
    m_onMessage = std::move(cb);
}

void BeastWsTransport::onStatus(StatusCb cb) {
    std::lock_guard<std::mutex> lock(m_cbMutex);
    m_onStatus = std::move(cb);
}

void BeastWsTransport::onError(ErrorCb cb) {
    std::lock_guard<std::mutex> lock(m_cbMutex);
    m_onError = std::move(cb);
}

void BeastWsTransport::emitStatus(bool connected) {
    std::lock_guard<std::mutex> lock(m_cbMutex);
    if (m_onStatus) m_onStatus(connected);
}

void BeastWsTransport::emitError(std::string message) {
    std::lock_guard<std::mutex> lock(m_cbMutex);
    if (m_onError) m_onError(std::move(message));
}

void BeastWsTransport::emitMessage(std::string payload) {
    std::lock_guard<std::mutex> lock(m_cbMutex);
    if (m_onMessage) m_onMessage(std::move(payload));
}

void BeastWsTransport::connect(std::string host, std::string port, std::string target) {
    m_host = std::move(host);
    m_port = std::move(port);
    m_target = std::move(target);

    vLog_Channel(Info, m_tag, "Connecting to ws://{}:{}{}", m_host, m_port, m_target);

    net::post(m_strand, [this]() {
        m_resolver.async_resolve(m_host, m_port,
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                onResolve(ec, results);
            });
    });

    if (!m_ioThread.joinable()) {
        m_workGuard.emplace(m_ioc.get_executor());
        m_ioThread = std::thread([this]() {
            try {
                m_ioc.run();
            } catch (const std::exception& e) {
                vLog_Channel(Critical, m_tag, "I/O thread terminated: {}", e.what());
                emitError(e.what());
                emitStatus(false);
            }
        });
    }
}

void BeastWsTransport::close() {
    net::post(m_strand, [this]() { requestClose(); });
}

void BeastWsTransport::requestClose() {
    if (m_closed) { finishClose(); return; }
    if (m_closing && m_closeStarted) return;

    m_closing = true;
    m_pingTimer.cancel();
    if (!m_open) {
        // Still resolving or connecting: abandon the attempt
        m_resolver.cancel();
        beast::get_lowest_layer(m_ws).cancel();
        emitStatus(false);
        finishClose();
        return;
    }
    // Queued frames drain first; doWrite() starts the handshake once the queue is empty
    if (m_writeQueue.empty()) startClose();
}

void BeastWsTransport::startClose() {
    if (m_closeStarted) return;
    m_closeStarted = true;
    vLog_Channel(Debug, m_tag, "Closing ({} frames flushed)", m_framesWritten);
    m_ws.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
        m_open = false;
        if (ec && ec != net::error::operation_aborted) {
            vLog_Channel(Warning, m_tag, "Close failed: {}", ec.message());
            emitError(ec.message());
        }
        emitStatus(false);
        finishClose();
    });
}

void BeastWsTransport::finishClose() {
    m_closed = true;
    auto waiters = std::move(m_closeWaiters);
    m_closeWaiters.clear();
    for (auto& waiter : waiters) waiter();
}

void BeastWsTransport::send(std::string msg) {
    net::post(m_strand, [this, m = std::move(msg)]() mutable {
        m_writeQueue.emplace_back(std::move(m));
        if (m_open && m_writeQueue.size() == 1) {
            doWrite();
        }
    });
}

void BeastWsTransport::fail(const char* stage, beast::error_code ec) {
    if (m_closing && (ec == net::error::operation_aborted || ec == websocket::error::closed)) {
        // A started handshake reports through its own handler
        if (!m_closeStarted) finishClose();
        return;
    }
    vLog_Channel(Warning, m_tag, "{} failed: {}", stage, ec.message());
    m_open = false;
    m_writeQueue.clear();
    emitError(ec.message());
    emitStatus(false);
    // Nothing left to hand shake with
    if (m_closing) finishClose();
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (m_closing) return;
    if (ec) { fail("resolve", ec); return; }
    beast::get_lowest_layer(m_ws).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(m_ws).async_connect(results,
        [this](beast::error_code ec2, tcp::resolver::results_type::endpoint_type ep) {
            onConnect(ec2, ep);
        });
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
    if (m_closing) return;
    if (ec) { fail("connect", ec); return; }
    // Host header carries the port, as browsers send it
    const std::string hostHeader = m_host + ":" + std::to_string(ep.port());
    beast::get_lowest_layer(m_ws).expires_never();
    m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    m_ws.async_handshake(hostHeader, m_target,
        [this](beast::error_code ec2) { onWsHandshake(ec2); });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (m_closing) return;
    if (ec) { fail("handshake", ec); return; }
    m_open = true;
    vLog_Channel(Info, m_tag, "Connected to ws://{}:{}{}", m_host, m_port, m_target);
    emitStatus(true);
    doRead();
    schedulePing();
    if (!m_writeQueue.empty()) doWrite();
}

void BeastWsTransport::doRead() {
    m_ws.async_read(m_buffer, [this](beast::error_code ec, std::size_t bytes) { onRead(ec, bytes); });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (ec) { fail("read", ec); return; }

    std::string payload = beast::buffers_to_string(m_buffer.data());
    m_buffer.consume(m_buffer.size());
    emitMessage(std::move(payload));

    doRead();
}

void BeastWsTransport::doWrite() {
    if (m_writeQueue.empty()) return;
    m_ws.text(true);
    m_ws.async_write(net::buffer(m_writeQueue.front()), [this](beast::error_code ec, std::size_t) {
        if (ec) { fail("write", ec); return; }
        m_writeQueue.pop_front();
        ++m_framesWritten;
        if (!m_writeQueue.empty()) {
            doWrite();
        } else if (m_closing) {
            startClose();
        }
    });
}

void BeastWsTransport::schedulePing() {
    m_pingTimer.expires_after(std::chrono::seconds(25));
    m_pingTimer.async_wait([this](beast::error_code ec) {
        if (ec || !m_open) return;
        m_ws.async_ping({}, [this](beast::error_code ec2) {
            if (ec2) { fail("ping", ec2); return; }
            schedulePing();
        });
    });
}

} // namespace vantage
