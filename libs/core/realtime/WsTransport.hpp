#pragma once
#include <functional>
#include <string>

namespace vantage {

// Pure push-channel transport interface (no protocol logic).
// Callbacks may fire on the implementation's I/O thread.
class WsTransport {
public:
    using MessageCb = std::function<void(std::string)>; // owns the payload
    using StatusCb  = std::function<void(bool)>;
    using ErrorCb   = std::function<void(std::string)>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    WsTransport(const WsTransport&) = delete;
    WsTransport& operator=(const WsTransport&) = delete;

    virtual void connect(std::string host, std::string port, std::string target) = 0;
    virtual void close() = 0;
    virtual void send(std::string msg) = 0; // serialized by implementation

    virtual void onMessage(MessageCb) = 0;
    virtual void onStatus(StatusCb) = 0;
    virtual void onError(ErrorCb) = 0;
};

} // namespace vantage
