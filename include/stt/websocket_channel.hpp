#ifndef WEBSOCKET_CHANNEL_HPP
#define WEBSOCKET_CHANNEL_HPP

#include "stt/message_channel.hpp"

#include <memory>

// MessageChannel over a Boost.Beast WebSocket, plain or TLS. A private I/O
// thread owns the socket; write() and read() hand work to it.
class WebSocketChannel : public MessageChannel {
public:
    struct Options {
        int closeTimeoutMs = 2000;
        bool verifyPeer = true;
        std::string userAgent = "streamscribe";
    };

    WebSocketChannel();
    explicit WebSocketChannel(Options options);
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    void connect(const Endpoint& endpoint) override;
    void write(const ChannelMessage& message) override;
    bool read(ChannelMessage& message) override;
    void close() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

#endif
