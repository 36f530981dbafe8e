#ifndef MESSAGE_CHANNEL_HPP
#define MESSAGE_CHANNEL_HPP

#include <string>

// Where a recognition backend lives. Parsed from ws:// or wss:// URLs.
struct Endpoint {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";

    // Throws std::invalid_argument for anything that is not a ws/wss URL.
    static Endpoint parse(const std::string& url);
    std::string url() const;
};

struct ChannelMessage {
    bool binary = false;
    std::string data;
};

// Persistent, full-duplex, message-oriented connection. One thread may write
// while another reads; neither direction supports concurrent callers.
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    // Throws ConnectionError, or AuthError when the upgrade is refused with
    // 401/403.
    virtual void connect(const Endpoint& endpoint) = 0;

    // Blocks until the message is handed to the network. Throws ConnectionError.
    virtual void write(const ChannelMessage& message) = 0;

    // Blocks for the next inbound message. Returns false when the peer closed
    // the connection cleanly or close() was called; throws ConnectionError on
    // an abnormal disconnect.
    virtual bool read(ChannelMessage& message) = 0;

    // Idempotent. Unblocks a pending read().
    virtual void close() = 0;
};

#endif
