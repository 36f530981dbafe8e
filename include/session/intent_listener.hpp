#ifndef INTENT_LISTENER_HPP
#define INTENT_LISTENER_HPP

#include <functional>
#include <string>
#include <thread>
#include <atomic>
#include <cstdint>
#include <mutex>

#ifdef _WIN32
  #include <winsock2.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
#endif

// UDP endpoint through which a presentation layer drives the session. Every
// datagram is handed to the handler; a non-empty return value is sent back to
// the sender as the reply.
class IntentListener {
public:
    using Handler = std::function<std::string(const std::string& msg,
                                              const std::string& senderIp,
                                              uint16_t senderPort)>;

    IntentListener(std::string bind_ip, int port, Handler handler);
    ~IntentListener();

    // Binds the socket and starts the listening thread. Throws
    // std::runtime_error when the socket cannot be created or bound.
    void start();
    void stop();

    bool sendTo(const std::string& ip, uint16_t port, const std::string& payload);
    bool sendToActive(const std::string& payload);

    // Tells the last client that the session ended and how.
    bool sendSessionEnded(const std::string& state);

    // Port actually bound; differs from the requested one when it was 0.
    uint16_t boundPort() const { return bound_port_.load(); }

private:
    void run();

    void setActiveClient(const std::string& ip, uint16_t port);

    std::string bind_ip_;
    int port_;
    Handler handler_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex sock_mutex_;             // guards sock_ against sendTo() racing stop()
    socket_t sock_{kInvalidSocket};
    std::atomic<uint16_t> bound_port_{0};

    std::mutex client_mutex_;
    std::string active_ip_{"127.0.0.1"};
    uint16_t active_port_{0};
    bool has_active_client_{false};
};

#endif
