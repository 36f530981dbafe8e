#include "session/intent_listener.hpp"

#include <cstring>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <cerrno>
  #include <arpa/inet.h>
  #include <sys/socket.h>
  #include <sys/time.h>
  #include <netinet/in.h>
  #include <unistd.h>
#endif

#ifdef _WIN32
static void closesock(socket_t s) { ::closesocket(s); }
static std::string lastSocketError() { return std::to_string(WSAGetLastError()); }
#else
static void closesock(socket_t s) { ::close(s); }
static std::string lastSocketError() { return std::strerror(errno); }
#endif

// How often the listening thread checks whether it should exit
static constexpr int kPollMs = 200;

// Constructor
IntentListener::IntentListener(std::string bind_ip, int port, Handler handler)
    : bind_ip_(std::move(bind_ip)), port_(port), handler_(std::move(handler)) {}

// Destructor
IntentListener::~IntentListener() { stop(); }

// Binds the socket and starts the listening thread
void IntentListener::start() {
    if (running_.load()) return;
    std::lock_guard<std::mutex> lock(sock_mutex_);

#ifdef _WIN32
    WSADATA wsa{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0) {
        throw std::runtime_error("WSAStartup failed");
    }
#endif

    sock_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ == kInvalidSocket) {
        const std::string error = lastSocketError();
#ifdef _WIN32
        WSACleanup();
#endif
        throw std::runtime_error("socket() failed: " + error);
    }

    int reuse = 1;
#ifdef _WIN32
    ::setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, (const char*)&reuse, sizeof(reuse));
    DWORD timeout = kPollMs;
    ::setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    ::setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    timeval timeout{};
    timeout.tv_sec = 0;
    timeout.tv_usec = kPollMs * 1000;
    ::setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    std::string error;
    if (::inet_pton(AF_INET, bind_ip_.c_str(), &addr.sin_addr) != 1) {
        error = "invalid bind ip: " + bind_ip_;
    } else if (::bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind() failed: " + lastSocketError();
    }
    if (!error.empty()) {
        closesock(sock_);
        sock_ = kInvalidSocket;
#ifdef _WIN32
        WSACleanup();
#endif
        throw std::runtime_error(error);
    }

    sockaddr_in bound{};
#ifdef _WIN32
    int blen = sizeof(bound);
#else
    socklen_t blen = sizeof(bound);
#endif
    if (::getsockname(sock_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_.store(ntohs(bound.sin_port));
    } else {
        bound_port_.store(static_cast<uint16_t>(port_));
    }

    std::cout << "[Intent] [INFO] listening on " << bind_ip_ << ":" << bound_port_.load() << "\n";
    running_.store(true);
    thread_ = std::thread(&IntentListener::run, this);
}

// Stops the listening thread and releases the socket
void IntentListener::stop() {
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) thread_.join();

    std::lock_guard<std::mutex> lock(sock_mutex_);
    if (sock_ != kInvalidSocket) {
        closesock(sock_);
        sock_ = kInvalidSocket;
    }
#ifdef _WIN32
    WSACleanup();
#endif
}

// Sets current active client the listener is communicating with
void IntentListener::setActiveClient(const std::string& ip, uint16_t port) {
    std::lock_guard<std::mutex> lock(client_mutex_);
    active_ip_ = ip;
    active_port_ = port;
    has_active_client_ = true;
}

// Sends a payload to an ip and port
bool IntentListener::sendTo(const std::string& ip, uint16_t port, const std::string& payload) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

    // Held across sendto() so stop() cannot close the socket underneath
    std::lock_guard<std::mutex> lock(sock_mutex_);
    if (sock_ == kInvalidSocket) return false;

#ifdef _WIN32
    int n = ::sendto(sock_, payload.data(), (int)payload.size(), 0,
                     reinterpret_cast<sockaddr*>(&addr), (int)sizeof(addr));
    return n == (int)payload.size();
#else
    ssize_t n = ::sendto(sock_, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return n == (ssize_t)payload.size();
#endif
}

// Sends a payload to the active client
bool IntentListener::sendToActive(const std::string& payload) {
    std::string ip;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (!has_active_client_) return false;
        ip = active_ip_;
        port = active_port_;
    }
    return sendTo(ip, port, payload);
}

// Lets the current client know the live session is over
bool IntentListener::sendSessionEnded(const std::string& state) {
    const auto ts = (double)std::time(nullptr);
    std::string msg = std::string("{\"type\":\"session_ended\",\"state\":\"") + state +
                      "\",\"ts\":" + std::to_string(ts) + "}";
    return sendToActive(msg);
}

// Thread function that waits for intents from the presentation layer
void IntentListener::run() {
    while (running_.load()) {
        char buff[2048];
        sockaddr_in src{};
#ifdef _WIN32
        int slen = sizeof(src);
        const int n = ::recvfrom(sock_, buff, (int)sizeof(buff) - 1, 0,
                                reinterpret_cast<sockaddr*>(&src), &slen);
        if (n < 0 && WSAGetLastError() == WSAETIMEDOUT) continue;
#else
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(sock_, buff, sizeof(buff) - 1, 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
#endif

        if (n < 0) {
            std::cerr << "[Intent] [ERROR] recvfrom() failed: " << lastSocketError() << "\n";
            break;
        }
        if (n == 0) continue;
        buff[n] = '\0';

        char ipstr[INET_ADDRSTRLEN]{};
        const char* ok = ::inet_ntop(AF_INET, &src.sin_addr, ipstr, sizeof(ipstr));
        std::string senderIp = ok ? std::string(ipstr) : std::string("127.0.0.1");
        uint16_t senderPort = ntohs(src.sin_port);

        setActiveClient(senderIp, senderPort);

        std::string reply;
        try {
            if (handler_) reply = handler_(std::string(buff, (size_t)n), senderIp, senderPort);
        } catch (const std::exception& e) {
            std::cerr << "[Intent] [ERROR] handler threw: " << e.what() << "\n";
            continue;
        }

        if (!reply.empty() && !sendTo(senderIp, senderPort, reply)) {
            std::cerr << "[Intent] [WARN] could not reply to " << senderIp << ":" << senderPort << "\n";
        }
    }
}
