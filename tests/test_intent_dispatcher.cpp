#include <cassert>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "fake_channel.hpp"
#include "audio/synthetic_backend.hpp"
#include "session/intent_dispatcher.hpp"
#include "session/intent_listener.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using json = nlohmann::json;

static SessionController::Config controllerConfig() {
    SessionController::Config c;
    c.endpoint = "ws://127.0.0.1:9002/";
    c.drainGraceMs = 1000;
    return c;
}

static void testDispatch() {
    SyntheticBackend audio;
    auto backend = std::make_shared<FakeBackend>();
    SessionController controller(audio, [&] { return std::make_unique<FakeChannel>(backend); },
                                 controllerConfig());

    json reply = json::parse(intent::handle(controller, R"({"type":"snapshot"})"));
    assert(reply["type"] == "snapshot");
    assert(reply["state"] == "idle");
    assert(reply["device_index"].is_null());
    assert(reply["word_count"] == 0);

    reply = json::parse(intent::handle(controller, R"({"type":"select_device","index":0})"));
    assert(reply["type"] == "snapshot");

    reply = json::parse(intent::handle(controller, R"({"type":"start"})"));
    assert(reply["state"] == "streaming");
    assert(reply["device_index"] == 0);

    reply = json::parse(intent::handle(controller, R"({"type":"start"})"));
    assert(reply["type"] == "error");
    assert(reply["message"].get<std::string>().find("already active") != std::string::npos);

    backend->say(R"({"tokens":[{"text":"ok","is_final":true}]})");
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (controller.snapshot().finalText.empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    reply = json::parse(intent::handle(controller, R"({"type":"stop"})"));
    assert(reply["state"] == "stopped");
    assert(reply["final_text"] == "ok ");
    assert(reply["transcript"] == "ok ");
    assert(reply["word_count"] == 1);
    assert(reply["bytes_sent"].get<uint64_t>() > 0);

    // Selecting a device that is not there makes the next start fail
    reply = json::parse(intent::handle(controller, R"({"type":"select_device","index":42})"));
    reply = json::parse(intent::handle(controller, R"({"type":"start"})"));
    assert(reply["type"] == "error");
    assert(controller.state() == SessionState::Failed);

    // Back to the host default
    reply = json::parse(intent::handle(controller, R"({"type":"select_device","index":null})"));
    assert(reply["type"] == "snapshot");

    for (const char* bad : {"nonsense", "[]", R"({"kind":"start"})", R"({"type":"pause"})",
                            R"({"type":"select_device","index":"two"})"}) {
        reply = json::parse(intent::handle(controller, bad));
        assert(reply["type"] == "error");
    }
}

// One datagram in, one reply back to the sender
static void testListenerRoundTrip() {
    std::string seen;
    IntentListener listener("127.0.0.1", 0, [&](const std::string& msg, const std::string& ip, uint16_t) {
        seen = msg;
        assert(ip == "127.0.0.1");
        return std::string(R"({"type":"ack"})");
    });
    listener.start();
    assert(listener.boundPort() != 0);

    const int client = ::socket(AF_INET, SOCK_DGRAM, 0);
    assert(client >= 0);
    timeval timeout{};
    timeout.tv_sec = 3;
    ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_port = htons(listener.boundPort());
    ::inet_pton(AF_INET, "127.0.0.1", &to.sin_addr);

    const std::string request = R"({"type":"snapshot"})";
    const ssize_t sent = ::sendto(client, request.data(), request.size(), 0,
                                  reinterpret_cast<sockaddr*>(&to), sizeof(to));
    assert(sent == (ssize_t)request.size());

    char buff[512];
    const ssize_t n = ::recvfrom(client, buff, sizeof(buff), 0, nullptr, nullptr);
    assert(n > 0);
    assert(std::string(buff, (size_t)n) == R"({"type":"ack"})");
    assert(seen == request);

    // The sender is now the active client
    assert(listener.sendSessionEnded("stopped"));
    const ssize_t m = ::recvfrom(client, buff, sizeof(buff), 0, nullptr, nullptr);
    assert(m > 0);
    const json ended = json::parse(std::string(buff, (size_t)m));
    assert(ended["type"] == "session_ended");
    assert(ended["state"] == "stopped");

    ::close(client);
    listener.stop();
    listener.stop();

    IntentListener bad("not-an-ip", 0, nullptr);
    bool threw = false;
    try {
        bad.start();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

// Notifications racing stop() either go out or report failure, never touch a closed socket
static void testSendWhileStopping() {
    for (int round = 0; round < 20; ++round) {
        IntentListener listener("127.0.0.1", 0, nullptr);
        listener.start();
        const uint16_t port = listener.boundPort();

        std::atomic<bool> done{false};
        std::thread notifier([&] {
            while (!done.load()) listener.sendTo("127.0.0.1", port, R"({"type":"session_ended"})");
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        listener.stop();
        done.store(true);
        notifier.join();

        assert(!listener.sendTo("127.0.0.1", port, "late"));
        assert(!listener.sendSessionEnded("stopped"));
    }
}

int main() {
    testDispatch();
    testListenerRoundTrip();
    testSendWhileStopping();
    return 0;
}
