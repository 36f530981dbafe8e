#ifndef FAKE_CHANNEL_HPP
#define FAKE_CHANNEL_HPP

#include "core/errors.hpp"
#include "stt/message_channel.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// What the fake backend saw and will say. Shared between the test and the
// channel the transport owns.
struct FakeBackend {
    std::mutex mutex;
    std::condition_variable cv;

    // Scripted behaviour
    bool refuseAuth = false;
    bool refuseConnect = false;
    std::vector<std::string> repliesOnFinish;   // sent when the empty frame arrives
    bool closeOnFinish = true;
    int writeDelayMs = 0;

    // Observed
    bool connected = false;
    Endpoint endpoint;
    std::vector<ChannelMessage> written;
    bool finishSeen = false;
    int closeCalls = 0;

    // Inbound side
    std::deque<ChannelMessage> inbound;
    bool peerClosed = false;
    bool dropped = false;
    bool localClosed = false;

    void say(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        ChannelMessage m;
        m.data = text;
        inbound.push_back(m);
        cv.notify_all();
    }

    void sayBinary(const std::string& bytes) {
        std::lock_guard<std::mutex> lock(mutex);
        ChannelMessage m;
        m.binary = true;
        m.data = bytes;
        inbound.push_back(m);
        cv.notify_all();
    }

    void hangUp() {
        std::lock_guard<std::mutex> lock(mutex);
        peerClosed = true;
        cv.notify_all();
    }

    void drop() {
        std::lock_guard<std::mutex> lock(mutex);
        dropped = true;
        cv.notify_all();
    }

    // Audio frames only, excluding the config message and the end marker
    std::vector<std::string> audioFrames() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::string> frames;
        for (const auto& m : written) {
            if (m.binary && !m.data.empty()) frames.push_back(m.data);
        }
        return frames;
    }

    bool waitFor(std::function<bool()> pred, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, pred);
    }
};

class FakeChannel : public MessageChannel {
public:
    explicit FakeChannel(std::shared_ptr<FakeBackend> backend) : backend_(std::move(backend)) {}

    void connect(const Endpoint& endpoint) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        backend_->endpoint = endpoint;
        if (backend_->refuseAuth) throw AuthError("upgrade refused: 401 Unauthorized");
        if (backend_->refuseConnect) throw ConnectionError("connect: Connection refused");
        backend_->connected = true;
    }

    void write(const ChannelMessage& message) override {
        int delay = 0;
        {
            std::lock_guard<std::mutex> lock(backend_->mutex);
            delay = backend_->writeDelayMs;
        }
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));

        std::lock_guard<std::mutex> lock(backend_->mutex);
        if (backend_->localClosed || backend_->dropped) throw ConnectionError("write on a closed channel");
        backend_->written.push_back(message);

        if (message.binary && message.data.empty()) {
            backend_->finishSeen = true;
            for (const auto& reply : backend_->repliesOnFinish) {
                ChannelMessage m;
                m.data = reply;
                backend_->inbound.push_back(m);
            }
            if (backend_->closeOnFinish) backend_->peerClosed = true;
        }
        backend_->cv.notify_all();
    }

    bool read(ChannelMessage& message) override {
        std::unique_lock<std::mutex> lock(backend_->mutex);
        backend_->cv.wait(lock, [this] {
            return !backend_->inbound.empty() || backend_->peerClosed || backend_->dropped ||
                   backend_->localClosed;
        });
        if (!backend_->inbound.empty()) {
            message = backend_->inbound.front();
            backend_->inbound.pop_front();
            return true;
        }
        if (backend_->dropped && !backend_->localClosed) throw ConnectionError("connection reset by peer");
        return false;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        backend_->closeCalls++;
        backend_->localClosed = true;
        backend_->cv.notify_all();
    }

private:
    std::shared_ptr<FakeBackend> backend_;
};

#endif
