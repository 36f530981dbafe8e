#include "stt/transport_session.hpp"
#include "core/errors.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

const char* toString(TransportState state) {
    switch (state) {
        case TransportState::Idle: return "idle";
        case TransportState::Connecting: return "connecting";
        case TransportState::Streaming: return "streaming";
        case TransportState::Finishing: return "finishing";
        case TransportState::Closed: return "closed";
        case TransportState::Failed: return "failed";
    }
    return "unknown";
}

// How often a send() blocked on a full queue checks for finish()
static constexpr int kSendPollMs = 50;

// PCM16 little-endian regardless of host byte order
static std::string toLittleEndian(const std::vector<int16_t>& samples) {
    std::string bytes(samples.size() * 2, '\0');
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto v = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<char>(v & 0xFF);
        bytes[2 * i + 1] = static_cast<char>(v >> 8);
    }
    return bytes;
}

// Constructor
TransportSession::TransportSession(const TransportConfig& config, std::unique_ptr<MessageChannel> channel)
    : config_(config), channel_(std::move(channel)),
      outbound_(config.sendQueueCapacity, OverflowPolicy::Block) {}

// Destructor
TransportSession::~TransportSession() {
    close();
    if (send_thread_.joinable()) send_thread_.join();
}

std::unique_ptr<TransportSession> TransportSession::connect(const std::string& endpoint,
                                                            const TransportConfig& config,
                                                            std::unique_ptr<MessageChannel> channel) {
    if (!channel) throw std::invalid_argument("TransportSession::connect needs a channel");

    Endpoint target;
    try {
        target = Endpoint::parse(endpoint);
    } catch (const std::invalid_argument& e) {
        throw ConnectionError(e.what());
    }

    std::unique_ptr<TransportSession> session(new TransportSession(config, std::move(channel)));
    session->transition(TransportState::Connecting);

    try {
        session->channel_->connect(target);

        ChannelMessage configMessage;
        configMessage.binary = false;
        configMessage.data = message_codec::encodeConfig(config.recognition);
        session->channel_->write(configMessage);
    } catch (const StreamError& e) {
        std::cerr << "[Transport] [ERROR] " << e.what() << "\n";
        session->fail(e.what());
        throw;
    }

    session->transition(TransportState::Streaming);
    session->send_thread_ = std::thread(&TransportSession::sendLoop, session.get());

    std::cout << "[Transport] [INFO] streaming " << config.recognition.sampleRate << " Hz / "
              << config.recognition.numChannels << " ch to model " << config.recognition.model << "\n";
    return session;
}

TransportState TransportSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string TransportSession::lastError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

bool TransportSession::transition(TransportState to) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const TransportState from = state_;

    bool allowed = false;
    switch (to) {
        case TransportState::Connecting: allowed = from == TransportState::Idle; break;
        case TransportState::Streaming: allowed = from == TransportState::Connecting; break;
        case TransportState::Finishing: allowed = from == TransportState::Streaming; break;
        case TransportState::Closed:
            allowed = from != TransportState::Closed && from != TransportState::Failed;
            break;
        default: break;
    }
    if (allowed) state_ = to;
    return allowed;
}

void TransportSession::fail(const std::string& message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == TransportState::Closed || state_ == TransportState::Failed) return;
    state_ = TransportState::Failed;
    last_error_ = message;
}

bool TransportSession::send(AudioChunk&& chunk) {
    if (chunk.samples.empty()) {
        throw std::invalid_argument("empty audio chunk; end of audio is signalled with finish()");
    }

    std::lock_guard<std::mutex> lock(send_mutex_);
    if (finish_requested_.load() || state() != TransportState::Streaming) return false;

    if (have_sequence_ && chunk.sequence > last_sequence_ + 1) {
        sequence_gaps_.fetch_add(chunk.sequence - last_sequence_ - 1);
    }
    have_sequence_ = true;
    last_sequence_ = chunk.sequence;

    OutboundFrame frame;
    frame.chunk = std::move(chunk);

    // Wait for room, but give up once end of audio has been requested
    while (true) {
        switch (outbound_.pushFor(frame, std::chrono::milliseconds(kSendPollMs))) {
            case PushStatus::Pushed: return true;
            case PushStatus::Closed: return false;
            case PushStatus::Timeout: break;
        }
        if (finish_requested_.load() || closing_.load()) {
            std::cout << "[Transport] [WARN] chunk " << frame.chunk.sequence
                      << " not sent, end of audio requested while the send queue was full\n";
            return false;
        }
    }
}

void TransportSession::finish() {
    if (finish_requested_.exchange(true)) return;

    // A send() waiting for room sees finish_requested_ and releases the lock
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!transition(TransportState::Finishing)) return;

    OutboundFrame frame;
    frame.endOfAudio = true;
    outbound_.pushUnbounded(std::move(frame));
    outbound_.close();
}

// Send thread: one binary frame per chunk, in submission order
void TransportSession::sendLoop() {
    OutboundFrame frame;
    while (outbound_.pop(frame)) {
        ChannelMessage message;
        message.binary = true;
        if (!frame.endOfAudio) message.data = toLittleEndian(frame.chunk.samples);

        try {
            channel_->write(message);
        } catch (const ConnectionError& e) {
            if (!closing_.load()) {
                std::cerr << "[Transport] [ERROR] send failed: " << e.what() << "\n";
                fail(e.what());
            }
            outbound_.cancel();
            return;
        }

        if (frame.endOfAudio) {
            std::cout << "[Transport] [INFO] end of audio sent after " << chunks_sent_.load()
                      << " chunk(s), " << bytes_sent_.load() << " bytes\n";
        } else {
            bytes_sent_.fetch_add(message.data.size());
            chunks_sent_.fetch_add(1);
        }
    }
}

bool TransportSession::terminate(StreamEvent& event, const std::string& message) {
    fail(message);
    receive_done_ = true;
    std::cerr << "[Transport] [ERROR] " << message << "\n";
    event = ControlEvent::error(lastError().empty() ? message : lastError());
    return true;
}

bool TransportSession::receive(StreamEvent& event) {
    while (true) {
        if (!pending_.empty()) {
            event = std::move(pending_.front());
            pending_.pop_front();
            return true;
        }
        if (receive_done_) return false;

        ChannelMessage message;
        bool got = false;
        try {
            got = channel_->read(message);
        } catch (const ConnectionError& e) {
            if (closing_.load()) {
                receive_done_ = true;
                return false;
            }
            return terminate(event, e.what());
        }

        if (!got) {
            receive_done_ = true;
            if (closing_.load()) return false;

            if (state() == TransportState::Finishing) {
                transition(TransportState::Closed);
                std::cout << "[Transport] [INFO] backend closed the stream\n";
                return false;
            }
            return terminate(event, "backend closed the connection unexpectedly");
        }

        if (message.binary) {
            fail("unexpected binary message from backend");
            receive_done_ = true;
            throw ProtocolError("unexpected binary message from backend");
        }

        std::vector<StreamEvent> events;
        try {
            events = message_codec::decode(message.data);
        } catch (const ProtocolError& e) {
            std::cerr << "[Transport] [ERROR] " << e.what() << "\n";
            fail(e.what());
            receive_done_ = true;
            throw;
        } catch (const std::exception& e) {
            const std::string error = std::string("undecodable backend message: ") + e.what();
            std::cerr << "[Transport] [ERROR] " << error << "\n";
            fail(error);
            receive_done_ = true;
            throw ProtocolError(error);
        }

        for (auto& e : events) {
            const auto* control = std::get_if<ControlEvent>(&e);
            if (control && control->kind == ControlEvent::Kind::Error) {
                std::cerr << "[Transport] [ERROR] backend reported: " << control->message << "\n";
                fail("backend error: " + control->message);
                pending_.push_back(std::move(e));
                receive_done_ = true;
                break;
            }
            pending_.push_back(std::move(e));
        }
    }
}

void TransportSession::close() {
    if (closing_.exchange(true)) return;

    const size_t unsent = outbound_.size();
    if (unsent > 0) {
        std::cout << "[Transport] [WARN] closing with " << unsent << " unsent frame(s)\n";
    }
    outbound_.cancel();
    channel_->close();

    if (send_thread_.joinable() && send_thread_.get_id() != std::this_thread::get_id()) {
        send_thread_.join();
    }

    transition(TransportState::Closed);
    std::cout << "[Transport] [INFO] session " << toString(state()) << ", " << bytes_sent_.load()
              << " bytes sent\n";
}
