#ifndef STREAM_EVENT_HPP
#define STREAM_EVENT_HPP

#include <optional>
#include <utility>
#include <string>
#include <variant>

// One recognition result, in backend delivery order.
struct Token {
    std::string text;
    bool isFinal = false;
    float confidence = 1.0f;
    std::optional<int> speakerId;
};

// Stream-level signal, kept apart from recognition output.
struct ControlEvent {
    enum class Kind {
        Ready,      // backend accepted the configuration and awaits audio
        Finished,   // every final token for the submitted audio was delivered
        Error
    };

    Kind kind = Kind::Ready;
    std::string message;
    int code = 0;               // backend error code when one was given

    static ControlEvent ready() { return ControlEvent{Kind::Ready, {}, 0}; }
    static ControlEvent finished() { return ControlEvent{Kind::Finished, {}, 0}; }
    static ControlEvent error(std::string message, int code = 0) {
        return ControlEvent{Kind::Error, std::move(message), code};
    }
};

using StreamEvent = std::variant<Token, ControlEvent>;

#endif
