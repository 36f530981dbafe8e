#ifndef MESSAGE_CODEC_HPP
#define MESSAGE_CODEC_HPP

#include "stt/stream_event.hpp"

#include <string>
#include <vector>

// Recognition settings sent as the first text frame of a session.
struct RecognitionConfig {
    std::string apiKey;
    std::string model = "stt-rt-v3";
    std::string audioFormat = "pcm_s16le";
    int sampleRate = 16000;
    int numChannels = 1;
    bool speakerDiarization = false;
    std::string language;       // empty = let the backend detect
};

namespace message_codec {

std::string encodeConfig(const RecognitionConfig& config);

// Decodes one backend text message into events, in message order.
// Accepts {"type": "ready" | "token" | "error", ...} and
// {"tokens": [...], "finished": bool, "error_code", "error_message"}.
// Throws ProtocolError for anything else.
std::vector<StreamEvent> decode(const std::string& message);

// Backend error codes that mean the credentials were rejected.
bool isAuthFailure(int code);

} // namespace message_codec

#endif
