#include "stt/message_codec.hpp"
#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace message_codec {

static std::string preview(const std::string& message) {
    return message.size() > 120 ? message.substr(0, 120) + "..." : message;
}

static std::optional<int> parseSpeaker(const json& value) {
    if (value.is_null()) return std::nullopt;

    constexpr int64_t kMax = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        const uint64_t v = value.get<uint64_t>();
        if (v > (uint64_t)kMax) throw ProtocolError("speaker id out of range: " + value.dump());
        return (int)v;
    }
    if (value.is_number_integer()) {
        const int64_t v = value.get<int64_t>();
        if (v < 0 || v > kMax) throw ProtocolError("speaker id out of range: " + value.dump());
        return (int)v;
    }
    if (value.is_string()) {
        const std::string s = value.get<std::string>();
        if (!s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            int64_t v = 0;
            for (char c : s) {
                v = v * 10 + (c - '0');
                if (v > kMax) throw ProtocolError("speaker id out of range: " + value.dump());
            }
            return (int)v;
        }
    }
    throw ProtocolError("speaker id is not an integer: " + value.dump());
}

static Token parseToken(const json& j) {
    if (!j.is_object()) throw ProtocolError("token is not an object: " + j.dump());

    auto text = j.find("text");
    if (text == j.end() || !text->is_string()) {
        throw ProtocolError("token without text: " + j.dump());
    }

    Token token;
    token.text = text->get<std::string>();

    auto isFinal = j.find("is_final");
    if (isFinal != j.end() && !isFinal->is_null()) {
        if (!isFinal->is_boolean()) throw ProtocolError("is_final is not a boolean: " + j.dump());
        token.isFinal = isFinal->get<bool>();
    }

    auto confidence = j.find("confidence");
    if (confidence != j.end() && !confidence->is_null()) {
        if (!confidence->is_number()) throw ProtocolError("confidence is not a number: " + j.dump());
        token.confidence = std::min(1.0f, std::max(0.0f, confidence->get<float>()));
    }

    if (j.contains("speaker_id")) {
        token.speakerId = parseSpeaker(j.at("speaker_id"));
    } else if (j.contains("speaker")) {
        token.speakerId = parseSpeaker(j.at("speaker"));
    }
    return token;
}

static ControlEvent parseError(const json& j) {
    int code = 0;
    auto c = j.find("error_code");
    if (c == j.end()) c = j.find("code");
    if (c != j.end() && c->is_number_integer() && !c->is_number_unsigned()) {
        const int64_t v = c->get<int64_t>();
        if (v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max()) code = (int)v;
    } else if (c != j.end() && c->is_number_unsigned()) {
        const uint64_t v = c->get<uint64_t>();
        if (v <= (uint64_t)std::numeric_limits<int>::max()) code = (int)v;
    }

    std::string message = "unknown backend error";
    for (const char* key : {"error_message", "message"}) {
        auto m = j.find(key);
        if (m != j.end() && m->is_string()) {
            message = m->get<std::string>();
            break;
        }
    }
    return ControlEvent::error(message, code);
}

// End-of-utterance and finalization markers carry no text for the transcript
static bool isMarker(const Token& token) {
    return token.text == "<end>" || token.text == "<fin>";
}

std::string encodeConfig(const RecognitionConfig& config) {
    json j;
    j["api_key"] = config.apiKey;
    j["model"] = config.model;
    j["audio_format"] = config.audioFormat;
    j["sample_rate"] = config.sampleRate;
    j["num_channels"] = config.numChannels;
    j["enable_speaker_diarization"] = config.speakerDiarization;
    if (!config.language.empty()) {
        j["language_hints"] = json::array({config.language});
    }
    return j.dump();
}

std::vector<StreamEvent> decode(const std::string& message) {
    json j;
    try {
        j = json::parse(message);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("malformed backend message: ") + e.what());
    }
    if (!j.is_object()) {
        throw ProtocolError("backend message is not an object: " + preview(message));
    }

    std::vector<StreamEvent> events;

    auto type = j.find("type");
    if (type != j.end()) {
        if (!type->is_string()) throw ProtocolError("message type is not a string: " + preview(message));
        const std::string t = type->get<std::string>();
        if (t == "ready") {
            events.emplace_back(ControlEvent::ready());
        } else if (t == "token") {
            events.emplace_back(parseToken(j));
        } else if (t == "error") {
            events.emplace_back(parseError(j));
        } else if (t == "finished") {
            events.emplace_back(ControlEvent::finished());
        } else {
            throw ProtocolError("unknown message type '" + t + "'");
        }
        return events;
    }

    const bool statusError = j.contains("status") && j["status"] == "error";
    if (j.contains("error_code") || j.contains("error_message") || statusError) {
        events.emplace_back(parseError(j));
        return events;
    }

    bool recognised = false;
    auto tokens = j.find("tokens");
    if (tokens != j.end()) {
        if (!tokens->is_array()) throw ProtocolError("tokens is not an array: " + preview(message));
        for (const auto& t : *tokens) {
            Token token = parseToken(t);
            if (!isMarker(token)) events.emplace_back(std::move(token));
        }
        recognised = true;
    }

    auto finished = j.find("finished");
    if (finished != j.end()) {
        if (!finished->is_boolean()) throw ProtocolError("finished is not a boolean: " + preview(message));
        if (finished->get<bool>()) events.emplace_back(ControlEvent::finished());
        recognised = true;
    }

    if (!recognised) {
        throw ProtocolError("unrecognised backend message: " + preview(message));
    }
    return events;
}

bool isAuthFailure(int code) {
    return code == 401 || code == 403;
}

} // namespace message_codec
