#include <cassert>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors.hpp"
#include "stt/message_channel.hpp"
#include "stt/message_codec.hpp"

using json = nlohmann::json;

static bool throwsProtocolError(const std::string& message) {
    try {
        message_codec::decode(message);
    } catch (const ProtocolError&) {
        return true;
    }
    return false;
}

int main() {
    // First frame of a session
    {
        RecognitionConfig config;
        config.apiKey = "secret";
        const json j = json::parse(message_codec::encodeConfig(config));
        assert(j["api_key"] == "secret");
        assert(j["model"] == "stt-rt-v3");
        assert(j["audio_format"] == "pcm_s16le");
        assert(j["sample_rate"] == 16000);
        assert(j["num_channels"] == 1);
        assert(j["enable_speaker_diarization"] == false);
        assert(!j.contains("language_hints"));

        config.language = "de";
        const json withLanguage = json::parse(message_codec::encodeConfig(config));
        assert(withLanguage["language_hints"] == json::array({"de"}));
    }

    // Backend shape: tokens in order, markers skipped, finished last
    {
        const auto events = message_codec::decode(R"({
            "tokens": [
                {"text": "Hel", "is_final": true, "confidence": 0.97, "speaker": "1"},
                {"text": "lo", "is_final": false, "confidence": 1.7},
                {"text": "<end>", "is_final": true}
            ],
            "finished": true
        })");
        assert(events.size() == 3);

        const auto& first = std::get<Token>(events[0]);
        assert(first.text == "Hel" && first.isFinal);
        assert(first.speakerId && *first.speakerId == 1);

        const auto& second = std::get<Token>(events[1]);
        assert(second.text == "lo" && !second.isFinal);
        assert(second.confidence == 1.0f);
        assert(!second.speakerId);

        assert(std::get<ControlEvent>(events[2]).kind == ControlEvent::Kind::Finished);
    }

    // An empty token list is a valid keep-alive
    assert(message_codec::decode(R"({"tokens": []})").empty());

    // Backend error
    {
        const auto events = message_codec::decode(R"({"error_code": 401, "error_message": "Invalid API key"})");
        assert(events.size() == 1);
        const auto& e = std::get<ControlEvent>(events[0]);
        assert(e.kind == ControlEvent::Kind::Error);
        assert(e.code == 401);
        assert(e.message == "Invalid API key");
        assert(message_codec::isAuthFailure(e.code));
        assert(!message_codec::isAuthFailure(500));
    }

    // Relay shape
    {
        auto events = message_codec::decode(R"({"type": "ready"})");
        assert(events.size() == 1 && std::get<ControlEvent>(events[0]).kind == ControlEvent::Kind::Ready);

        events = message_codec::decode(R"({"type": "token", "text": "hi", "is_final": true, "speaker_id": 2})");
        assert(events.size() == 1);
        const auto& t = std::get<Token>(events[0]);
        assert(t.text == "hi" && t.isFinal && *t.speakerId == 2);

        events = message_codec::decode(R"({"type": "error", "message": "quota exceeded"})");
        assert(std::get<ControlEvent>(events[0]).message == "quota exceeded");
    }

    // Malformed input
    assert(throwsProtocolError("not json"));
    assert(throwsProtocolError("[1, 2]"));
    assert(throwsProtocolError(R"({"type": "bogus"})"));
    assert(throwsProtocolError(R"({"tokens": "x"})"));
    assert(throwsProtocolError(R"({"tokens": [{"is_final": true}]})"));
    assert(throwsProtocolError(R"({"tokens": [{"text": "a", "speaker": "one"}]})"));
    assert(throwsProtocolError(R"({"hello": "world"})"));

    // Speaker ids must fit an int, never wrap around
    assert(throwsProtocolError(R"({"tokens": [{"text": "a", "speaker": "99999999999999999999"}]})"));
    assert(throwsProtocolError(R"({"tokens": [{"text": "a", "speaker": "2147483648"}]})"));
    assert(throwsProtocolError(R"({"tokens": [{"text": "a", "speaker_id": 4294967297}]})"));
    assert(throwsProtocolError(R"({"type": "token", "text": "a", "speaker_id": -3})"));
    {
        const auto events = message_codec::decode(R"({"tokens": [{"text": "a", "speaker": "2147483647"}]})");
        assert(*std::get<Token>(events[0]).speakerId == 2147483647);
    }

    // An error code that does not fit is reported as unknown (0)
    {
        const auto events = message_codec::decode(R"({"error_code": 4294967297, "error_message": "x"})");
        const auto& e = std::get<ControlEvent>(events[0]);
        assert(e.code == 0);
        assert(!message_codec::isAuthFailure(e.code));
    }

    // Endpoints
    {
        const Endpoint e = Endpoint::parse("wss://stt-rt.soniox.com/transcribe-websocket");
        assert(e.secure && e.host == "stt-rt.soniox.com" && e.port == "443");
        assert(e.target == "/transcribe-websocket");

        const Endpoint local = Endpoint::parse("ws://127.0.0.1:9002");
        assert(!local.secure && local.port == "9002" && local.target == "/");
        assert(local.url() == "ws://127.0.0.1:9002/");

        bool threw = false;
        try {
            Endpoint::parse("http://example.com");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
