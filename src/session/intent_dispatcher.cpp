#include "session/intent_dispatcher.hpp"
#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

using json = nlohmann::json;

namespace intent {

static std::string errorReply(const std::string& message) {
    json reply;
    reply["type"] = "error";
    reply["message"] = message;
    return reply.dump();
}

std::string snapshotToJson(const SessionSnapshot& snapshot) {
    json j;
    j["type"] = "snapshot";
    j["state"] = toString(snapshot.state);
    j["transcript"] = snapshot.transcript;
    j["final_text"] = snapshot.finalText;
    j["elapsed_seconds"] = snapshot.stats.elapsedSeconds;
    j["word_count"] = snapshot.stats.wordCount;
    j["bytes_sent"] = snapshot.stats.bytesSent;
    j["level"] = snapshot.level;
    j["device_index"] = snapshot.deviceIndex ? json(*snapshot.deviceIndex) : json(nullptr);
    j["last_error"] = snapshot.lastError;
    return j.dump();
}

std::string handle(SessionController& controller, const std::string& payload) {
    const json request = json::parse(payload, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        return errorReply("intent is not a JSON object");
    }

    auto type = request.find("type");
    if (type == request.end() || !type->is_string()) {
        return errorReply("intent without a type");
    }
    const std::string kind = type->get<std::string>();
    std::cout << "[Intent] [INFO] " << kind << "\n";

    if (kind == "start") {
        try {
            controller.start();
        } catch (const std::exception& e) {
            return errorReply(e.what());
        }
    } else if (kind == "stop") {
        controller.stop();
    } else if (kind == "select_device") {
        auto index = request.find("index");
        if (index == request.end() || index->is_null()) {
            controller.selectDevice(std::nullopt);
        } else if (index->is_number_integer()) {
            controller.selectDevice(index->get<int>());
        } else {
            return errorReply("select_device needs an integer index");
        }
    } else if (kind != "snapshot") {
        return errorReply("unknown intent: " + kind);
    }

    return snapshotToJson(controller.snapshot());
}

} // namespace intent
