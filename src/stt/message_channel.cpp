#include "stt/message_channel.hpp"

#include <stdexcept>

Endpoint Endpoint::parse(const std::string& url) {
    Endpoint endpoint;

    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        endpoint.secure = true;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
    } else {
        throw std::invalid_argument("endpoint must start with ws:// or wss://: " + url);
    }

    const size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) endpoint.target = rest.substr(slash);

    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
    } else {
        endpoint.host = authority;
        endpoint.port = endpoint.secure ? "443" : "80";
    }

    if (endpoint.host.empty() || endpoint.port.empty()) {
        throw std::invalid_argument("endpoint has no host or port: " + url);
    }
    return endpoint;
}

std::string Endpoint::url() const {
    return std::string(secure ? "wss://" : "ws://") + host + ":" + port + target;
}
