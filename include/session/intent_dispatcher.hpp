#ifndef INTENT_DISPATCHER_HPP
#define INTENT_DISPATCHER_HPP

#include "session/session_controller.hpp"

#include <string>

namespace intent {

// Applies one JSON intent to the controller and returns the JSON reply.
// Understood: {"type":"start"}, {"type":"stop"},
// {"type":"select_device","index":N} (null for the host default) and
// {"type":"snapshot"}. Every successful intent is answered with a snapshot;
// anything else, or a failing start, with {"type":"error","message":...}.
std::string handle(SessionController& controller, const std::string& payload);

std::string snapshotToJson(const SessionSnapshot& snapshot);

} // namespace intent

#endif
