#ifndef HEADERS_HPP
#define HEADERS_HPP

#include "core/errors.hpp"
#include "audio/device_registry.hpp"
#include "audio/portaudio_backend.hpp"
#include "audio/synthetic_backend.hpp"
#include "stt/websocket_channel.hpp"
#include "session/session_controller.hpp"
#include "session/intent_dispatcher.hpp"
#include "session/intent_listener.hpp"

#endif
