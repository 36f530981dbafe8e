#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base for every failure the streaming pipeline reports to its caller.
class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& what) : std::runtime_error(what) {}
};

// Audio subsystem could not be queried, or no usable input device exists.
class DeviceEnumerationError : public StreamError {
public:
    explicit DeviceEnumerationError(const std::string& what) : StreamError(what) {}
};

// Input device disappeared or stopped delivering mid-capture.
class DeviceLostError : public StreamError {
public:
    explicit DeviceLostError(const std::string& what) : StreamError(what) {}
};

// Network, DNS, TLS or WebSocket handshake failure.
class ConnectionError : public StreamError {
public:
    explicit ConnectionError(const std::string& what) : StreamError(what) {}
};

// Backend rejected the credentials.
class AuthError : public StreamError {
public:
    explicit AuthError(const std::string& what) : StreamError(what) {}
};

// Backend sent a message that could not be decoded.
class ProtocolError : public StreamError {
public:
    explicit ProtocolError(const std::string& what) : StreamError(what) {}
};

// Backend explicitly reported a failure.
class BackendError : public StreamError {
public:
    explicit BackendError(const std::string& what) : StreamError(what) {}
};

// A session is already live on this controller.
class SessionBusyError : public StreamError {
public:
    explicit SessionBusyError(const std::string& what) : StreamError(what) {}
};

#endif
