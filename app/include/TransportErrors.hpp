#ifndef TRANSPORT_ERRORS_HPP
#define TRANSPORT_ERRORS_HPP

#include <stdexcept>
#include <string>

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

class TransportTimeoutError : public TransportError {
public:
    explicit TransportTimeoutError(const std::string& message)
        : TransportError(message) {}
};

// Raised when a transfer is cut short because a stop was requested.
class TransportAbortedError : public TransportError {
public:
    explicit TransportAbortedError(const std::string& message)
        : TransportError(message) {}
};

#endif // TRANSPORT_ERRORS_HPP
