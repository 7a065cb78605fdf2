#pragma once

#include <stdexcept>
#include <string>

// Any transport, authentication or timeout failure while bringing up or
// verifying a tunnel. cause() names the failing layer ("TimeoutError",
// "AuthError", ...), what() carries "<cause>: <message>".
class TunnelError : public std::runtime_error {
public:
    TunnelError(const std::string& cause, const std::string& message)
        : std::runtime_error(cause + ": " + message), cause_(cause) {}

    const std::string& cause() const { return cause_; }

private:
    std::string cause_;
};

// Teardown target (or other explicitly requested object) does not exist.
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The record a transaction touched was removed from the store.
class EntityVanishedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Optimistic retry budget of a store transaction ran out.
class ConflictExhaustedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
