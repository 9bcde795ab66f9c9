#pragma once

#include "query/types.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

class QueryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Stateless request/response game-server query. Implementations enforce the timeout themselves and
// report timeouts, transport errors and malformed replies by throwing QueryError.
class IQueryTransport {
public:
    virtual ~IQueryTransport() = default;

    virtual ServerInfo info(const std::string &address, uint16_t port, std::chrono::milliseconds timeout) = 0;
    virtual PlayerList players(const std::string &address, uint16_t port, std::chrono::milliseconds timeout) = 0;
};
