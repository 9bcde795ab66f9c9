#pragma once

#include "query/transport.hpp"

#include <cstdint>
#include <vector>

// A2S_INFO / A2S_PLAYER over UDP. Each call opens its own socket, so one instance can be shared
// between the concurrent per-server query threads of a cycle.
class A2SQueryTransport : public IQueryTransport {
public:
    A2SQueryTransport() = default;
    ~A2SQueryTransport() override = default;

    ServerInfo info(const std::string &address, uint16_t port, std::chrono::milliseconds timeout) override;
    PlayerList players(const std::string &address, uint16_t port, std::chrono::milliseconds timeout) override;

private:
    static constexpr int MAX_CHALLENGE_ROUNDS = 2;
};
