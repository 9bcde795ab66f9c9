#include "query/a2s_transport.hpp"

#include "query/a2s_protocol.hpp"
#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstring>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {

class UdpExchange {
public:
    UdpExchange(const std::string &address, uint16_t port, std::chrono::milliseconds timeout)
        : deadline(std::chrono::steady_clock::now() + timeout) {
        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;

        addrinfo *resolved = nullptr;
        const std::string service = std::to_string(port);
        const int rc = getaddrinfo(address.c_str(), service.c_str(), &hints, &resolved);
        if (rc != 0 || !resolved) {
            throw QueryError("A2S: cannot resolve " + address + ": " + gai_strerror(rc));
        }
        std::memcpy(&target, resolved->ai_addr, sizeof(target));
        freeaddrinfo(resolved);

        socketFd = socket(AF_INET, SOCK_DGRAM, 0);
        if (socketFd < 0) {
            throw QueryError(std::string("A2S: socket() failed: ") + std::strerror(errno));
        }
    }

    ~UdpExchange() {
        if (socketFd >= 0) {
            close(socketFd);
        }
    }

    UdpExchange(const UdpExchange &) = delete;
    UdpExchange &operator=(const UdpExchange &) = delete;

    std::vector<uint8_t> roundTrip(const std::vector<uint8_t> &request) {
        const ssize_t sent = sendto(socketFd, request.data(), request.size(), 0,
            reinterpret_cast<const sockaddr *>(&target), sizeof(target));
        if (sent != static_cast<ssize_t>(request.size())) {
            throw QueryError(std::string("A2S: sendto failed: ") + std::strerror(errno));
        }

        while (true) {
            applyRemainingTimeout();

            std::vector<uint8_t> buffer(A2SProtocol::MAX_PACKET_SIZE);
            sockaddr_in from{};
            socklen_t fromLen = sizeof(from);
            const ssize_t received = recvfrom(socketFd, buffer.data(), buffer.size(), 0,
                reinterpret_cast<sockaddr *>(&from), &fromLen);
            if (received < 0) {
                if (errno == EWOULDBLOCK || errno == EAGAIN) {
                    throw QueryError("A2S: timed out");
                }
                if (errno == EINTR) {
                    continue;
                }
                throw QueryError(std::string("A2S: recvfrom failed: ") + std::strerror(errno));
            }

            // Ignore stray datagrams from anything but the queried endpoint.
            if (from.sin_addr.s_addr != target.sin_addr.s_addr || from.sin_port != target.sin_port) {
                continue;
            }

            buffer.resize(static_cast<std::size_t>(received));
            return buffer;
        }
    }

private:
    void applyRemainingTimeout() {
        const auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw QueryError("A2S: timed out");
        }
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);
        if (setsockopt(socketFd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
            throw QueryError(std::string("A2S: setsockopt(SO_RCVTIMEO) failed: ") + std::strerror(errno));
        }
    }

    int socketFd = -1;
    sockaddr_in target{};
    std::chrono::steady_clock::time_point deadline;
};

} // namespace

ServerInfo A2SQueryTransport::info(const std::string &address, uint16_t port, std::chrono::milliseconds timeout) {
    UdpExchange exchange(address, port, timeout);
    auto reply = exchange.roundTrip(A2SProtocol::buildInfoRequest());

    for (int round = 0; round < MAX_CHALLENGE_ROUNDS; ++round) {
        if (A2SProtocol::replyType(reply) != A2SProtocol::PacketType::ChallengeReply) {
            break;
        }
        const int32_t challenge = A2SProtocol::parseChallenge(reply);
        spdlog::trace("A2SQueryTransport: info challenge from {}:{}", address, port);
        reply = exchange.roundTrip(A2SProtocol::buildInfoRequest(challenge));
    }

    if (A2SProtocol::replyType(reply) != A2SProtocol::PacketType::InfoReply) {
        throw QueryError("A2S: expected info reply");
    }
    return A2SProtocol::parseInfo(reply);
}

PlayerList A2SQueryTransport::players(const std::string &address, uint16_t port, std::chrono::milliseconds timeout) {
    UdpExchange exchange(address, port, timeout);
    auto reply = exchange.roundTrip(A2SProtocol::buildPlayerRequest());

    for (int round = 0; round < MAX_CHALLENGE_ROUNDS; ++round) {
        if (A2SProtocol::replyType(reply) != A2SProtocol::PacketType::ChallengeReply) {
            break;
        }
        const int32_t challenge = A2SProtocol::parseChallenge(reply);
        spdlog::trace("A2SQueryTransport: player challenge from {}:{}", address, port);
        reply = exchange.roundTrip(A2SProtocol::buildPlayerRequest(challenge));
    }

    if (A2SProtocol::replyType(reply) != A2SProtocol::PacketType::PlayerReply) {
        throw QueryError("A2S: expected player reply");
    }
    return A2SProtocol::parsePlayers(reply);
}
