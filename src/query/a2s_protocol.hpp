#pragma once

#include "query/types.hpp"

#include <cstdint>
#include <vector>

namespace A2SProtocol {

constexpr int32_t SIMPLE_HEADER = -1;  // FF FF FF FF
constexpr int32_t SPLIT_HEADER = -2;   // FF FF FF FE
constexpr int32_t NO_CHALLENGE = -1;
constexpr std::size_t MAX_PACKET_SIZE = 1400;

enum class PacketType : uint8_t {
    InfoRequest = 'T',
    PlayerRequest = 'U',
    ChallengeReply = 'A',
    InfoReply = 'I',
    PlayerReply = 'D'
};

std::vector<uint8_t> buildInfoRequest(int32_t challenge = NO_CHALLENGE);
std::vector<uint8_t> buildPlayerRequest(int32_t challenge = NO_CHALLENGE);

// Validates the packet header and returns the reply type byte. Throws QueryError on
// short, split or otherwise unsupported packets.
PacketType replyType(const std::vector<uint8_t> &packet);

int32_t parseChallenge(const std::vector<uint8_t> &packet);
ServerInfo parseInfo(const std::vector<uint8_t> &packet);
PlayerList parsePlayers(const std::vector<uint8_t> &packet);

} // namespace A2SProtocol
