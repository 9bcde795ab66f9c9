#include "query/a2s_protocol.hpp"

#include "query/transport.hpp"

#include <cstring>
#include <string>

namespace {

constexpr const char *INFO_PAYLOAD = "Source Engine Query";

class PacketReader {
public:
    explicit PacketReader(const std::vector<uint8_t> &packet, std::size_t offset = 0)
        : packet(packet), offset(offset) {}

    uint8_t readByte() {
        require(1);
        return packet[offset++];
    }

    int16_t readInt16() {
        require(2);
        const uint16_t value = static_cast<uint16_t>(packet[offset]) |
            static_cast<uint16_t>(packet[offset + 1] << 8);
        offset += 2;
        return static_cast<int16_t>(value);
    }

    int32_t readInt32() {
        require(4);
        const uint32_t value = static_cast<uint32_t>(packet[offset]) |
            (static_cast<uint32_t>(packet[offset + 1]) << 8) |
            (static_cast<uint32_t>(packet[offset + 2]) << 16) |
            (static_cast<uint32_t>(packet[offset + 3]) << 24);
        offset += 4;
        return static_cast<int32_t>(value);
    }

    float readFloat() {
        const int32_t bits = readInt32();
        float value = 0.0f;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string readString() {
        std::string value;
        while (true) {
            require(1);
            const char ch = static_cast<char>(packet[offset++]);
            if (ch == '\0') {
                return value;
            }
            value.push_back(ch);
        }
    }

private:
    void require(std::size_t count) const {
        if (offset + count > packet.size()) {
            throw QueryError("A2S: truncated reply");
        }
    }

    const std::vector<uint8_t> &packet;
    std::size_t offset;
};

void appendInt32(std::vector<uint8_t> &out, int32_t value) {
    const auto raw = static_cast<uint32_t>(value);
    out.push_back(static_cast<uint8_t>(raw & 0xFF));
    out.push_back(static_cast<uint8_t>((raw >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((raw >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((raw >> 24) & 0xFF));
}

// Reply body starts after the 4 byte header and the type byte.
constexpr std::size_t BODY_OFFSET = 5;

} // namespace

namespace A2SProtocol {

std::vector<uint8_t> buildInfoRequest(int32_t challenge) {
    std::vector<uint8_t> request;
    request.reserve(29);
    appendInt32(request, SIMPLE_HEADER);
    request.push_back(static_cast<uint8_t>(PacketType::InfoRequest));
    request.insert(request.end(), INFO_PAYLOAD, INFO_PAYLOAD + std::strlen(INFO_PAYLOAD) + 1);
    if (challenge != NO_CHALLENGE) {
        appendInt32(request, challenge);
    }
    return request;
}

std::vector<uint8_t> buildPlayerRequest(int32_t challenge) {
    std::vector<uint8_t> request;
    request.reserve(9);
    appendInt32(request, SIMPLE_HEADER);
    request.push_back(static_cast<uint8_t>(PacketType::PlayerRequest));
    appendInt32(request, challenge);
    return request;
}

PacketType replyType(const std::vector<uint8_t> &packet) {
    PacketReader reader(packet);
    const int32_t header = reader.readInt32();
    if (header == SPLIT_HEADER) {
        throw QueryError("A2S: split replies are not supported");
    }
    if (header != SIMPLE_HEADER) {
        throw QueryError("A2S: unexpected packet header");
    }

    const uint8_t type = reader.readByte();
    switch (type) {
    case static_cast<uint8_t>(PacketType::ChallengeReply):
    case static_cast<uint8_t>(PacketType::InfoReply):
    case static_cast<uint8_t>(PacketType::PlayerReply):
        return static_cast<PacketType>(type);
    default:
        throw QueryError("A2S: unexpected reply type 0x" + std::to_string(type));
    }
}

int32_t parseChallenge(const std::vector<uint8_t> &packet) {
    PacketReader reader(packet, BODY_OFFSET);
    return reader.readInt32();
}

ServerInfo parseInfo(const std::vector<uint8_t> &packet) {
    PacketReader reader(packet, BODY_OFFSET);
    ServerInfo info;
    reader.readByte(); // protocol
    info.name = reader.readString();
    reader.readString(); // map
    reader.readString(); // folder
    reader.readString(); // game
    reader.readInt16();  // app id
    info.currentPlayers = static_cast<int>(reader.readByte());
    info.maxPlayers = static_cast<int>(reader.readByte());
    return info;
}

PlayerList parsePlayers(const std::vector<uint8_t> &packet) {
    PacketReader reader(packet, BODY_OFFSET);
    const uint8_t count = reader.readByte();

    PlayerList players;
    players.reserve(count);
    for (uint8_t i = 0; i < count; ++i) {
        PlayerSession session;
        reader.readByte(); // index
        session.name = reader.readString();
        reader.readInt32(); // score
        session.durationSeconds = static_cast<double>(reader.readFloat());
        players.push_back(std::move(session));
    }
    return players;
}

} // namespace A2SProtocol
