#include "a2s_protocol_test.hpp"

#include "query/a2s_protocol.hpp"
#include "query/transport.hpp"

#include <cstring>

namespace {

class PacketWriter {
public:
    PacketWriter &byte(uint8_t value) {
        bytes.push_back(value);
        return *this;
    }

    PacketWriter &int16(int16_t value) {
        const auto raw = static_cast<uint16_t>(value);
        bytes.push_back(static_cast<uint8_t>(raw & 0xFF));
        bytes.push_back(static_cast<uint8_t>(raw >> 8));
        return *this;
    }

    PacketWriter &int32(int32_t value) {
        const auto raw = static_cast<uint32_t>(value);
        for (int shift = 0; shift < 32; shift += 8) {
            bytes.push_back(static_cast<uint8_t>((raw >> shift) & 0xFF));
        }
        return *this;
    }

    PacketWriter &float32(float value) {
        int32_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        return int32(bits);
    }

    PacketWriter &string(const std::string &value) {
        bytes.insert(bytes.end(), value.begin(), value.end());
        bytes.push_back(0);
        return *this;
    }

    std::vector<uint8_t> bytes;
};

PacketWriter reply(char type) {
    PacketWriter writer;
    writer.int32(A2SProtocol::SIMPLE_HEADER).byte(static_cast<uint8_t>(type));
    return writer;
}

} // namespace

void A2SProtocolTest::test_info_request() {
    const auto request = A2SProtocol::buildInfoRequest();

    QCOMPARE(request.size(), std::size_t(25));
    QCOMPARE(request[0], uint8_t(0xFF));
    QCOMPARE(request[3], uint8_t(0xFF));
    QCOMPARE(request[4], uint8_t('T'));
    QCOMPARE(std::string(request.begin() + 5, request.end() - 1), std::string("Source Engine Query"));
    QCOMPARE(request.back(), uint8_t(0));
}

void A2SProtocolTest::test_info_request_with_challenge() {
    const auto request = A2SProtocol::buildInfoRequest(0x11223344);

    QCOMPARE(request.size(), std::size_t(29));
    QCOMPARE(request[25], uint8_t(0x44));
    QCOMPARE(request[28], uint8_t(0x11));
}

void A2SProtocolTest::test_player_request() {
    const std::vector<uint8_t> expected = {0xFF, 0xFF, 0xFF, 0xFF, 'U', 0xFF, 0xFF, 0xFF, 0xFF};
    QVERIFY(A2SProtocol::buildPlayerRequest() == expected);

    const auto withChallenge = A2SProtocol::buildPlayerRequest(0x01020304);
    QCOMPARE(withChallenge[5], uint8_t(0x04));
    QCOMPARE(withChallenge[8], uint8_t(0x01));
}

void A2SProtocolTest::test_challenge_reply() {
    const auto packet = reply('A').int32(0x0A0B0C0D).bytes;

    QVERIFY(A2SProtocol::replyType(packet) == A2SProtocol::PacketType::ChallengeReply);
    QCOMPARE(A2SProtocol::parseChallenge(packet), int32_t(0x0A0B0C0D));
}

void A2SProtocolTest::test_info_reply() {
    const auto packet = reply('I')
        .byte(17)
        .string("[GER] Hunting Grounds")
        .string("Layton")
        .string("hunt")
        .string("theHunter")
        .int16(0)
        .byte(12)
        .byte(32)
        .byte(0)
        .bytes;

    QVERIFY(A2SProtocol::replyType(packet) == A2SProtocol::PacketType::InfoReply);
    const auto info = A2SProtocol::parseInfo(packet);
    QCOMPARE(*info.name, std::string("[GER] Hunting Grounds"));
    QCOMPARE(*info.currentPlayers, 12);
    QCOMPARE(*info.maxPlayers, 32);
}

void A2SProtocolTest::test_player_reply() {
    const auto packet = reply('D')
        .byte(2)
        .byte(0).string("Alice").int32(10).float32(125.5f)
        .byte(1).string("").int32(0).float32(3725.0f)
        .bytes;

    QVERIFY(A2SProtocol::replyType(packet) == A2SProtocol::PacketType::PlayerReply);
    const auto players = A2SProtocol::parsePlayers(packet);
    QCOMPARE(players.size(), std::size_t(2));
    QCOMPARE(players[0].name, std::string("Alice"));
    QCOMPARE(*players[0].durationSeconds, 125.5);
    QCOMPARE(players[1].name, std::string());
    QCOMPARE(*players[1].durationSeconds, 3725.0);
}

void A2SProtocolTest::test_split_reply_rejected() {
    PacketWriter writer;
    writer.int32(A2SProtocol::SPLIT_HEADER).int32(1).byte(2).byte(0);
    QVERIFY_EXCEPTION_THROWN(A2SProtocol::replyType(writer.bytes), QueryError);
}

void A2SProtocolTest::test_truncated_reply_rejected() {
    QVERIFY_EXCEPTION_THROWN(A2SProtocol::replyType({0xFF, 0xFF}), QueryError);

    const auto packet = reply('I').byte(17).string("Name").bytes;
    QVERIFY_EXCEPTION_THROWN(A2SProtocol::parseInfo(packet), QueryError);

    const auto players = reply('D').byte(3).byte(0).string("Only").int32(0).float32(1.0f).bytes;
    QVERIFY_EXCEPTION_THROWN(A2SProtocol::parsePlayers(players), QueryError);
}
