#include "gtest/gtest.h"
#include "dt_core/collection/EntityNormalizer.hpp"
#include <vector>

namespace
{

const std::vector<uint8_t> SRC_MAC = {0x00, 0x44, 0x33, 0x22, 0x11, 0x00};

std::vector<uint8_t>
ethernetHeader(const std::vector<uint8_t>& src, std::optional<uint16_t> vlanTci, uint16_t ethType)
{
    std::vector<uint8_t> frame = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff};
    frame.insert(frame.end(), src.begin(), src.end());
    if (vlanTci)
    {
        frame.insert(frame.end(), {0x81, 0x00, static_cast<uint8_t>(*vlanTci >> 8),
                                   static_cast<uint8_t>(*vlanTci & 0xff)});
    }
    frame.push_back(static_cast<uint8_t>(ethType >> 8));
    frame.push_back(static_cast<uint8_t>(ethType & 0xff));
    return frame;
}

std::vector<uint8_t>
arpRequest(std::optional<uint16_t> vlanTci, std::vector<uint8_t> senderIp)
{
    auto frame = ethernetHeader(SRC_MAC, vlanTci, EntityNormalizer::ETH_TYPE_ARP);
    frame.insert(frame.end(), {0x00, 0x01, 0x08, 0x00, 0x06, 0x04, 0x00, 0x01});
    frame.insert(frame.end(), SRC_MAC.begin(), SRC_MAC.end());
    frame.insert(frame.end(), senderIp.begin(), senderIp.end());
    frame.insert(frame.end(), {0, 0, 0, 0, 0, 0, 192, 168, 1, 2});
    return frame;
}

std::vector<uint8_t>
ipv4Packet(std::vector<uint8_t> srcIp)
{
    auto frame = ethernetHeader(SRC_MAC, std::nullopt, EntityNormalizer::ETH_TYPE_IPV4);
    frame.insert(frame.end(), {0x45, 0x00, 0x00, 0x14, 0x00, 0x00, 0x00, 0x00, 0x40, 0x11, 0x00, 0x00});
    frame.insert(frame.end(), srcIp.begin(), srcIp.end());
    frame.insert(frame.end(), {10, 0, 0, 99});
    return frame;
}

PacketInObservation
observation(std::vector<uint8_t> data, uint64_t dpid = 1, uint32_t port = 1, int64_t ts = 1000)
{
    PacketInObservation obs;
    obs.switchDpid = dpid;
    obs.inPort = port;
    obs.packetData = std::move(data);
    obs.timestampMs = ts;
    return obs;
}

} // namespace

TEST(EntityNormalizerTest, ArpWithVlanTag) {
    EntityNormalizer normalizer;
    auto entity = normalizer.normalize(observation(arpRequest(5, {192, 168, 1, 1}), 1, 1, 4242));

    ASSERT_TRUE(entity.has_value());
    EXPECT_EQ(entity->macAddress, 0x004433221100ULL);
    ASSERT_TRUE(entity->vlan.has_value());
    EXPECT_EQ(*entity->vlan, 5);
    ASSERT_TRUE(entity->ipv4Address.has_value());
    EXPECT_EQ(*entity->ipv4Address, 0xC0A80101u);
    EXPECT_EQ(entity->switchDpid, 1u);
    EXPECT_EQ(entity->switchPort, 1u);
    EXPECT_EQ(entity->lastSeenMs, 4242);
}

TEST(EntityNormalizerTest, Ipv4SourceAddress) {
    EntityNormalizer normalizer;
    auto entity = normalizer.normalize(observation(ipv4Packet({10, 0, 0, 7}), 3, 9));

    ASSERT_TRUE(entity.has_value());
    EXPECT_FALSE(entity->vlan.has_value());
    EXPECT_EQ(*entity->ipv4Address, 0x0A000007u);
    EXPECT_EQ(entity->switchDpid, 3u);
    EXPECT_EQ(entity->switchPort, 9u);
}

TEST(EntityNormalizerTest, OtherEthertypesCarryNoAddress) {
    auto frame = ethernetHeader(SRC_MAC, std::nullopt, 0x88cc);
    auto entity = EntityNormalizer().normalize(observation(frame));

    ASSERT_TRUE(entity.has_value());
    EXPECT_FALSE(entity->ipv4Address.has_value());
}

TEST(EntityNormalizerTest, TruncatedFramesAreRejected) {
    EntityNormalizer normalizer;
    auto arp = arpRequest(std::nullopt, {192, 168, 1, 1});
    arp.resize(arp.size() - 5);
    auto tagged = ethernetHeader(SRC_MAC, 5, EntityNormalizer::ETH_TYPE_ARP);
    tagged.resize(15);

    EXPECT_FALSE(normalizer.normalize(observation({0x00, 0x01, 0x02})).has_value());
    EXPECT_FALSE(normalizer.normalize(observation(arp)).has_value());
    EXPECT_FALSE(normalizer.normalize(observation(tagged)).has_value());
    EXPECT_FALSE(normalizer.normalize(observation({})).has_value());
}

TEST(EntityNormalizerTest, UnusableSourceMacsAreRejected) {
    EntityNormalizer normalizer;
    auto zero = ethernetHeader({0, 0, 0, 0, 0, 0}, std::nullopt, 0x88cc);
    auto broadcast = ethernetHeader({0xff, 0xff, 0xff, 0xff, 0xff, 0xff}, std::nullopt, 0x88cc);
    auto multicast = ethernetHeader({0x01, 0x00, 0x5e, 0x00, 0x00, 0x01}, std::nullopt, 0x88cc);

    EXPECT_FALSE(normalizer.normalize(observation(zero)).has_value());
    EXPECT_FALSE(normalizer.normalize(observation(broadcast)).has_value());
    EXPECT_FALSE(normalizer.normalize(observation(multicast)).has_value());
}

TEST(EntityNormalizerTest, PriorityTagCountsAsUntagged) {
    // VLAN id 0 with PCP 5
    auto entity = EntityNormalizer().normalize(observation(arpRequest(0xA000, {192, 168, 1, 1})));

    ASSERT_TRUE(entity.has_value());
    EXPECT_FALSE(entity->vlan.has_value());
}

TEST(EntityNormalizerTest, ZeroAndMulticastSourceIpAreUnknown) {
    EntityNormalizer normalizer;
    auto unknownIp = normalizer.normalize(observation(arpRequest(std::nullopt, {0, 0, 0, 0})));
    auto mcast = normalizer.normalize(observation(ipv4Packet({239, 1, 1, 1})));

    ASSERT_TRUE(unknownIp.has_value());
    EXPECT_FALSE(unknownIp->ipv4Address.has_value());
    ASSERT_TRUE(mcast.has_value());
    EXPECT_FALSE(mcast->ipv4Address.has_value());
}

TEST(EntityNormalizerTest, DecodedHeaderFieldsTakePrecedence) {
    auto obs = observation({0x00});
    obs.headerFields = PacketHeaderFields{0x0000000000AAULL, 0x1005, 0x0A000001};

    auto entity = EntityNormalizer().normalize(obs);
    ASSERT_TRUE(entity.has_value());
    EXPECT_EQ(entity->macAddress, 0xAAu);
    EXPECT_EQ(*entity->vlan, 5);
    EXPECT_EQ(*entity->ipv4Address, 0x0A000001u);
}

TEST(EntityNormalizerTest, ReplayRecordsDecode) {
    auto decoded = nlohmann::json::parse(R"({"switch": "00:00:00:00:00:00:00:02", "port": 4,
        "timestamp_ms": 77, "mac": "00:44:33:22:11:00", "vlan": 5, "ip": "192.168.1.1"})")
                       .get<PacketInObservation>();
    EXPECT_EQ(decoded.switchDpid, 2u);
    EXPECT_EQ(decoded.inPort, 4u);
    EXPECT_EQ(decoded.timestampMs, 77);
    ASSERT_TRUE(decoded.headerFields.has_value());
    EXPECT_EQ(decoded.headerFields->srcMac, 0x004433221100ULL);
    EXPECT_EQ(*decoded.headerFields->srcIpv4, 0xC0A80101u);

    auto raw = nlohmann::json::parse(R"({"switch": 1, "port": 1, "packet_hex": "ffffffffffff00443322110088cc"})")
                   .get<PacketInObservation>();
    EXPECT_FALSE(raw.headerFields.has_value());
    EXPECT_EQ(raw.packetData.size(), 14u);
    EXPECT_TRUE(EntityNormalizer().normalize(raw).has_value());

    EXPECT_THROW(nlohmann::json::parse(R"({"switch": 1, "port": 1, "packet_hex": "abc"})")
                     .get<PacketInObservation>(),
                 std::invalid_argument);
}

TEST(EntityNormalizerTest, ReplayRecordsRejectNonHexPacketData) {
    for (const char* hex : {"1g", "-1", " 1", "0x", "ffff+1"}) {
        auto record = nlohmann::json{{"switch", 1}, {"port", 1}, {"packet_hex", hex}};
        EXPECT_THROW(record.get<PacketInObservation>(), std::invalid_argument) << hex;
    }
}
