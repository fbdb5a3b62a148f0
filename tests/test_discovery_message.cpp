#include "capdisc/discovery/discovery_message.hpp"
#include "capdisc/discovery/payload_registry.hpp"
#include "capdisc/net/transport_config.hpp"

#include <gtest/gtest.h>

namespace capdisc
{

class DiscoveryMessageTest : public ::testing::Test
{
protected:
    void SetUp() override { initialize_protocol(); }
};

TEST_F(DiscoveryMessageTest, ParsesRequest)
{
    auto packet = DiscoveryMessage::parse(DiscoveryMessage::construct_request(42, "room@conference.example.com/alice"));

    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type, DiscoveryPacketType::request);
    EXPECT_EQ(packet->id, 42U);
    EXPECT_EQ(packet->peer, "room@conference.example.com/alice");
    EXPECT_TRUE(packet->features.empty());
}

TEST_F(DiscoveryMessageTest, ParsesResultKeepingOrderAndDuplicates)
{
    auto packet = DiscoveryMessage::parse("DISCO-RESULT 7 room@conf/bob\nice\naudio-rtp\nice\n");

    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type, DiscoveryPacketType::result);
    EXPECT_EQ(packet->id, 7U);
    EXPECT_EQ(packet->peer, "room@conf/bob");
    EXPECT_EQ(packet->features, (CapabilitySet {"ice", "audio-rtp", "ice"}));
}

TEST_F(DiscoveryMessageTest, ParsesResultWithoutFeatures)
{
    auto packet = DiscoveryMessage::parse(DiscoveryMessage::construct_result(3, "peer", {}));

    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type, DiscoveryPacketType::result);
    EXPECT_TRUE(packet->features.empty());
}

TEST_F(DiscoveryMessageTest, ParsesErrorReason)
{
    auto packet = DiscoveryMessage::parse(DiscoveryMessage::construct_error(9, "peer", "item-not-found"));

    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type, DiscoveryPacketType::error);
    EXPECT_EQ(packet->error_reason, "item-not-found");

    auto no_reason = DiscoveryMessage::parse("DISCO-ERROR 9 peer");
    ASSERT_TRUE(no_reason.has_value());
    EXPECT_EQ(no_reason->error_reason, "unknown");
}

TEST_F(DiscoveryMessageTest, RejectsMalformedDatagrams)
{
    EXPECT_FALSE(DiscoveryMessage::parse("").has_value());
    EXPECT_FALSE(DiscoveryMessage::parse("DISCO-INFO").has_value());
    EXPECT_FALSE(DiscoveryMessage::parse("DISCO-INFO 12").has_value());
    EXPECT_FALSE(DiscoveryMessage::parse("DISCO-INFO abc peer").has_value());
    EXPECT_FALSE(DiscoveryMessage::parse("DISCO-INFO 1 peer extra").has_value());
    EXPECT_FALSE(DiscoveryMessage::parse("DISCO-INFO 1 peer\nbody").has_value());
    EXPECT_FALSE(DiscoveryMessage::parse("DISCO-RESULT 1 peer\nbad feature").has_value());
    EXPECT_FALSE(DiscoveryMessage::parse("DISCO-RESULT 99999999999999999999999 peer").has_value());
    EXPECT_FALSE(DiscoveryMessage::parse(std::string(DiscoveryMessage::max_datagram_size + 1, 'x')).has_value());
}

TEST_F(DiscoveryMessageTest, RejectsKeywordWithoutParser)
{
    EXPECT_FALSE(PayloadRegistry::instance().has_parser("DISCO-ITEMS"));
    EXPECT_FALSE(DiscoveryMessage::parse("DISCO-ITEMS 1 peer").has_value());
}

TEST_F(DiscoveryMessageTest, ValidatesPeerAddresses)
{
    EXPECT_TRUE(DiscoveryMessage::is_valid_peer("room@conference.example.com/abcd"));
    EXPECT_FALSE(DiscoveryMessage::is_valid_peer(""));
    EXPECT_FALSE(DiscoveryMessage::is_valid_peer("two words"));
    EXPECT_FALSE(DiscoveryMessage::is_valid_peer("line\nbreak"));
}

TEST(ProtocolBootstrapTest, IsIdempotent)
{
    initialize_protocol();
    initialize_protocol();

    auto& registry = PayloadRegistry::instance();
    EXPECT_TRUE(registry.has_parser(DiscoveryMessage::request_keyword));
    EXPECT_TRUE(registry.has_parser(DiscoveryMessage::result_keyword));
    EXPECT_TRUE(registry.has_parser(DiscoveryMessage::error_keyword));
    EXPECT_FALSE(registry.add_parser(DiscoveryMessage::result_keyword, PayloadParser()));
    EXPECT_EQ(default_reply_timeout(), std::chrono::milliseconds(15000));
}

} // namespace capdisc
