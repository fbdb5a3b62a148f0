#include "capdisc/discovery/capability.hpp"
#include "capdisc/discovery/discovery_client.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace capdisc
{

TEST(SetsEqualTest, IgnoresOrder)
{
    EXPECT_TRUE(DiscoveryClient::sets_equal({"A", "B", "C"}, {"C", "B", "A"}));
}

TEST(SetsEqualTest, SizeMismatchIsNotEqual)
{
    EXPECT_FALSE(DiscoveryClient::sets_equal({"A", "B"}, {"A", "B", "C"}));
    EXPECT_FALSE(DiscoveryClient::sets_equal({"A", "B", "C"}, {"A", "B"}));
}

TEST(SetsEqualTest, EmptySetsAreEqual)
{
    EXPECT_TRUE(DiscoveryClient::sets_equal({}, {}));
}

TEST(SetsEqualTest, IsReflexiveAndSymmetric)
{
    CapabilitySet first {feature::audio, feature::ice};
    CapabilitySet second {feature::ice, feature::video};

    EXPECT_TRUE(DiscoveryClient::sets_equal(first, first));
    EXPECT_EQ(DiscoveryClient::sets_equal(first, second), DiscoveryClient::sets_equal(second, first));
    EXPECT_FALSE(DiscoveryClient::sets_equal(first, second));
}

TEST(SetsEqualTest, IsCaseSensitive)
{
    EXPECT_FALSE(DiscoveryClient::sets_equal({"urn:ietf:rfc:5761"}, {"URN:IETF:RFC:5761"}));
}

TEST(SetsEqualTest, DuplicatesOnlyCountBySize)
{
    EXPECT_FALSE(DiscoveryClient::sets_equal({"A", "A"}, {"A", "B"}));
    EXPECT_TRUE(DiscoveryClient::sets_equal({"A", "A", "B"}, {"A", "B", "B"}));
    EXPECT_FALSE(DiscoveryClient::sets_equal({"A", "A"}, {"A"}));
}

TEST(DefaultCapabilitySetTest, ContainsBaselineFeatures)
{
    CapabilitySet expected {feature::audio, feature::video,    feature::ice,       feature::sctp,
                            feature::dtls,  feature::rtcp_mux, feature::rtp_bundle};

    EXPECT_TRUE(DiscoveryClient::sets_equal(DiscoveryClient::default_capability_set(), expected));
}

TEST(DefaultCapabilitySetTest, ExcludesExperimentalFeatures)
{
    const auto& defaults = DiscoveryClient::default_capability_set();

    EXPECT_FALSE(defaults.empty());
    EXPECT_FALSE(has_feature(defaults, feature::rtx));
    EXPECT_FALSE(has_feature(defaults, feature::opus_red));
    EXPECT_FALSE(has_feature(defaults, feature::lipsync));
    EXPECT_FALSE(has_feature(defaults, feature::jigasi));
    EXPECT_FALSE(has_feature(defaults, feature::audio_mute));
    for (const auto& token : defaults)
    {
        EXPECT_TRUE(is_known_feature(token)) << token;
    }
}

TEST(DefaultCapabilitySetTest, ReturnsSameInstance)
{
    const auto& first  = DiscoveryClient::default_capability_set();
    const auto& second = DiscoveryClient::default_capability_set();

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first, second);
}

TEST(DefaultCapabilitySetTest, ConcurrentAccessSeesOneCompleteSet)
{
    constexpr int thread_count = 16;
    std::vector<const CapabilitySet*> seen(thread_count, nullptr);
    std::vector<std::size_t> sizes(thread_count, 0);
    std::vector<std::thread> threads;

    for (int i = 0; i < thread_count; ++i)
    {
        threads.emplace_back(
            [i, &seen, &sizes]()
            {
                const auto& defaults = DiscoveryClient::default_capability_set();
                seen[i]              = &defaults;
                sizes[i]             = defaults.size();
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    for (int i = 0; i < thread_count; ++i)
    {
        EXPECT_EQ(seen[i], seen[0]);
        EXPECT_EQ(sizes[i], 7U);
    }
}

TEST(CapabilityTest, RecognizesKnownFeatures)
{
    EXPECT_TRUE(is_known_feature("urn:xmpp:jingle:apps:rtp:audio"));
    EXPECT_TRUE(is_known_feature("http://jitsi.org/protocol/audio-mute"));
    EXPECT_FALSE(is_known_feature("urn:example:experimental"));
    EXPECT_FALSE(is_known_feature(""));
}

TEST(CapabilityTest, HasFeature)
{
    CapabilitySet capabilities {feature::audio, feature::lipsync};

    EXPECT_TRUE(has_feature(capabilities, feature::lipsync));
    EXPECT_FALSE(has_feature(capabilities, feature::video));
}

} // namespace capdisc
