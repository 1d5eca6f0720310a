#include <votefee/network.hpp>

#include <gtest/gtest.h>

TEST(network, mainnet)
{
    const auto network = votefee::network_id::mainnet();
    EXPECT_TRUE(network.is_mainnet());
    EXPECT_EQ(1u, network.address_tag());
    EXPECT_EQ("mainnet", network.to_string());
}

TEST(network, testnet)
{
    const auto network = votefee::network_id::testnet(1097911063);
    EXPECT_FALSE(network.is_mainnet());
    EXPECT_EQ(1097911063u, network.magic());
    EXPECT_EQ(0u, network.address_tag());
    EXPECT_EQ("testnet 1097911063", network.to_string());
}

TEST(network, equality)
{
    EXPECT_EQ(votefee::network_id::mainnet(), votefee::network_id::mainnet());
    EXPECT_EQ(votefee::network_id::testnet(42),
        votefee::network_id::testnet(42));
    EXPECT_NE(votefee::network_id::testnet(42),
        votefee::network_id::testnet(43));
    EXPECT_NE(votefee::network_id::mainnet(),
        votefee::network_id::testnet(0));
}
