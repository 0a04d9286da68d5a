#include <gtest/gtest.h>
#include "connection_manager.hpp"
#include "metrics.hpp"

using namespace auvctl;

class ConnectionManagerTest : public ::testing::Test {
protected:
    ConnectionManager cm{"test_salt"};
};

TEST_F(ConnectionManagerTest, BlindId) {
    std::string id = "192.0.2.10";
    std::string blinded = cm.blind_id(id);
    EXPECT_NE(id, blinded);
    EXPECT_EQ(blinded.length(), 64u);
    EXPECT_EQ(blinded, cm.blind_id(id));
    EXPECT_NE(blinded, ConnectionManager("other_salt").blind_id(id));
}

TEST_F(ConnectionManagerTest, StartsEmpty) {
    EXPECT_EQ(cm.connection_count(), 0u);
    EXPECT_EQ(cm.connection_count_for_ip("127.0.0.1"), 0u);
}

TEST_F(ConnectionManagerTest, PerIpCap) {
    EXPECT_TRUE(cm.try_acquire("192.0.2.10", 2, 100));
    EXPECT_TRUE(cm.try_acquire("192.0.2.10", 2, 100));
    EXPECT_FALSE(cm.try_acquire("192.0.2.10", 2, 100));
    EXPECT_TRUE(cm.try_acquire("192.0.2.11", 2, 100));

    EXPECT_EQ(cm.connection_count_for_ip("192.0.2.10"), 2u);
    EXPECT_EQ(cm.connection_count(), 3u);
}

TEST_F(ConnectionManagerTest, GlobalCap) {
    EXPECT_TRUE(cm.try_acquire("192.0.2.1", 5, 2));
    EXPECT_TRUE(cm.try_acquire("192.0.2.2", 5, 2));
    EXPECT_FALSE(cm.try_acquire("192.0.2.3", 5, 2));
    EXPECT_EQ(cm.connection_count_for_ip("192.0.2.3"), 0u);
}

TEST_F(ConnectionManagerTest, ReleaseFreesSlotAndForgetsAddress) {
    ASSERT_TRUE(cm.try_acquire("192.0.2.10", 1, 100));
    EXPECT_FALSE(cm.try_acquire("192.0.2.10", 1, 100));

    cm.release("192.0.2.10");
    EXPECT_EQ(cm.connection_count(), 0u);
    EXPECT_EQ(cm.tracked_addresses(), 0u);
    EXPECT_TRUE(cm.try_acquire("192.0.2.10", 1, 100));
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("active_connections"), 1.0);
}

TEST_F(ConnectionManagerTest, ReleaseOfUnknownAddressIsIgnored) {
    cm.release("203.0.113.1");
    EXPECT_EQ(cm.connection_count(), 0u);
}
