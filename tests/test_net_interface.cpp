#include <gtest/gtest.h>

#include <tvscan/net_interface.hpp>

TEST(NetInterfaceTest, UnknownInterfaceIsInvalid) {
    EXPECT_FALSE(NetInterface{"tvscan-none0"}.valid());
    EXPECT_FALSE(NetInterface{""}.valid());
}

TEST(NetInterfaceTest, LoopbackIsValid) {
    EXPECT_TRUE(NetInterface{"lo"}.valid());
}
