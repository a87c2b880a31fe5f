#include <gtest/gtest.h>

#include "logging.h"

using namespace aranet;

TEST(LoggingTest, HexDump) {
    EXPECT_EQ(to_hex({0x05, 0xC9, 0x01, 0xB4}), "05 C9 01 B4");
    EXPECT_EQ(to_hex({}), "");
}

TEST(LoggingTest, DebugSwitch) {
    set_debug_enabled(true);
    EXPECT_TRUE(debug_enabled());
    set_debug_enabled(false);
    EXPECT_FALSE(debug_enabled());
}
