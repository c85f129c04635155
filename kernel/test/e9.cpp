#include <gtest/gtest.h>

#include <Lumen/drivers/e9.hpp>

TEST(E9Test, PresentWhenPortEchoesItsAddress) {
    ASSERT_TRUE(e9::is_present(0xE9));
}

TEST(E9Test, AbsentOnFloatingBus) {
    ASSERT_FALSE(e9::is_present(0xFF));
    ASSERT_FALSE(e9::is_present(0x00));
    ASSERT_FALSE(e9::is_present(0xE8));
}

TEST(E9Test, ProbeIsConstexpr) {
    static_assert(e9::is_present(e9::port_addr));
    static_assert(!e9::is_present(0xFF));
}
