#include <gtest/gtest.h>
#include "server/handshake_controller.hpp"
#include "server/pre_ready_buffer.hpp"
#include <vector>

using namespace livegate;

TEST(PreReadyBufferTest, DefaultCapacityIsEight) {
    PreReadyBuffer buffer;
    EXPECT_EQ(buffer.capacity(), 8u);
    EXPECT_EQ(buffer.size(), 0u);
}

TEST(PreReadyBufferTest, DrainsInArrivalOrder) {
    PreReadyBuffer buffer;
    EXPECT_TRUE(buffer.offer("a"));
    EXPECT_TRUE(buffer.offer("b"));
    EXPECT_TRUE(buffer.offer("c"));

    std::vector<std::string> out;
    auto n = buffer.drain_to([&out](std::string chunk) { out.push_back(std::move(chunk)); });

    EXPECT_EQ(n, 3u);
    EXPECT_EQ(out, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(buffer.size(), 0u);
}

TEST(PreReadyBufferTest, DropsWhenFull) {
    PreReadyBuffer buffer(2);
    EXPECT_TRUE(buffer.offer("1"));
    EXPECT_TRUE(buffer.offer("2"));
    EXPECT_FALSE(buffer.offer("3"));
    EXPECT_FALSE(buffer.offer("4"));

    EXPECT_EQ(buffer.size(), 2u);
    EXPECT_EQ(buffer.dropped(), 2u);

    std::vector<std::string> out;
    buffer.drain_to([&out](std::string chunk) { out.push_back(std::move(chunk)); });
    EXPECT_EQ(out, (std::vector<std::string>{"1", "2"}));
}

TEST(PreReadyBufferTest, InertAfterDrain) {
    PreReadyBuffer buffer;
    buffer.offer("early");

    int calls = 0;
    auto count = [&calls](std::string) { ++calls; };
    EXPECT_EQ(buffer.drain_to(count), 1u);
    EXPECT_TRUE(buffer.drained());

    EXPECT_FALSE(buffer.offer("late"));
    EXPECT_EQ(buffer.drain_to(count), 0u);
    EXPECT_EQ(calls, 1);
}

TEST(PreReadyBufferTest, ZeroCapacityDropsEverything) {
    PreReadyBuffer buffer(0);
    EXPECT_FALSE(buffer.offer("x"));
    EXPECT_EQ(buffer.dropped(), 1u);
}

TEST(HandshakeControllerTest, ReadyExactlyOnce) {
    HandshakeController handshake({"models/m", "hi"});
    EXPECT_FALSE(handshake.is_ready());
    EXPECT_FALSE(handshake.setup_sent());

    auto setup = handshake.build_setup_message();
    EXPECT_EQ(setup, upstream::build_setup_message({"models/m", "hi"}));
    EXPECT_TRUE(handshake.setup_sent());
    EXPECT_FALSE(handshake.is_ready());

    EXPECT_TRUE(handshake.mark_ready());
    EXPECT_TRUE(handshake.is_ready());
    EXPECT_FALSE(handshake.mark_ready());
    EXPECT_TRUE(handshake.is_ready());
}
