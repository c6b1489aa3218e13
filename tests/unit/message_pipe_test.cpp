#include <lolite/ipc/message_pipe.h>
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstdint>
#include <cstring>
#include <numeric>
#include <optional>
#include <chrono>
#include <thread>
#include <vector>

using lolite::ipc::MessagePipe;

// ------------------------------------------------------------------
// 1. Create pair and send/receive bytes
// ------------------------------------------------------------------

TEST(MessagePipeTest, CreatePairAndSendReceive) {
    auto [a, b] = MessagePipe::create_pair();

    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    ASSERT_TRUE(a.send(data));

    auto received = b.receive();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, data);
}

TEST(MessagePipeTest, FramesKeepTheirBoundaries) {
    auto [a, b] = MessagePipe::create_pair();

    for (uint8_t i = 0; i < 10; ++i) {
        std::vector<uint8_t> data(i + 1, i);
        ASSERT_TRUE(a.send(data));
    }

    for (uint8_t i = 0; i < 10; ++i) {
        auto received = b.receive();
        ASSERT_TRUE(received.has_value());
        EXPECT_EQ(*received, std::vector<uint8_t>(i + 1, i));
    }
}

TEST(MessagePipeTest, SendEmptyPayload) {
    auto [a, b] = MessagePipe::create_pair();

    ASSERT_TRUE(a.send(nullptr, 0));

    auto received = b.receive();
    ASSERT_TRUE(received.has_value());
    EXPECT_TRUE(received->empty());
}

// ------------------------------------------------------------------
// 2. Large payload crosses the socket buffer from another thread
// ------------------------------------------------------------------

TEST(MessagePipeTest, SendLargePayloadFromThread) {
    auto [a, b] = MessagePipe::create_pair();

    std::vector<uint8_t> large_data(1024 * 1024);
    std::iota(large_data.begin(), large_data.end(), static_cast<uint8_t>(0));

    std::thread sender([&a = a, &large_data]() { EXPECT_TRUE(a.send(large_data)); });
    auto received = b.receive();
    sender.join();

    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, large_data);
}

// ------------------------------------------------------------------
// 3. Closed and shut down ends
// ------------------------------------------------------------------

TEST(MessagePipeTest, CloseOneEndReceiveReturnsNullopt) {
    auto [a, b] = MessagePipe::create_pair();

    a.close();
    EXPECT_FALSE(a.is_open());
    EXPECT_FALSE(b.receive().has_value());
}

TEST(MessagePipeTest, SendToClosedPeerFailsWithoutSignal) {
    auto [a, b] = MessagePipe::create_pair();

    b.close();
    std::vector<uint8_t> data(4096, 7);
    // The first send may still be buffered; a later one sees EPIPE.
    bool failed = false;
    for (int i = 0; i < 16 && !failed; ++i) {
        failed = !a.send(data);
    }
    EXPECT_TRUE(failed);
}

TEST(MessagePipeTest, ShutdownWakesBlockedReceiver) {
    auto [a, b] = MessagePipe::create_pair();

    std::thread reader([&b = b]() { EXPECT_FALSE(b.receive().has_value()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    b.shutdown();
    reader.join();

    EXPECT_TRUE(b.is_open());
}

TEST(MessagePipeTest, OversizedFrameIsRejected) {
    auto [a, b] = MessagePipe::create_pair();

    uint32_t bogus = htonl(MessagePipe::kMaxFrameSize + 1);
    ASSERT_EQ(::write(a.fd(), &bogus, sizeof(bogus)), static_cast<ssize_t>(sizeof(bogus)));

    EXPECT_FALSE(b.receive().has_value());
}

// ------------------------------------------------------------------
// 4. Descriptor ownership
// ------------------------------------------------------------------

TEST(MessagePipeTest, MoveTransfersDescriptor) {
    auto [a, b] = MessagePipe::create_pair();
    int fd = a.fd();

    MessagePipe moved(std::move(a));
    EXPECT_EQ(moved.fd(), fd);
    EXPECT_FALSE(a.is_open());
}

TEST(MessagePipeTest, ReleaseGivesUpOwnership) {
    auto [a, b] = MessagePipe::create_pair();

    int fd = a.release();
    EXPECT_FALSE(a.is_open());

    MessagePipe adopted(fd);
    std::vector<uint8_t> data = {9};
    ASSERT_TRUE(adopted.send(data));
    EXPECT_EQ(b.receive(), std::optional<std::vector<uint8_t>>(data));
}

TEST(MessagePipeTest, EndsAreCloseOnExecUntilMadeInheritable) {
    auto [a, b] = MessagePipe::create_pair();

    EXPECT_TRUE(::fcntl(a.fd(), F_GETFD) & FD_CLOEXEC);
    ASSERT_TRUE(lolite::ipc::set_inheritable(a.fd()));
    EXPECT_FALSE(::fcntl(a.fd(), F_GETFD) & FD_CLOEXEC);
}
