#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "app/video/FrameSource.hpp"
#include "app/video/StreamReceiver.hpp"
#include "Devices/network_interface/UdpServer.hpp"
#include "Modules/RcStreamServer.hpp"

using Vision::CompleteFrame;
using Vision::StreamReceiver;


namespace {
class CountingFrameSource : public Vision::FrameSource {
public:
    explicit CountingFrameSource(std::size_t size) : m_Size(size) {}

    int open() override { return 0; }
    int close() override { return 0; }

    std::optional<std::vector<uint8_t>> captureFrame() override {
        std::vector<uint8_t> frame(m_Size);
        for (std::size_t i = 0; i < m_Size; i++) {
            frame[i] = static_cast<uint8_t>(i % 251);
        }
        return frame;
    }

private:
    std::size_t m_Size;
};

Config::ClientConfig clientFor(unsigned short port) {
    Config::ClientConfig client;
    client.host = "127.0.0.1";
    client.port = port;
    client.handshakeTimeoutMs = 500;
    client.readTimeoutMs = 100;
    client.keepAliveMs = 100;
    client.maxHandshakeAttempts = 3;
    client.retryBackoffMs = 20;
    return client;
}
}


class LoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.maxFps = 30;
        config.readTimeoutMs = 50;
        config.sessionTimeoutMs = 500;

        m_Server = std::make_unique<Modules::StreamServer>(Modules::STREAM_SERVER, "LoopbackServer", config,
                                                           std::make_shared<CountingFrameSource>(5000));
        ASSERT_EQ(0, m_Server->init());
        ASSERT_EQ(0, m_Server->trigger());
        m_Port = m_Server->localEndpoint().port();
        ASSERT_NE(0, m_Port);
    }

    void TearDown() override {
        m_Server->stop();
    }

    std::unique_ptr<Modules::StreamServer> m_Server;
    unsigned short m_Port = 0;
};


TEST_F(LoopbackTest, FramesArriveIntactAndStreamEnds) {
    std::atomic<bool> running{true};
    StreamReceiver rx(clientFor(m_Port), std::chrono::milliseconds(1000));

    std::promise<CompleteFrame> first;
    std::atomic<bool> delivered{false};
    rx.onFrame.connect([&](const CompleteFrame& frame) {
        if (!delivered.exchange(true)) {
            first.set_value(frame);
        }
    });

    std::promise<void> ended;
    rx.onStreamEnd.connect([&]() { ended.set_value(); });

    auto exit = std::async(std::launch::async, [&]() {
        if (rx.connect(running) < 0) {
            return StreamReceiver::ExitReason::NotConnected;
        }
        return rx.run(running);
    });

    auto frameFuture = first.get_future();
    ASSERT_EQ(std::future_status::ready, frameFuture.wait_for(std::chrono::seconds(5)));
    const CompleteFrame frame = frameFuture.get();

    ASSERT_TRUE(frame.data);
    ASSERT_EQ(5000u, frame.data->size());
    for (std::size_t i = 0; i < frame.data->size(); i++) {
        ASSERT_EQ(static_cast<uint8_t>(i % 251), (*frame.data)[i]) << i;
    }
    EXPECT_EQ(StreamReceiver::State::Connected, rx.state());

    // Keep-alive PINGs hold the session past the inactivity timeout
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    EXPECT_EQ(1u, m_Server->sessions().count());

    m_Server->stop();
    ASSERT_EQ(std::future_status::ready, exit.wait_for(std::chrono::seconds(5)));
    EXPECT_EQ(StreamReceiver::ExitReason::StreamEnded, exit.get());
    EXPECT_EQ(std::future_status::ready, ended.get_future().wait_for(std::chrono::seconds(0)));

    const StreamReceiver::Stats stats = rx.stats();
    EXPECT_GT(stats.framesDelivered, 1u);
    EXPECT_GT(stats.pingsSent, 0u);
    rx.disconnect();
}


TEST_F(LoopbackTest, DisconnectUnregistersViewer) {
    std::atomic<bool> running{true};
    StreamReceiver rx(clientFor(m_Port), std::chrono::milliseconds(1000));
    ASSERT_EQ(0, rx.connect(running));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (m_Server->sessions().count() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(1u, m_Server->sessions().count());

    rx.disconnect();
    const auto gone = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (m_Server->sessions().count() > 0 && std::chrono::steady_clock::now() < gone) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(0u, m_Server->sessions().count());
    EXPECT_EQ(StreamReceiver::State::Disconnected, rx.state());
}


TEST_F(LoopbackTest, ClearingRunningStopsReceiver) {
    std::atomic<bool> running{true};
    StreamReceiver rx(clientFor(m_Port), std::chrono::milliseconds(1000));
    ASSERT_EQ(0, rx.connect(running));

    auto exit = std::async(std::launch::async, [&]() { return rx.run(running); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    running.store(false);

    ASSERT_EQ(std::future_status::ready, exit.wait_for(std::chrono::seconds(2)));
    EXPECT_EQ(StreamReceiver::ExitReason::Stopped, exit.get());
    rx.disconnect();
}


TEST(ReceiverHandshake, GivesUpAfterAttemptBudget) {
    // Bound but never answers
    Network::UdpServer silent("127.0.0.1", 0, 0);

    Config::ClientConfig client = clientFor(silent.localEndpoint().port());
    client.handshakeTimeoutMs = 100;
    client.maxHandshakeAttempts = 2;

    std::atomic<bool> running{true};
    StreamReceiver rx(client, std::chrono::milliseconds(1000));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(-1, rx.connect(running));
    EXPECT_EQ(StreamReceiver::State::Disconnected, rx.state());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_EQ(StreamReceiver::ExitReason::NotConnected, rx.run(running));
}
