#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fake_socket.hpp"

#include "app/video/FrameSource.hpp"
#include "app/video/VideoProtocol.hpp"
#include "Devices/RegisterMap.hpp"
#include "Modules/RcStreamServer.hpp"

using Vision::Protocol::PacketHeader;


namespace {
class StaticFrameSource : public Vision::FrameSource {
public:
    explicit StaticFrameSource(std::vector<uint8_t> frame) : m_Frame(std::move(frame)) {}

    int open() override {
        m_Opened = true;
        return 0;
    }

    int close() override {
        m_Opened = false;
        return 0;
    }

    std::optional<std::vector<uint8_t>> captureFrame() override {
        return m_Frame;
    }

    std::atomic<bool> m_Opened{false};

private:
    std::vector<uint8_t> m_Frame;
};

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

bool isVideo(const FakeSocket::Datagram& d) {
    return !Vision::Protocol::parseControlMessage(d.bytes.data(), d.bytes.size()).has_value();
}
}


class StreamServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_Config.chunkSize = 4;
        m_Config.readTimeoutMs = 20;
        m_Config.pacing = false;

        auto socket = std::make_unique<FakeSocket>();
        m_Socket = socket.get();
        m_Server = std::make_unique<Modules::StreamServer>(Modules::STREAM_SERVER, "TestServer", m_Config,
                                                           nullptr, std::move(socket));
    }

    void connect(const udp::endpoint& peer) {
        const std::string msg = "CONNECT";
        m_Server->handleControlDatagram(reinterpret_cast<const uint8_t*>(msg.data()), msg.size(), peer);
    }

    void control(const std::string& msg, const udp::endpoint& peer) {
        m_Server->handleControlDatagram(reinterpret_cast<const uint8_t*>(msg.data()), msg.size(), peer);
    }

    Config::ServerConfig m_Config;
    FakeSocket* m_Socket = nullptr;
    std::unique_ptr<Modules::StreamServer> m_Server;
};


TEST_F(StreamServerTest, ConnectIsAnsweredAtSourceAddress) {
    const auto peer = makeEndpoint("1.2.3.4", 5000);
    connect(peer);

    const auto sent = m_Socket->sent();
    ASSERT_EQ(1u, sent.size());
    EXPECT_EQ(peer, sent[0].peer);
    EXPECT_EQ("CONNECTED", sent[0].text());
    EXPECT_TRUE(m_Server->sessions().contains(peer));
}


TEST_F(StreamServerTest, RepeatedConnectKeepsOneSession) {
    const auto peer = makeEndpoint("1.2.3.4", 5000);
    connect(peer);
    connect(peer);

    EXPECT_EQ(1u, m_Server->sessions().count());
    EXPECT_EQ(2u, m_Socket->sentTo(peer).size());
}


TEST_F(StreamServerTest, BroadcastReachesOnlyRegisteredPeer) {
    const auto peer = makeEndpoint("1.2.3.4", 5000);
    connect(peer);
    m_Socket->clearSent();

    EXPECT_EQ(1, m_Server->broadcastFrame(bytesOf("ABCDEFGHIJ")));

    const auto sent = m_Socket->sent();
    ASSERT_EQ(3u, sent.size());

    const std::vector<std::string> payloads = {"ABCD", "EFGH", "IJ"};
    for (std::size_t i = 0; i < sent.size(); i++) {
        EXPECT_EQ(peer, sent[i].peer);
        auto h = PacketHeader::decode(sent[i].bytes.data(), sent[i].bytes.size());
        ASSERT_TRUE(h.has_value());
        EXPECT_EQ(1, h->frameID);
        EXPECT_EQ(3, h->totalChunks);
        EXPECT_EQ(i, h->chunkID);
        EXPECT_EQ(payloads[i], std::string(sent[i].bytes.begin() + Vision::Protocol::HeaderSize, sent[i].bytes.end()));
    }

    const auto stats = m_Server->stats();
    EXPECT_EQ(1u, stats.framesSent);
    EXPECT_EQ(10u, stats.bytesSent);
    EXPECT_EQ(3u, stats.datagramsSent);
}


TEST_F(StreamServerTest, NoPeersNoTraffic) {
    EXPECT_EQ(0, m_Server->broadcastFrame(bytesOf("ABCDEFGHIJ")));
    EXPECT_TRUE(m_Socket->sent().empty());
    EXPECT_EQ(0u, m_Server->stats().framesSent);
}


TEST_F(StreamServerTest, FailingPeerDoesNotStopOthers) {
    const auto bad = makeEndpoint("10.0.0.1", 6000);
    const auto good = makeEndpoint("10.0.0.2", 6000);
    connect(bad);
    connect(good);
    m_Socket->failFor(bad);
    m_Socket->clearSent();

    EXPECT_EQ(1, m_Server->broadcastFrame(bytesOf("ABCDEFGHIJ")));
    EXPECT_EQ(3u, m_Socket->sentTo(good).size());
    EXPECT_FALSE(m_Server->sessions().contains(bad));
    EXPECT_TRUE(m_Server->sessions().contains(good));
    EXPECT_EQ(1u, m_Server->stats().sendFailures);
}


TEST_F(StreamServerTest, FrameIdsStartAtOneAndIncrease) {
    const auto peer = makeEndpoint("1.2.3.4", 5000);
    connect(peer);
    m_Socket->clearSent();

    m_Server->broadcastFrame(bytesOf("AB"));
    m_Server->broadcastFrame(bytesOf("CD"));

    const auto sent = m_Socket->sent();
    ASSERT_EQ(2u, sent.size());
    EXPECT_EQ(1, PacketHeader::decode(sent[0].bytes.data(), sent[0].bytes.size())->frameID);
    EXPECT_EQ(2, PacketHeader::decode(sent[1].bytes.data(), sent[1].bytes.size())->frameID);
}


TEST_F(StreamServerTest, PingIsAnsweredWithPong) {
    const auto peer = makeEndpoint("1.2.3.4", 5000);
    connect(peer);
    m_Socket->clearSent();

    control("PING", peer);
    const auto sent = m_Socket->sent();
    ASSERT_EQ(1u, sent.size());
    EXPECT_EQ("PONG", sent[0].text());
    EXPECT_EQ(peer, sent[0].peer);
}


TEST_F(StreamServerTest, DisconnectRemovesPeer) {
    const auto peer = makeEndpoint("1.2.3.4", 5000);
    connect(peer);
    control("DISCONNECT", peer);

    EXPECT_EQ(0u, m_Server->sessions().count());
    m_Socket->clearSent();
    EXPECT_EQ(0, m_Server->broadcastFrame(bytesOf("ABCDEFGHIJ")));
    EXPECT_TRUE(m_Socket->sent().empty());
}


TEST_F(StreamServerTest, GarbageIsIgnored) {
    const auto peer = makeEndpoint("1.2.3.4", 5000);
    control("HELLO", peer);
    control("connect", peer);

    EXPECT_TRUE(m_Socket->sent().empty());
    EXPECT_EQ(0u, m_Server->sessions().count());
    EXPECT_EQ(2u, m_Server->stats().ignoredPackets);
}


TEST_F(StreamServerTest, StopSendsStreamEnd) {
    const auto a = makeEndpoint("10.0.0.1", 6000);
    const auto b = makeEndpoint("10.0.0.2", 6000);
    connect(a);
    connect(b);
    m_Socket->clearSent();

    EXPECT_EQ(0, m_Server->stop());

    ASSERT_EQ(1u, m_Socket->sentTo(a).size());
    EXPECT_EQ("STREAM_END", m_Socket->sentTo(a)[0].text());
    ASSERT_EQ(1u, m_Socket->sentTo(b).size());
    EXPECT_EQ("STREAM_END", m_Socket->sentTo(b)[0].text());
    EXPECT_EQ(0u, m_Server->sessions().count());
    EXPECT_TRUE(m_Socket->closed());

    // Second stop is a no-op
    EXPECT_EQ(0, m_Server->stop());
    EXPECT_EQ(2u, m_Socket->sent().size());
}


TEST(StreamServerLoops, ServesAndEvictsSilentPeers) {
    Config::ServerConfig config;
    config.chunkSize = 4;
    config.readTimeoutMs = 20;
    config.maxFps = 100;
    config.sessionTimeoutMs = 300;
    config.pacing = false;

    auto socket = std::make_unique<FakeSocket>();
    FakeSocket* fake = socket.get();
    auto source = std::make_shared<StaticFrameSource>(bytesOf("ABCDEFGHIJ"));

    Modules::StreamServer server(Modules::STREAM_SERVER, "LoopServer", config, source, std::move(socket));
    ASSERT_EQ(0, server.init());
    EXPECT_TRUE(source->m_Opened.load());
    ASSERT_EQ(0, server.trigger());
    EXPECT_EQ(Network::toString(server.localEndpoint()),
              RegisterMap::getInstance()->get<std::string>(RegisterMap::RegisterKeys::ServerEndpoint).value_or(""));

    const auto peer = makeEndpoint("192.168.0.9", 7000);
    fake->inject("CONNECT", peer);

    // Handshake answer, then at least two whole frames
    ASSERT_TRUE(fake->waitForSent([&](const std::vector<FakeSocket::Datagram>& sent) {
        std::size_t video = 0;
        for (const auto& d : sent) {
            if (d.peer == peer && isVideo(d)) {
                video++;
            }
        }
        return video >= 6;
    }, std::chrono::seconds(3)));
    EXPECT_EQ("CONNECTED", fake->sentTo(peer).front().text());
    EXPECT_EQ(1, RegisterMap::getInstance()->get<int64_t>(RegisterMap::RegisterKeys::ActivePeers).value_or(-1));

    // No PING follows, so the peer is evicted
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (server.sessions().count() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(0u, server.sessions().count());

    EXPECT_EQ(0, server.stop());
    EXPECT_FALSE(source->m_Opened.load());
    EXPECT_TRUE(fake->closed());
}
