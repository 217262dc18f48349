#include "adaptation_loop.hpp"

#include "layer_controller.hpp"
#include "mock_transport.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace sfuctl;
using namespace sfuctl::testing;
using namespace std::chrono_literals;

class AdaptationLoopTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        _start = Clock::now();
        _adaptation = std::make_unique<AdaptationLoop>(_loop);
        _sender = EnableSimulcast(*_connection, std::make_shared<FakeTrack>("video0"));
    }

    uint64_t TopLayerCap() const
    {
        return ConfiguredLayers(_sender->GetParameters().encodings)[0].maxBitrate.value();
    }

    std::shared_ptr<Loop> _loop = std::make_shared<Loop>();
    std::unique_ptr<AdaptationLoop> _adaptation;
    std::shared_ptr<::testing::NiceMock<MockConnection>> _connection = MakeConnection();
    std::shared_ptr<RtpSender> _sender;
    Clock::time_point _start;
};

TEST_F(AdaptationLoopTest, tickClampsToEstimate)
{
    _connection->Reports = {MakeOutboundReport(37500, 1.0)};

    EXPECT_TRUE(AdaptationLoop::Tick(*_connection));
    EXPECT_EQ(300000u, TopLayerCap());
}

TEST_F(AdaptationLoopTest, tickIgnoresRemoteAndInboundReports)
{
    auto remote = MakeOutboundReport(1250, 1.0);
    remote.isRemote = true;
    auto inbound = MakeOutboundReport(1250, 1.0);
    inbound.type = "inbound-rtp";
    _connection->Reports = {remote, inbound};

    EXPECT_TRUE(AdaptationLoop::Tick(*_connection));
    EXPECT_EQ(500000u, TopLayerCap());
}

TEST_F(AdaptationLoopTest, tickOnClosedConnectionIsSkipped)
{
    _connection->Close();

    EXPECT_FALSE(AdaptationLoop::Tick(*_connection));
    EXPECT_EQ(500000u, TopLayerCap());
}

TEST_F(AdaptationLoopTest, timerTicksEveryInterval)
{
    _connection->Reports = {MakeOutboundReport(50000, 1.0)};
    EXPECT_CALL(*_connection, GetStats()).Times(2);

    ASSERT_TRUE(_adaptation->Start(_connection));

    _loop->RunOnce(_start + 4s);
    _loop->RunOnce(_start + 6s);
    EXPECT_EQ(400000u, TopLayerCap());

    _loop->RunOnce(_start + 11s);
}

TEST_F(AdaptationLoopTest, startIsIdempotentPerConnection)
{
    EXPECT_TRUE(_adaptation->Start(_connection));
    EXPECT_FALSE(_adaptation->Start(_connection));
    EXPECT_EQ(1u, _adaptation->RunningCount());
    EXPECT_TRUE(_adaptation->IsRunning(_connection));
}

TEST_F(AdaptationLoopTest, stopCancelsTimer)
{
    EXPECT_CALL(*_connection, GetStats()).Times(0);

    _adaptation->Start(_connection);
    _adaptation->Stop(_connection);

    EXPECT_FALSE(_adaptation->IsRunning(_connection));
    _loop->RunOnce(_start + 6s);
}

TEST_F(AdaptationLoopTest, closedConnectionDoesNotStopOtherLoops)
{
    auto healthy = MakeConnection();
    auto healthySender = EnableSimulcast(*healthy, std::make_shared<FakeTrack>("video1"));
    healthy->Reports = {MakeOutboundReport(12500, 1.0)};
    _connection->Close();

    _adaptation->Start(_connection);
    _adaptation->Start(healthy);

    _loop->RunOnce(_start + 6s);
    _loop->RunOnce(_start + 11s);

    auto layers = ConfiguredLayers(healthySender->GetParameters().encodings);
    EXPECT_EQ(100000u, layers[0].maxBitrate.value());
    EXPECT_TRUE(_adaptation->IsRunning(_connection));
    EXPECT_EQ(500000u, TopLayerCap());
}

TEST_F(AdaptationLoopTest, destroyedConnectionStopsItsTimer)
{
    auto transient = MakeConnection();
    ASSERT_TRUE(_adaptation->Start(transient));
    transient.reset();

    EXPECT_NO_THROW(_loop->RunOnce(_start + 6s));
    EXPECT_EQ(0u, _adaptation->RunningCount());

    auto replacement = MakeConnection();
    EXPECT_TRUE(_adaptation->Start(replacement));
    EXPECT_TRUE(_adaptation->IsRunning(replacement));
}

TEST_F(AdaptationLoopTest, unboundedEstimateSaturatesCap)
{
    auto sender = _connection->AddTrack(std::make_shared<FakeTrack>("video1"), {});
    _connection->Reports = {MakeOutboundReport(std::numeric_limits<uint64_t>::max(), 1e-9)};

    EXPECT_TRUE(AdaptationLoop::Tick(*_connection));

    auto layers = ConfiguredLayers(sender->GetParameters().encodings);
    ASSERT_EQ(1u, layers.size());
    EXPECT_EQ(std::numeric_limits<uint64_t>::max(), layers[0].maxBitrate.value());
    EXPECT_EQ(500000u, TopLayerCap());
}

TEST_F(AdaptationLoopTest, closedSenderDoesNotFreezeLaterTicks)
{
    auto live = EnableSimulcast(*_connection, std::make_shared<FakeTrack>("video1"));
    _connection->Senders.front()->Closed = true;
    _connection->Reports = {MakeOutboundReport(50000, 1.0)};
    _adaptation->Start(_connection);

    _loop->RunOnce(_start + 6s);
    EXPECT_EQ(400000u, ConfiguredLayers(live->GetParameters().encodings)[0].maxBitrate.value());

    _connection->Reports = {MakeOutboundReport(25000, 1.0)};
    _loop->RunOnce(_start + 11s);
    EXPECT_EQ(200000u, ConfiguredLayers(live->GetParameters().encodings)[0].maxBitrate.value());
}
