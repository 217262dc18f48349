#include "participant_registry.hpp"

#include "mock_transport.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace sfuctl;
using namespace sfuctl::testing;

TEST(ParticipantRegistryTest, addThenRemoveClosesConnectionOnce)
{
    ParticipantRegistry registry;
    auto connection = MakeConnection();
    EXPECT_CALL(*connection, Close()).Times(1);

    registry.Add("alice", connection);
    EXPECT_TRUE(registry.Contains("alice"));

    auto removed = registry.Remove("alice");
    ASSERT_NE(nullptr, removed);
    EXPECT_TRUE(removed->IsClosed());
    EXPECT_FALSE(registry.Contains("alice"));

    removed->Close();
}

TEST(ParticipantRegistryTest, removeUnknownIsNoop)
{
    ParticipantRegistry registry;
    EXPECT_EQ(nullptr, registry.Remove("nobody"));
    EXPECT_EQ(0u, registry.Size());
}

TEST(ParticipantRegistryTest, rejectsEmptyId)
{
    ParticipantRegistry registry;
    EXPECT_THROW(registry.Add("", MakeConnection()), std::invalid_argument);
}

TEST(ParticipantRegistryTest, rejectsMissingConnection)
{
    ParticipantRegistry registry;
    EXPECT_THROW(registry.Add("alice", nullptr), std::invalid_argument);
}

TEST(ParticipantRegistryTest, rejectsDuplicateId)
{
    ParticipantRegistry registry;
    auto first = MakeConnection();
    registry.Add("alice", first);

    try {
        registry.Add("alice", MakeConnection());
        FAIL() << "duplicate id accepted";
    } catch (const RtcError& e) {
        EXPECT_EQ(RtcErrorCode::InvalidState, e.Code());
    }
    EXPECT_EQ(first, registry.Find("alice")->GetConnection());
}

TEST(ParticipantRegistryTest, closeDetachesTrackCallback)
{
    ParticipantRegistry registry;
    auto connection = MakeConnection();
    registry.Add("alice", connection);
    connection->Callback = [](std::shared_ptr<MediaTrack>, StreamList) {};

    registry.Remove("alice");
    EXPECT_FALSE(connection->Callback);
}

TEST(ParticipantRegistryTest, closeFailureIsContained)
{
    ParticipantRegistry registry;
    auto connection = MakeConnection();
    EXPECT_CALL(*connection, Close()).WillOnce(::testing::Throw(RtcError(RtcErrorCode::InternalError)));

    registry.Add("alice", connection);
    EXPECT_NO_THROW(registry.Remove("alice"));
    EXPECT_FALSE(registry.Contains("alice"));
}
