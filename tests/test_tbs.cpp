#include <gtest/gtest.h>
#include <set>
#include <vector>

#include "call/tbs_manager.hpp"
#include "gatt/loopback_gatt.hpp"
#include "proto/codec.hpp"

using namespace call;
using gatt::CharId;
using gatt::ControlResult;

namespace
{
struct RecordingTelephony : ITelephony
{
    bool supports(CallCommand cmd) const override { return supported.count(cmd) != 0; }
    bool execute(CallCommand cmd) override
    {
        seen.push_back(cmd);
        return true;
    }
    std::set<CallCommand>    supported{CallCommand::Accept, CallCommand::Reject, CallCommand::End};
    std::vector<CallCommand> seen;
};

const char *DEV = "AA:BB:CC:DD:EE:FF";

CallMetadata incoming(const char *id)
{
    CallMetadata m;
    m.state        = CallState::Incoming;
    m.phone_number = "+15551234567";
    m.caller_name  = "Incoming Call";
    m.call_id      = id;
    m.is_incoming  = true;
    return m;
}

struct TbsFixture : ::testing::Test
{
    TbsFixture() : tbs(server, phone) {}

    void SetUp() override
    {
        ASSERT_TRUE(server.open({tbs.service_definition()}, gatt::ServerCallbacks{}));
        tbs.seed_values();
        reg.add(DEV);
    }

    std::vector<CharId> sent_ids() const
    {
        std::vector<CharId> out;
        for (const auto &s : server.sent())
            out.push_back(s.id);
        return out;
    }

    gatt::LoopbackGattServer server;
    RecordingTelephony       phone;
    gatt::DeviceRegistry     reg;
    TbsManager               tbs;
};
}  // namespace

TEST_F(TbsFixture, SeededIdle)
{
    EXPECT_EQ(*server.value(CharId::CallState), codec::encode_call_state(CallState::Idle));
    EXPECT_EQ(codec::decode_string(*server.value(CharId::FriendlyName)), "No Active Call");
}

TEST_F(TbsFixture, IncomingCallSendsStateAndNumber)
{
    tbs.update(incoming("call_1"), reg);
    EXPECT_EQ(sent_ids(), (std::vector<CharId>{CharId::CallState, CharId::FriendlyName}));
    EXPECT_EQ(server.sent()[0].value, (gatt::Bytes{0x01, 0x01, 0x00}));
    EXPECT_EQ(codec::decode_string(server.sent()[1].value), "+15551234567");
}

TEST_F(TbsFixture, NewCallIdForcesResend)
{
    tbs.update(incoming("call_1"), reg);
    CallMetadata ended = incoming("call_1");
    ended.state              = CallState::Idle;
    ended.termination_reason = TerminationReason::NoAnswer;
    tbs.update(ended, reg);
    server.clear_sent();

    // same bytes as the first call, different id
    tbs.update(incoming("call_2"), reg);
    EXPECT_EQ(sent_ids(), (std::vector<CharId>{CharId::CallState, CharId::FriendlyName}));
}

TEST_F(TbsFixture, SameCallSameValuesIsQuiet)
{
    tbs.update(incoming("call_1"), reg);
    server.clear_sent();
    tbs.update(incoming("call_1"), reg);
    EXPECT_TRUE(server.sent().empty());
}

TEST_F(TbsFixture, EndingEmitsTerminationThenNameThenIdle)
{
    CallMetadata active = incoming("call_1");
    active.state        = CallState::Active;
    tbs.update(active, reg);
    server.clear_sent();

    CallMetadata ended       = active;
    ended.state              = CallState::Idle;
    ended.termination_reason = TerminationReason::Unknown;
    tbs.update(ended, reg);

    ASSERT_EQ(sent_ids(), (std::vector<CharId>{CharId::TerminationReason, CharId::FriendlyName,
                                               CharId::CallState}));
    EXPECT_EQ(server.sent()[0].value, (gatt::Bytes{0x01, 0x00}));
    EXPECT_EQ(codec::decode_string(server.sent()[1].value), "+15551234567");
    EXPECT_EQ(server.sent()[2].value, (gatt::Bytes{0x01, 0x00, 0x00}));

    // the final name stays readable after the call
    EXPECT_EQ(codec::decode_string(*server.value(CharId::FriendlyName)), "+15551234567");
}

TEST_F(TbsFixture, IdleSnapshotAfterEndedCallOnlyReachesNewDevice)
{
    CallMetadata active = incoming("call_1");
    active.state        = CallState::Active;
    tbs.update(active, reg);
    CallMetadata ended       = active;
    ended.state              = CallState::Idle;
    ended.termination_reason = TerminationReason::Unknown;
    tbs.update(ended, reg);
    server.clear_sent();

    const char *NEW_DEV = "11:22:33:44:55:66";
    reg.add(NEW_DEV);
    reg.mark_recent(NEW_DEV);
    tbs.publish_snapshot(reg);

    EXPECT_TRUE(server.sent_to(DEV, CharId::FriendlyName).empty());
    EXPECT_TRUE(server.sent_to(DEV, CharId::CallState).empty());
    EXPECT_EQ(codec::decode_string(server.sent_to(NEW_DEV, CharId::FriendlyName).front()),
              "+15551234567");
    EXPECT_EQ(server.sent_to(NEW_DEV, CharId::CallState).front(), (gatt::Bytes{0x01, 0x00, 0x00}));
}

TEST_F(TbsFixture, ExactlyOneTerminationPerEnding)
{
    tbs.update(incoming("call_1"), reg);
    CallMetadata ended       = incoming("call_1");
    ended.state              = CallState::Idle;
    ended.termination_reason = TerminationReason::NoAnswer;
    tbs.update(ended, reg);
    tbs.update(ended, reg);  // repeated IDLE report

    EXPECT_EQ(server.sent_to(DEV, CharId::TerminationReason).size(), 1u);
}

TEST_F(TbsFixture, SnapshotForNewDevice)
{
    CallMetadata active = incoming("call_1");
    active.state        = CallState::Active;
    active.caller_name  = "Jane Doe";
    tbs.update(active, reg);
    server.clear_sent();

    const char *NEW_DEV = "11:22:33:44:55:66";
    reg.add(NEW_DEV);
    reg.mark_recent(NEW_DEV);
    tbs.publish_snapshot(reg);

    EXPECT_TRUE(server.sent_to(DEV, CharId::CallState).empty());
    EXPECT_EQ(server.sent_to(NEW_DEV, CharId::CallState).front(), (gatt::Bytes{0x01, 0x04, 0x00}));
    EXPECT_EQ(codec::decode_string(server.sent_to(NEW_DEV, CharId::FriendlyName).front()),
              "Jane Doe");
}

TEST_F(TbsFixture, ControlPoint)
{
    EXPECT_EQ(tbs.handle_control_point({opcode::ACCEPT}), ControlResult::Dispatched);
    EXPECT_EQ(tbs.handle_control_point({opcode::TERMINATE, 0x01}), ControlResult::Dispatched);
    EXPECT_EQ(tbs.handle_control_point({opcode::END}), ControlResult::Dispatched);
    EXPECT_EQ(phone.seen,
              (std::vector<CallCommand>{CallCommand::Accept, CallCommand::Reject, CallCommand::End}));

    EXPECT_EQ(tbs.handle_control_point({opcode::HOLD}), ControlResult::Failed);
    EXPECT_EQ(tbs.handle_control_point({opcode::UNHOLD}), ControlResult::Failed);
    EXPECT_EQ(tbs.handle_control_point({0x09}), ControlResult::Unsupported);
    EXPECT_EQ(tbs.handle_control_point({}), ControlResult::Malformed);
    EXPECT_EQ(phone.seen.size(), 3u);
}

TEST_F(TbsFixture, ControlPointWithoutPlatformSupport)
{
    phone.supported.clear();
    EXPECT_EQ(tbs.handle_control_point({opcode::ACCEPT}), ControlResult::Failed);
    EXPECT_TRUE(phone.seen.empty());
}
