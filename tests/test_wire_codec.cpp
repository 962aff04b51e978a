#include "ipc/WireCodec.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace SysTask::Ipc;

namespace {

Message round_trip(const Message& message) {
    auto body = WireCodec::encode(message);
    return WireCodec::decode(body);
}

} // namespace

TEST(WireCodecTest, ExecuteTaskKeepsPositionalArgs) {
    ExecuteTaskMessage request{"task-1-1700000000000", "manage-service", nlohmann::json::array({"nginx", "restart"})};
    auto decoded = round_trip(request);
    auto* out = std::get_if<ExecuteTaskMessage>(&decoded);
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->task_id, "task-1-1700000000000");
    EXPECT_EQ(out->task_name, "manage-service");
    EXPECT_EQ(out->args, nlohmann::json::array({"nginx", "restart"}));
    EXPECT_EQ(message_type(decoded), MessageType::ExecuteTask);
}

TEST(WireCodecTest, ExecuteTaskWithoutArgsDecodesToEmptyArray) {
    ExecuteTaskMessage request{"task-2-1", "check-disk-space", nlohmann::json::array()};
    auto decoded = round_trip(request);
    auto* out = std::get_if<ExecuteTaskMessage>(&decoded);
    ASSERT_NE(out, nullptr);
    EXPECT_TRUE(out->args.is_array());
    EXPECT_TRUE(out->args.empty());
}

TEST(WireCodecTest, TaskCompleteCarriesStructuredResult) {
    nlohmann::json result = nlohmann::json::array({
        {{"filesystem", "/dev/sda1"}, {"size", "50G"}, {"usePercent", "40%"}, {"mountPoint", "/"}},
        {{"filesystem", "tmpfs"}, {"size", "1.0G"}, {"usePercent", "0%"}, {"mountPoint", "/run"}},
    });
    auto decoded = round_trip(TaskCompleteMessage{"task-3-1", result});
    auto* out = std::get_if<TaskCompleteMessage>(&decoded);
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->result, result);
}

TEST(WireCodecTest, ScalarsSurviveInsideResults) {
    nlohmann::json result = {{"flag", true}, {"neg", -7}, {"big", 4294967296LL}, {"ratio", 0.25}, {"none", nullptr}};
    auto decoded = round_trip(TaskCompleteMessage{"t", result});
    const auto& out = std::get<TaskCompleteMessage>(decoded).result;
    EXPECT_EQ(out.at("flag"), true);
    EXPECT_EQ(out.at("neg"), -7);
    EXPECT_EQ(out.at("big"), 4294967296LL);
    EXPECT_DOUBLE_EQ(out.at("ratio").get<double>(), 0.25);
    EXPECT_TRUE(out.at("none").is_null());
}

TEST(WireCodecTest, TaskErrorKeepsCode) {
    auto decoded = round_trip(TaskErrorMessage{"task-4-1", "Command failed: false", 1});
    auto* out = std::get_if<TaskErrorMessage>(&decoded);
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->error, "Command failed: false");
    EXPECT_EQ(out->code, 1);
}

TEST(WireCodecTest, WorkerReadyListsTasks) {
    auto decoded = round_trip(WorkerReadyMessage{1234, {"install-deb", "check-disk-space"}});
    auto* out = std::get_if<WorkerReadyMessage>(&decoded);
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->pid, 1234);
    EXPECT_EQ(out->tasks, (std::vector<std::string>{"install-deb", "check-disk-space"}));
}

TEST(WireCodecTest, GarbageFailsVerification) {
    std::vector<uint8_t> garbage{0xde, 0xad, 0xbe, 0xef, 0x00, 0x01, 0x02};
    EXPECT_THROW(WireCodec::decode(garbage), CodecError);
    EXPECT_THROW(WireCodec::decode(std::vector<uint8_t>{}), CodecError);
}

TEST(WireCodecTest, TruncatedFrameFailsVerification) {
    auto body = WireCodec::encode(TaskErrorMessage{"task-5-1", "something went wrong", -1});
    body.resize(body.size() / 2);
    EXPECT_THROW(WireCodec::decode(body), CodecError);
}

TEST(WireCodecTest, BinaryJsonIsRejected) {
    auto binary = nlohmann::json::binary({1, 2, 3});
    EXPECT_THROW(WireCodec::to_flexbuffer(binary), CodecError);
}

TEST(WireCodecTest, EmptyFlexBufferIsNull) {
    EXPECT_TRUE(WireCodec::from_flexbuffer({}).is_null());
}
