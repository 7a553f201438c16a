#include <gtest/gtest.h>
#include <console/command_executor.hpp>
#include <console/prompt_detector.hpp>
#include "fake_device.hpp"
#include <chrono>
#include <thread>

using Clock = std::chrono::steady_clock;

static int elapsed_ms(Clock::time_point since) {
    return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - since).count());
}

class CommandExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ios = std::make_shared<IosLikeDevice>();
        factory.configure = [this](FakeDevice& d) { d.set_responder(ios_responder(ios)); };
        registry = std::make_unique<SessionRegistry>(factory, fast_baseline());
        auto created = registry->create("10.0.0.5", 2001, 100);
        ASSERT_TRUE(created.is_ok()) << created.error;
        id = created.value;
        device = factory.device();
    }

    std::shared_ptr<IosLikeDevice> ios;
    FakeTransportFactory factory;
    std::unique_ptr<SessionRegistry> registry;
    std::shared_ptr<FakeDevice> device;
    std::string id;
};

TEST_F(CommandExecutorTest, ReturnsOutputEndingInPrompt) {
    CommandExecutor exec(*registry, fast_timing());
    auto r = exec.run(id, "show version", 2000);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_NE(r.value.find("Cisco IOS Software"), std::string::npos);
    EXPECT_TRUE(ends_with_prompt(r.value));
    EXPECT_EQ(device->lines().back(), "show version");
}

TEST_F(CommandExecutorTest, ReturnsEarlyOnPrompt) {
    ios->reply_delay_ms = 50;
    CommandExecutor exec(*registry, fast_timing());
    auto session = registry->find(id).value;

    auto start = Clock::now();
    auto r = exec.run_on(*session, "show clock", 5000);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.completion, Completion::Prompt);
    EXPECT_LT(elapsed_ms(start), 1500);
    EXPECT_NE(r.value.output.find("SW1#"), std::string::npos);
}

TEST_F(CommandExecutorTest, UnknownSessionWritesNothing) {
    CommandExecutor exec(*registry, fast_timing());
    auto before = device->write_count();
    auto r = exec.run("no-such-session", "show version", 500);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::UnknownSession);
    EXPECT_EQ(device->write_count(), before);
}

TEST_F(CommandExecutorTest, DeadlineReturnsPartialOutput) {
    factory.device()->set_responder([](const std::string& line) {
        return std::vector<Reply>{{0, line + "\r\nBuilding configuration...\r\n"}};
    });
    CommandExecutor exec(*registry, fast_timing());
    auto session = registry->find(id).value;

    auto start = Clock::now();
    auto r = exec.run_on(*session, "show running-config", 300);
    int took = elapsed_ms(start);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.completion, Completion::Deadline);
    EXPECT_NE(r.value.output.find("Building configuration"), std::string::npos);
    EXPECT_GE(took, 250);
    EXPECT_LT(took, 1000);
}

TEST_F(CommandExecutorTest, SilentDeviceHonorsWait) {
    device->set_responder(nullptr);
    CommandExecutor exec(*registry, fast_timing());

    auto start = Clock::now();
    auto r = exec.run(id, "show clock", 500);
    int took = elapsed_ms(start);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "");
    EXPECT_GE(took, 450);
    EXPECT_LT(took, 1500);
}

TEST_F(CommandExecutorTest, QuietLineWithoutPromptRunsToDeadline) {
    // Output stops well past the silence threshold without a prompt: the
    // silence check does not end the read, only the deadline does.
    device->set_responder([](const std::string& line) {
        return std::vector<Reply>{{0, line + "\r\nType escape sequence to abort.\r\n"}};
    });
    ExecTiming timing = fast_timing();
    timing.silence_threshold_ms = 60;
    CommandExecutor exec(*registry, timing);
    auto session = registry->find(id).value;

    auto r = exec.run_on(*session, "show clock", 400);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.completion, Completion::Deadline);
    EXPECT_GE(r.value.elapsed_ms, 350);
    EXPECT_NE(r.value.output.find("Type escape sequence"), std::string::npos);
}

TEST_F(CommandExecutorTest, SlowCommandFloorRaisesWait) {
    ExecTiming timing = fast_timing();
    timing.slow_command_floor_ms = 1500;
    ios->reply_delay_ms = 600;
    CommandExecutor exec(*registry, timing);

    auto r = exec.run(id, "ping 10.0.0.1", 100);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(ends_with_prompt(r.value));
}

TEST_F(CommandExecutorTest, FastCommandKeepsShortWait) {
    ios->reply_delay_ms = 600;
    CommandExecutor exec(*registry, fast_timing());
    auto session = registry->find(id).value;

    auto r = exec.run_on(*session, "show clock", 100);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.completion, Completion::Deadline);
    EXPECT_FALSE(ends_with_prompt(r.value.output));
}

TEST_F(CommandExecutorTest, EffectiveWait) {
    CommandExecutor exec(*registry);
    EXPECT_EQ(exec.effective_wait_ms("show version", 2000), 2000);
    EXPECT_EQ(exec.effective_wait_ms("ping 8.8.8.8", 2000), SLOW_COMMAND_FLOOR_MS);
    EXPECT_EQ(exec.effective_wait_ms("  PING 8.8.8.8", 2000), SLOW_COMMAND_FLOOR_MS);
    EXPECT_EQ(exec.effective_wait_ms("show tech-support", 2000), SLOW_COMMAND_FLOOR_MS);
    EXPECT_EQ(exec.effective_wait_ms("ping 8.8.8.8", 60000), 60000);
    EXPECT_EQ(exec.effective_wait_ms("write memory", 100), SLOW_COMMAND_FLOOR_MS);
}

TEST_F(CommandExecutorTest, DefaultSlowCommands) {
    CommandExecutor exec(*registry);
    for (const char* cmd : {"ping", "traceroute 1.1.1.1", "tracert x", "show tech", "copy run start",
                            "write", "reload", "debug ip packet"}) {
        EXPECT_TRUE(exec.is_slow_command(cmd)) << cmd;
    }
    EXPECT_FALSE(exec.is_slow_command("show ip route"));
    EXPECT_FALSE(exec.is_slow_command(""));
}

TEST_F(CommandExecutorTest, CustomSlowCommandsNormalized) {
    CommandExecutor exec(*registry, fast_timing(), {"  Show Logging ", "verify"});
    EXPECT_TRUE(exec.is_slow_command("show logging | include LINK"));
    EXPECT_TRUE(exec.is_slow_command("verify /md5 flash:image.bin"));
    EXPECT_FALSE(exec.is_slow_command("ping 1.1.1.1"));
}

TEST_F(CommandExecutorTest, ReadNoiseIsNotFatal) {
    ios->reply_delay_ms = 100;
    device->fail_next_reads(3);
    CommandExecutor exec(*registry, fast_timing());

    auto r = exec.run(id, "show clock", 2000);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(ends_with_prompt(r.value));
}

TEST_F(CommandExecutorTest, ChunkedPromptStillDetected) {
    device->set_responder([](const std::string& line) {
        return std::vector<Reply>{{0, line + "\r\nup 3 weeks\r\n"}, {40, "SW"}, {80, "1#"}};
    });
    CommandExecutor exec(*registry, fast_timing());
    auto session = registry->find(id).value;

    auto r = exec.run_on(*session, "show version | include uptime", 2000);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.completion, Completion::Prompt);
    EXPECT_EQ(r.value.output.substr(r.value.output.size() - 4), "SW1#");
}

TEST_F(CommandExecutorTest, ClosedSessionReportsUnknown) {
    CommandExecutor exec(*registry, fast_timing());
    auto session = registry->find(id).value;
    ASSERT_TRUE(registry->remove(id).is_ok());

    auto before = device->write_count();
    auto r = exec.run_on(*session, "show clock", 200);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::UnknownSession);
    EXPECT_EQ(device->write_count(), before);
}

TEST_F(CommandExecutorTest, ConcurrentCommandsDoNotInterleave) {
    device->set_responder([](const std::string& line) {
        std::string tag = line.substr(line.find_last_of(' ') + 1);
        return std::vector<Reply>{{80, line + "\r\n" + tag + "-output\r\nSW1#"}};
    });
    CommandExecutor exec(*registry, fast_timing());

    Result<std::string> a = Result<std::string>::Err("not run");
    Result<std::string> b = Result<std::string>::Err("not run");
    std::thread t1([&] { a = exec.run(id, "show alpha", 2000); });
    std::thread t2([&] { b = exec.run(id, "show beta", 2000); });
    t1.join();
    t2.join();

    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value.find("alpha-output"), std::string::npos);
    EXPECT_EQ(a.value.find("beta-output"), std::string::npos);
    EXPECT_NE(b.value.find("beta-output"), std::string::npos);
    EXPECT_EQ(b.value.find("alpha-output"), std::string::npos);
}

TEST(Completion, Names) {
    EXPECT_STREQ(completion_name(Completion::Prompt), "prompt");
    EXPECT_STREQ(completion_name(Completion::Deadline), "deadline");
}
