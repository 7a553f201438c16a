#include <gtest/gtest.h>
#include <console/session_registry.hpp>
#include "fake_device.hpp"
#include <algorithm>

static bool sent(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

class SessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ios = std::make_shared<IosLikeDevice>();
        factory.configure = [this](FakeDevice& d) { d.set_responder(ios_responder(ios)); };
    }

    std::shared_ptr<IosLikeDevice> ios;
    FakeTransportFactory factory;
};

TEST_F(SessionRegistryTest, CreateRegistersSession) {
    SessionRegistry registry(factory, fast_baseline());
    auto r = registry.create("10.0.0.5", 2001, 1500);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(factory.last_timeout_ms, 1500);

    auto infos = registry.list();
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].session_id, r.value);
    EXPECT_EQ(infos[0].host, "10.0.0.5");
    EXPECT_EQ(infos[0].port, 2001);
    EXPECT_FALSE(infos[0].connected_at.empty());
}

TEST_F(SessionRegistryTest, CustomIdGenerator) {
    int n = 0;
    SessionRegistry registry(factory, fast_baseline(),
                             [&n]() { return "sess-" + std::to_string(++n); });
    EXPECT_EQ(registry.create("h", 23, 100).value, "sess-1");
    EXPECT_EQ(registry.create("h", 24, 100).value, "sess-2");
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(SessionRegistryTest, ConnectionFailureRegistersNothing) {
    factory.fail_with = "Connection refused";
    SessionRegistry registry(factory, fast_baseline());
    auto r = registry.create("10.0.0.1", 23, 100);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionFailure);
    EXPECT_NE(r.error.find("10.0.0.1:23"), std::string::npos);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.list().empty());
}

TEST_F(SessionRegistryTest, InvalidEndpointRejectedBeforeOpen) {
    SessionRegistry registry(factory, fast_baseline());

    auto empty_host = registry.create("", 23, 100);
    EXPECT_EQ(empty_host.kind, ErrorKind::ConnectionFailure);
    EXPECT_EQ(empty_host.error, "Connection failed: :23 - invalid endpoint");

    auto zero = registry.create("10.0.0.5", 0, 100);
    EXPECT_EQ(zero.kind, ErrorKind::ConnectionFailure);
    EXPECT_NE(zero.error.find("10.0.0.5:0"), std::string::npos);

    auto high = registry.create("10.0.0.5", 65536, 100);
    EXPECT_EQ(high.kind, ErrorKind::ConnectionFailure);
    EXPECT_NE(high.error.find("10.0.0.5:65536"), std::string::npos);

    EXPECT_EQ(factory.open_calls, 0);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(SessionRegistryTest, DuplicateIdKeepsExistingSession) {
    SessionRegistry registry(factory, fast_baseline(), []() { return std::string("fixed-id"); });
    ASSERT_TRUE(registry.create("10.0.0.5", 2001, 100).is_ok());

    auto second = registry.create("10.0.0.6", 2002, 100);
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::ConnectionFailure);
    EXPECT_NE(second.error.find("10.0.0.6:2002"), std::string::npos);

    EXPECT_EQ(registry.size(), 1u);
    auto kept = registry.find("fixed-id");
    ASSERT_TRUE(kept.is_ok());
    EXPECT_EQ(kept.value->endpoint().host, "10.0.0.5");
    EXPECT_FALSE(kept.value->is_closed());
    EXPECT_FALSE(factory.device(0)->closed());
    EXPECT_EQ(factory.device(1)->close_calls(), 1);
}

TEST_F(SessionRegistryTest, FindUnknown) {
    SessionRegistry registry(factory, fast_baseline());
    auto r = registry.find("nope");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::UnknownSession);
    EXPECT_EQ(r.error, "Session not found: nope");
}

TEST_F(SessionRegistryTest, RemoveClosesTransportOnce) {
    SessionRegistry registry(factory, fast_baseline());
    auto id = registry.create("h", 23, 100).value;
    auto dev = factory.device();

    ASSERT_TRUE(registry.remove(id).is_ok());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(dev->close_calls(), 1);

    auto again = registry.remove(id);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::UnknownSession);
    EXPECT_EQ(dev->close_calls(), 1);
}

TEST_F(SessionRegistryTest, HeldSessionOutlivesRemoval) {
    SessionRegistry registry(factory, fast_baseline());
    auto id = registry.create("h", 23, 100).value;
    auto held = registry.find(id).value;

    ASSERT_TRUE(registry.remove(id).is_ok());
    EXPECT_TRUE(held->is_closed());
    EXPECT_EQ(held->id(), id);
}

TEST_F(SessionRegistryTest, CloseAllEmptiesTable) {
    SessionRegistry registry(factory, fast_baseline());
    registry.create("a", 23, 100);
    registry.create("b", 23, 100);
    registry.close_all();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(factory.device(0)->closed());
    EXPECT_TRUE(factory.device(1)->closed());
}

// ── Baseline sequence ───────────────────────────────────────

TEST_F(SessionRegistryTest, BaselineWakesProbesAndDisablesPaging) {
    SessionRegistry registry(factory, fast_baseline());
    ASSERT_TRUE(registry.create("h", 23, 100).is_ok());

    auto lines = factory.device()->lines();
    ASSERT_GE(lines.size(), 9u);
    for (int i = 0; i < 3; ++i) EXPECT_EQ(lines[i], "");
    for (int i = 3; i < 8; ++i) EXPECT_EQ(lines[i], "?");
    EXPECT_EQ(lines.back(), "terminal length 0");
    EXPECT_FALSE(sent(lines, "end"));
    EXPECT_TRUE(ios->paging_disabled);
}

TEST_F(SessionRegistryTest, BaselineLeavesConfigMode) {
    ios->mode = "config-if";
    SessionRegistry registry(factory, fast_baseline());
    ASSERT_TRUE(registry.create("h", 23, 100).is_ok());

    auto lines = factory.device()->lines();
    ASSERT_TRUE(sent(lines, "end"));
    auto end_at = std::find(lines.begin(), lines.end(), "end");
    auto paging_at = std::find(lines.begin(), lines.end(), "terminal length 0");
    EXPECT_LT(end_at, paging_at);
    EXPECT_TRUE(ios->mode.empty());
}

TEST_F(SessionRegistryTest, BaselineToleratesSilentDevice) {
    factory.configure = nullptr;
    SessionRegistry registry(factory, fast_baseline());
    auto r = registry.create("h", 23, 100);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(factory.device()->lines().back(), "terminal length 0");
}

TEST_F(SessionRegistryTest, BaselineReturnsInitialText) {
    auto dev = std::make_shared<FakeDevice>();
    dev->set_responder(ios_responder(ios));
    ConsoleSession session("s1", Endpoint{"h", 23}, std::make_unique<FakeTransport>(dev));

    auto initial = session.initialize_baseline(fast_baseline());
    EXPECT_NE(initial.find("Exec commands:"), std::string::npos);
    EXPECT_NE(initial.find("SW1#"), std::string::npos);
}

TEST_F(SessionRegistryTest, SessionCloseIsIdempotent) {
    auto dev = std::make_shared<FakeDevice>();
    {
        ConsoleSession session("s1", Endpoint{"h", 23}, std::make_unique<FakeTransport>(dev));
        session.close();
        session.close();
        EXPECT_TRUE(session.is_closed());
        EXPECT_TRUE(session.write_line("show clock").is_err());
    }
    EXPECT_EQ(dev->close_calls(), 1);
}
