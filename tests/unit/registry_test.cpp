#include <lolite/engine/registry.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lolite;
using namespace lolite::engine;
using namespace std::chrono_literals;
using core::ErrorCode;
using core::RunState;

namespace {

core::EngineConfig test_config() {
    core::EngineConfig config;
    config.worker_path = LOLITE_TEST_WORKER_PATH;
    config.frame_debounce = 5ms;
    return config;
}

std::string mode_name(const testing::TestParamInfo<bool>& info) {
    return info.param ? "InProcess" : "Worker";
}

class RegistryTest : public testing::TestWithParam<bool> {
protected:
    Handle init() {
        Handle handle = registry_.init(GetParam());
        EXPECT_NE(handle, 0u) << core::describe(registry_.last_error());
        return handle;
    }

    Registry registry_{test_config()};
};

} // namespace

// ---------------------------------------------------------------------------
// 1. Handles
// ---------------------------------------------------------------------------
TEST_P(RegistryTest, HandlesAreDistinctAndNeverReused) {
    Handle a = init();
    Handle b = init();
    EXPECT_NE(a, b);
    EXPECT_EQ(registry_.size(), 2u);

    EXPECT_EQ(registry_.destroy(a), 0);
    EXPECT_FALSE(registry_.contains(a));
    Handle c = init();
    EXPECT_NE(c, a);
    EXPECT_NE(c, b);
}

TEST_P(RegistryTest, DestroyedHandleReturnsSentinels) {
    Handle handle = init();
    ASSERT_EQ(registry_.destroy(handle), 0);

    EXPECT_EQ(registry_.destroy(handle), -1);
    EXPECT_EQ(registry_.last_error().code, ErrorCode::InvalidHandle);

    EXPECT_EQ(registry_.create_node(handle, 1), 0u);
    EXPECT_EQ(registry_.last_error(handle).code, ErrorCode::InvalidHandle);
    EXPECT_EQ(registry_.add_stylesheet(handle, "a { color: red }").status.code,
              ErrorCode::InvalidHandle);
    EXPECT_EQ(registry_.set_parent(handle, 0, 1).code, ErrorCode::InvalidHandle);
    EXPECT_EQ(registry_.set_attribute(handle, 1, "class", "x").code, ErrorCode::InvalidHandle);
    EXPECT_EQ(registry_.resolve_style(handle, 0).status.code, ErrorCode::InvalidHandle);
    EXPECT_EQ(registry_.run(handle), -1);
    EXPECT_EQ(registry_.request_stop(handle).code, ErrorCode::InvalidHandle);
    EXPECT_EQ(registry_.state(handle), RunState::Destroyed);
    EXPECT_TRUE(registry_.diagnostics(handle).empty());
    EXPECT_FALSE(registry_.registry_diagnostics()
                     .events_by_severity(core::Severity::Error)
                     .empty());
}

TEST_P(RegistryTest, RootIdAndLastError) {
    Handle handle = init();
    EXPECT_EQ(registry_.root_id(handle), 0u);
    EXPECT_TRUE(registry_.last_error().ok());
    EXPECT_TRUE(registry_.last_error(handle).ok());

    EXPECT_EQ(registry_.root_id(9999), 0u);
    EXPECT_EQ(registry_.last_error().code, ErrorCode::InvalidHandle);
    // The failure on another handle does not touch this one.
    EXPECT_TRUE(registry_.last_error(handle).ok());

    EXPECT_EQ(registry_.create_node(handle, 5), 5u);
    EXPECT_TRUE(registry_.last_error().ok());
}

// ---------------------------------------------------------------------------
// 2. Document and cascade through a handle
// ---------------------------------------------------------------------------
TEST_P(RegistryTest, TwoCardsGetTheirBackgrounds) {
    Handle handle = init();
    auto sheet = registry_.add_stylesheet(handle,
                                          ".blue-bg { background-color: #7777FF; }\n"
                                          ".red-bg { background-color: #FF7777; }");
    ASSERT_TRUE(sheet.ok());

    ASSERT_EQ(registry_.create_node(handle, 1, std::string("Hello, World!")), 1u);
    ASSERT_EQ(registry_.create_node(handle, 2, std::string("Welcome to lolite!")), 2u);
    ASSERT_TRUE(registry_.set_attribute(handle, 1, "class", "blue-bg").ok());
    ASSERT_TRUE(registry_.set_attribute(handle, 2, "class", "red-bg").ok());
    ASSERT_TRUE(registry_.set_parent(handle, 0, 1).ok());
    ASSERT_TRUE(registry_.set_parent(handle, 0, 2).ok());

    EXPECT_EQ(registry_.resolve_style(handle, 1).style.value("background-color"), "#7777FF");
    EXPECT_EQ(registry_.resolve_style(handle, 2).style.value("background-color"), "#FF7777");
    EXPECT_EQ(registry_.resolve_style(handle, 0).style.value("background-color"),
              "transparent");
}

TEST_P(RegistryTest, TreeErrors) {
    Handle handle = init();
    ASSERT_EQ(registry_.create_node(handle, 1), 1u);
    ASSERT_EQ(registry_.create_node(handle, 2), 2u);
    ASSERT_TRUE(registry_.set_parent(handle, 1, 2).ok());

    EXPECT_EQ(registry_.create_node(handle, 1), 0u);
    EXPECT_EQ(registry_.last_error(handle).code, ErrorCode::DuplicateId);
    EXPECT_EQ(registry_.create_node(handle, 0), 0u);
    EXPECT_EQ(registry_.last_error(handle).code, ErrorCode::InvalidId);

    EXPECT_EQ(registry_.set_parent(handle, 2, 1).code, ErrorCode::WouldCreateCycle);
    EXPECT_EQ(registry_.set_parent(handle, 1, 1).code, ErrorCode::WouldCreateCycle);
    EXPECT_EQ(registry_.set_parent(handle, 2, 0).code, ErrorCode::WouldCreateCycle);
    EXPECT_EQ(registry_.set_parent(handle, 3, 1).code, ErrorCode::UnknownNode);
    EXPECT_EQ(registry_.set_attribute(handle, 3, "class", "x").code, ErrorCode::UnknownNode);
    EXPECT_EQ(registry_.resolve_style(handle, 3).status.code, ErrorCode::UnknownNode);

    // The tree is unchanged by the rejected calls.
    ASSERT_TRUE(registry_.set_parent(handle, 0, 1).ok());
    EXPECT_TRUE(registry_.resolve_style(handle, 2).ok());
}

TEST_P(RegistryTest, SpecificityAndOriginOrdering) {
    Handle handle = init();
    ASSERT_TRUE(registry_.add_stylesheet(handle,
                                         "#hero { color: green }\n"
                                         ".card { color: red }\n"
                                         ".card { color: blue }")
                    .ok());
    ASSERT_EQ(registry_.create_node(handle, 1), 1u);
    ASSERT_EQ(registry_.create_node(handle, 2), 2u);
    ASSERT_TRUE(registry_.set_parent(handle, 0, 1).ok());
    ASSERT_TRUE(registry_.set_parent(handle, 1, 2).ok());
    ASSERT_TRUE(registry_.set_attribute(handle, 1, "class", "card").ok());
    ASSERT_TRUE(registry_.set_attribute(handle, 2, "class", "card").ok());
    ASSERT_TRUE(registry_.set_attribute(handle, 2, "id", "hero").ok());

    StyleResult outer = registry_.resolve_style(handle, 1);
    ASSERT_TRUE(outer.ok());
    EXPECT_EQ(outer.style.value("color"), "blue");
    EXPECT_EQ(outer.style.get("color")->origin.rule_origin, std::optional<size_t>(2));

    StyleResult inner = registry_.resolve_style(handle, 2);
    ASSERT_TRUE(inner.ok());
    EXPECT_EQ(inner.style.value("color"), "green");
    EXPECT_EQ(inner.style.get("color")->origin.selector, "#hero");

    // A later stylesheet wins over an earlier one at equal specificity.
    ASSERT_TRUE(registry_.add_stylesheet(handle, "#hero { color: purple }").ok());
    EXPECT_EQ(registry_.resolve_style(handle, 2).style.value("color"), "purple");
}

TEST_P(RegistryTest, ParseErrorKeepsPreviousRules) {
    Handle handle = init();
    ASSERT_TRUE(registry_.add_stylesheet(handle, "* { color: red }").ok());
    auto bad = registry_.add_stylesheet(handle, "* { color: blue } /* open");
    EXPECT_EQ(bad.status.code, ErrorCode::ParseError);
    EXPECT_EQ(registry_.last_error(handle).code, ErrorCode::ParseError);

    EXPECT_EQ(registry_.resolve_style(handle, 0).style.value("color"), "red");
    EXPECT_TRUE(registry_.last_error(handle).ok());
}

// ---------------------------------------------------------------------------
// 3. Run loop through a handle
// ---------------------------------------------------------------------------
TEST_P(RegistryTest, RunUntilSinkStops) {
    Handle handle = init();
    ASSERT_EQ(registry_.create_node(handle, 1), 1u);
    ASSERT_TRUE(registry_.set_parent(handle, 0, 1).ok());

    std::vector<StyleFrame> frames;
    ASSERT_TRUE(registry_.set_frame_sink(handle, [&](const StyleFrame& frame) {
        frames.push_back(frame);
        EXPECT_TRUE(registry_.request_stop(handle).ok());
    }).ok());

    EXPECT_EQ(registry_.state(handle), RunState::Idle);
    EXPECT_EQ(registry_.run(handle), 0);
    EXPECT_EQ(registry_.state(handle), RunState::Stopped);
    ASSERT_GE(frames.size(), 1u);
    EXPECT_EQ(frames[0].styles.size(), 2u);
    EXPECT_TRUE(registry_.contains(handle));
}

TEST_P(RegistryTest, StopFromAnotherThread) {
    Handle handle = init();
    std::atomic<int> frames{0};
    ASSERT_TRUE(registry_.set_frame_sink(handle, [&](const StyleFrame&) { ++frames; }).ok());

    EXPECT_EQ(registry_.request_stop(handle).code, ErrorCode::NotRunning);

    std::atomic<int> result{1};
    std::thread runner([&]() { result = registry_.run(handle); });
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (frames == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_GT(frames.load(), 0);

    // Mutations keep being accepted while the loop runs.
    EXPECT_EQ(registry_.create_node(handle, 1), 1u);
    EXPECT_TRUE(registry_.request_stop(handle).ok());
    runner.join();
    EXPECT_EQ(result.load(), 0);
    EXPECT_EQ(registry_.state(handle), RunState::Stopped);
}

TEST_P(RegistryTest, FatalRunDropsHandle) {
    Handle handle = init();
    ASSERT_TRUE(registry_.set_frame_sink(handle, [](const StyleFrame&) {
        throw std::runtime_error("presenter failed");
    }).ok());

    EXPECT_EQ(registry_.run(handle), -1);
    EXPECT_EQ(registry_.last_error(handle).code, ErrorCode::Fatal);
    EXPECT_FALSE(registry_.contains(handle));
    EXPECT_EQ(registry_.create_node(handle, 1), 0u);
    EXPECT_EQ(registry_.last_error().code, ErrorCode::InvalidHandle);
}

TEST_P(RegistryTest, DestroyFromSinkEndsRun) {
    Handle handle = init();
    std::atomic<int> destroyed{1};
    ASSERT_TRUE(registry_.set_frame_sink(handle, [&](const StyleFrame&) {
        if (destroyed == 1) destroyed = registry_.destroy(handle);
    }).ok());

    // Destroying is an orderly way out of the loop.
    EXPECT_EQ(registry_.run(handle), 0);
    EXPECT_EQ(destroyed.load(), 0);
    EXPECT_FALSE(registry_.contains(handle));
    EXPECT_EQ(registry_.state(handle), RunState::Destroyed);
}

INSTANTIATE_TEST_SUITE_P(Backends, RegistryTest, testing::Values(true, false), mode_name);

// ---------------------------------------------------------------------------
// 4. Worker startup failures
// ---------------------------------------------------------------------------
TEST(RegistryWorkerTest, MissingWorkerExecutable) {
    core::EngineConfig config = test_config();
    config.worker_path = "/nonexistent/lolite_worker";
    Registry registry(config);

    EXPECT_EQ(registry.init(false), 0u);
    EXPECT_EQ(registry.last_error().code, ErrorCode::CommunicationFailure);
    EXPECT_EQ(registry.size(), 0u);
}
