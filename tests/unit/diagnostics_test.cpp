#include <lolite/core/diagnostics.h>
#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace lolite::core;

// ---------------------------------------------------------------------------
// 1. Recording
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, EmitRecordsEvent) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(7);
    emitter.emit(Severity::Warning, "stylesheet", "add_stylesheet", "1:3: bad value");

    auto events = emitter.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].severity, Severity::Warning);
    EXPECT_EQ(events[0].module, "stylesheet");
    EXPECT_EQ(events[0].stage, "add_stylesheet");
    EXPECT_EQ(events[0].message, "1:3: bad value");
    EXPECT_EQ(events[0].correlation_id, 7u);
}

TEST(DiagnosticsTest, FilterBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "run_loop", "run", "started");
    emitter.emit(Severity::Error, "document", "set_parent", "cycle");
    emitter.emit(Severity::Error, "run_loop", "tick", "sink failed");

    EXPECT_EQ(emitter.events_by_severity(Severity::Error).size(), 2u);
    EXPECT_EQ(emitter.events_by_module("run_loop").size(), 2u);
    EXPECT_TRUE(emitter.events_by_module("cascade").empty());
}

TEST(DiagnosticsTest, MinSeverityDropsQuieterEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.emit(Severity::Info, "m", "s", "dropped");
    emitter.emit(Severity::Warning, "m", "s", "kept");

    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "kept");
    EXPECT_EQ(emitter.min_severity(), Severity::Warning);
}

// ---------------------------------------------------------------------------
// 2. Bounded history
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, OldestEventsAreDropped) {
    DiagnosticEmitter emitter(3);
    for (int i = 0; i < 5; ++i) {
        emitter.emit(Severity::Info, "m", "s", std::to_string(i));
    }

    auto events = emitter.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.front().message, "2");
    EXPECT_EQ(events.back().message, "4");
    EXPECT_EQ(emitter.capacity(), 3u);

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(DiagnosticsTest, ZeroCapacityKeepsOneEvent) {
    DiagnosticEmitter emitter(0);
    emitter.emit(Severity::Info, "m", "s", "a");
    emitter.emit(Severity::Info, "m", "s", "b");
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "b");
}

// ---------------------------------------------------------------------------
// 3. Observers and forwarding
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, ObserversSeeEveryRecordedEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });

    emitter.emit(Severity::Info, "m", "s", "one");
    emitter.emit(Severity::Error, "m", "s", "two");
    EXPECT_EQ(seen, (std::vector<std::string>{"one", "two"}));
}

TEST(DiagnosticsTest, ObserverMayEmitAgain) {
    DiagnosticEmitter emitter;
    emitter.add_observer([&emitter](const DiagnosticEvent& e) {
        if (e.stage == "first") {
            emitter.emit(Severity::Info, "m", "second", "nested");
        }
    });
    emitter.emit(Severity::Info, "m", "first", "outer");
    EXPECT_EQ(emitter.size(), 2u);
}

TEST(DiagnosticsTest, ForwardKeepsOriginAndAppliesLocalCorrelation) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(3);

    DiagnosticEvent remote;
    remote.severity = Severity::Error;
    remote.module = "cascade";
    remote.stage = "resolve_style";
    remote.message = "unknown node 9";
    remote.correlation_id = 99;
    emitter.forward(remote);

    auto events = emitter.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].module, "cascade");
    EXPECT_EQ(events[0].stage, "resolve_style");
    EXPECT_EQ(events[0].severity, Severity::Error);
    EXPECT_EQ(events[0].correlation_id, 3u);
}

TEST(DiagnosticsTest, ConcurrentEmitters) {
    DiagnosticEmitter emitter(10000);
    std::atomic<int> observed{0};
    emitter.add_observer([&observed](const DiagnosticEvent&) { ++observed; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&emitter]() {
            for (int i = 0; i < 250; ++i) {
                emitter.emit(Severity::Info, "m", "s", "x");
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(emitter.size(), 1000u);
    EXPECT_EQ(observed.load(), 1000);
}

// ---------------------------------------------------------------------------
// 4. Formatting
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, FormatDiagnostic) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "stylesheet";
    event.stage = "add_stylesheet";
    event.message = "2:5: unknown property 'colr'";
    event.correlation_id = 4;
    EXPECT_EQ(format_diagnostic(event),
              "[warning] stylesheet/add_stylesheet (cid:4): 2:5: unknown property 'colr'");

    DiagnosticEvent bare;
    bare.message = "hello";
    EXPECT_EQ(format_diagnostic(bare), "[info]: hello");
}

TEST(DiagnosticsTest, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}
