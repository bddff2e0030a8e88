#include <gtest/gtest.h>
#include <stdexec/execution.hpp>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "beacon.hpp"

using namespace beacon;

using TestSignal = beacon::signal<int, std::string>;

// --- Test Fixture ---
class SenderTest : public ::testing::Test {
protected:
    TestSignal signal_;
};

// 1. A sender adaptor closure is a listener that runs inline
TEST_F(SenderTest, ClosureListenerRunsInline) {
    int result = 0;
    std::string message;

    signal_.add(stdexec::then([&](int i, std::string s) {
        result = i;
        message = std::move(s);
    }));

    signal_.dispatch(42, "hello");

    EXPECT_EQ(result, 42);
    EXPECT_EQ(message, "hello");
}

// 2. A closure yielding false stops propagation
TEST_F(SenderTest, ClosureYieldingFalseHalts) {
    std::vector<int> seen;

    signal_.add(stdexec::then([](int i, std::string) { return i >= 0; }), 1);
    signal_.add([&](int i, const std::string&) { seen.push_back(i); });

    signal_.dispatch(1, "pass");
    signal_.dispatch(-1, "blocked");

    EXPECT_EQ(seen, std::vector<int>{1});
}

// 3. Closures compose like any stdexec pipeline
TEST_F(SenderTest, ComposedClosure) {
    std::string formatted;

    signal_.add(
        stdexec::then([](int i, std::string s) { return s + "#" + std::to_string(i * 2); })
        | stdexec::then([&](std::string s) { formatted = std::move(s); })
    );

    signal_.dispatch(21, "answer");
    EXPECT_EQ(formatted, "answer#42");
}

// 4. Errors inside the closure reach the dispatch caller
TEST_F(SenderTest, ClosureErrorPropagates) {
    int after = 0;
    signal_.add(stdexec::then([](int, std::string) -> bool {
        throw std::runtime_error("Hardware Failure");
    }), 1);
    signal_.add([&](int, const std::string&) { after++; });

    try {
        signal_.dispatch(99, "Thermal Overload Detected");
        FAIL() << "Should have thrown a runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Hardware Failure");
    }
    EXPECT_EQ(after, 0);
}

// 5. when_dispatched completes with the next dispatch
TEST_F(SenderTest, WhenDispatchedCompletesOnNextDispatch) {
    auto work = stdexec::when_all(
        beacon::when_dispatched(signal_),
        stdexec::just() | stdexec::then([this] { signal_.dispatch(7, "seven"); })
    );

    auto result = stdexec::sync_wait(std::move(work));
    ASSERT_TRUE(result.has_value());
    auto [number, text] = result.value();

    EXPECT_EQ(number, 7);
    EXPECT_EQ(text, "seven");
    EXPECT_EQ(signal_.num_listeners(), 0u);
}

// 6. A memorizing signal completes right away with what it remembers
TEST_F(SenderTest, WhenDispatchedReplaysMemory) {
    signal_.memorize(true);
    signal_.dispatch(5, "cached");

    auto chain = beacon::when_dispatched(signal_)
               | stdexec::then([](int i, std::string s) {
                   return s + ":" + std::to_string(i);
               });

    auto [result] = *stdexec::sync_wait(std::move(chain));
    EXPECT_EQ(result, "cached:5");
    EXPECT_EQ(signal_.num_listeners(), 0u);
}

// 7. A resolved compound is a settled promise
TEST(CompoundSenderTest, ResolvedCompoundSettles) {
    beacon::signal<int> width;
    beacon::signal<int> height;
    beacon::compound_signal size{width, height};

    width.dispatch(640);
    height.dispatch(480);

    auto area = beacon::when_dispatched(size)
              | stdexec::then([](std::tuple<int> w, std::tuple<int> h) {
                  return std::get<0>(w) * std::get<0>(h);
              });

    auto [result] = *stdexec::sync_wait(std::move(area));
    EXPECT_EQ(result, 640 * 480);
}

// 8. A disposed signal completes with an error
TEST_F(SenderTest, WhenDispatchedAfterDispose) {
    signal_.dispose();

    try {
        stdexec::sync_wait(beacon::when_dispatched(signal_));
        FAIL() << "Should have thrown use_after_dispose";
    } catch (const beacon::use_after_dispose& e) {
        EXPECT_STREQ(e.what(), "Can't when_dispatched: the signal has been disposed.");
    }
}
