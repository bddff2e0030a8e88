#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "beacon.hpp"

using namespace beacon;

struct Counter {
    int total = 0;

    void add(int i) { total += i; }
    bool accept(int i) const { return i >= 0; }
};

// --- Fixture ---
class BindingTest : public ::testing::Test {
protected:
    beacon::signal<int> tick_;
};

// 1. execute() runs the listener directly and reports its result
TEST_F(BindingTest, ExecuteReturnsListenerResult) {
    int seen = 0;
    auto plain = tick_.add([&](int i) { seen = i; });
    auto gate  = tick_.add([](int i) { return i > 10; });

    EXPECT_FALSE(plain.execute(3).has_value());
    EXPECT_EQ(seen, 3);

    EXPECT_EQ(gate.execute(11), std::optional<bool>{true});
    EXPECT_EQ(gate.execute(1), std::optional<bool>{false});
}

// 2. Logical gating: an inactive binding is skipped but stays attached
TEST_F(BindingTest, EnableDisable) {
    int count = 0;
    auto b = tick_.add([&](int) { count++; });

    EXPECT_TRUE(b.disable());
    EXPECT_FALSE(b.is_active());
    tick_.dispatch(1);
    EXPECT_FALSE(b.execute(1).has_value());
    EXPECT_EQ(count, 0);
    EXPECT_EQ(tick_.num_listeners(), 1u);

    EXPECT_TRUE(b.enable());
    tick_.dispatch(1);
    EXPECT_EQ(count, 1);
}

// 3. detach() is idempotent and hands back the listener once
TEST_F(BindingTest, DetachIsIdempotent) {
    beacon::listener<int> l{[](int) {}};
    auto b = tick_.add(l);
    EXPECT_TRUE(b.is_bound());

    auto first = b.detach();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(*first == l);
    EXPECT_FALSE(b.is_bound());
    EXPECT_EQ(tick_.num_listeners(), 0u);

    EXPECT_FALSE(b.detach().has_value());

    // Physically gone: gating a closed binding fails gracefully
    EXPECT_FALSE(b.enable());
    EXPECT_FALSE(b.execute(1).has_value());
}

// 4. A listener may detach its own binding while it runs
TEST_F(BindingTest, SelfDetachDuringDispatch) {
    int count = 0;
    beacon::binding<int> self;
    self = tick_.add([&](int) {
        count++;
        self.detach();
    });

    tick_.dispatch(1);
    tick_.dispatch(1);

    EXPECT_EQ(count, 1);
    EXPECT_FALSE(self.is_bound());
}

// 5. Member functions run against their receiver
TEST_F(BindingTest, MemberFunctionWithReceiver) {
    Counter counter;
    auto b = tick_.add(&Counter::add, &counter);

    tick_.dispatch(4);
    tick_.dispatch(6);

    EXPECT_EQ(counter.total, 10);
    EXPECT_EQ(b.context<Counter>(), &counter);
    EXPECT_EQ(b.context<std::string>(), nullptr);
}

// 6. A const member function returning bool can stop propagation
TEST_F(BindingTest, ConstMemberFunctionHalts) {
    Counter gate;
    int after = 0;
    tick_.add(&Counter::accept, &gate, 1);
    tick_.add([&](int) { after++; });

    tick_.dispatch(1);
    tick_.dispatch(-1);

    EXPECT_EQ(after, 1);
}

// 6b. Const member functions accept a receiver through a pointer to const
TEST_F(BindingTest, ConstReceiverForConstMember) {
    const Counter gate;
    int after = 0;
    auto b = tick_.add(&Counter::accept, &gate, 1);
    tick_.add([&](int) { after++; });

    tick_.dispatch(-1);
    EXPECT_EQ(after, 0);
    EXPECT_EQ(b.context<const Counter>(), &gate);

    EXPECT_THROW(tick_.add(&Counter::add, &gate), beacon::invalid_listener);
    EXPECT_EQ(tick_.num_listeners(), 2u);
}

// 7. Member functions need a receiver of their own class
TEST_F(BindingTest, MemberFunctionWithoutReceiver) {
    std::string wrong;
    EXPECT_THROW(tick_.add(&Counter::add), beacon::invalid_listener);
    EXPECT_THROW(tick_.add(&Counter::add, &wrong), beacon::invalid_listener);
    EXPECT_EQ(tick_.num_listeners(), 0u);
}

// 8. Curried params are passed ahead of the dispatched arguments
TEST_F(BindingTest, CurriedParamsComeFirst) {
    std::vector<std::string> seen;
    beacon::listener<int> l{beacon::curry<std::size_t, std::string>(
        [&](std::size_t index, const std::string& tag, int value) {
            seen.push_back(tag + ":" + std::to_string(index) + ":" + std::to_string(value));
        })};

    auto b = tick_.add(l);
    EXPECT_TRUE(b.params(std::size_t{2}, std::string("slot")));

    tick_.dispatch(9);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "slot:2:9");
}

// 9. Curried params must match the listener exactly
TEST_F(BindingTest, CurriedParamsMismatch) {
    auto b = tick_.add(beacon::curry<std::size_t>([](std::size_t, int) {}));
    auto plain = tick_.add([](int) {});

    EXPECT_THROW(b.params(1), beacon::invalid_listener);
    EXPECT_THROW(plain.params(std::size_t{1}), beacon::invalid_listener);

    // Never bound: the listener can't run
    EXPECT_THROW(tick_.dispatch(0), beacon::invalid_listener);
}

// 10. Accessors of a live binding
TEST_F(BindingTest, Accessors) {
    beacon::listener<int> l{[](int) {}};
    auto b = tick_.add_once(l, 5);

    EXPECT_TRUE(b.is_once());
    EXPECT_EQ(b.priority(), 5);
    ASSERT_TRUE(b.get_listener().has_value());
    EXPECT_TRUE(*b.get_listener() == l);

    std::ostringstream os;
    os << b;
    EXPECT_EQ(os.str(), "[binding is_once:true is_bound:true active:true]");

    tick_.dispatch(0);
    EXPECT_FALSE(b.get_listener().has_value());
    EXPECT_FALSE(b.is_bound());
}

// 11. Handles outlive their signal safely
TEST(BindingLifetimeTest, SignalDestroyedFirst) {
    beacon::binding<int> b;
    {
        beacon::signal<int> local;
        b = local.add([](int) {});
        EXPECT_TRUE(b.is_bound());
    }
    EXPECT_FALSE(b.is_bound());
    EXPECT_FALSE(b.detach().has_value());
    EXPECT_FALSE(b.execute(0).has_value());
}
