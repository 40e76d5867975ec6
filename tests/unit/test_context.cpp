#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include "sandbox/context.hpp"

namespace {

using namespace std::chrono_literals;
using runbox::sandbox::Context;
using runbox::sandbox::ContextError;

TEST(ContextTest, BackgroundNeverEnds) {
    const auto ctx = Context::Background();
    EXPECT_FALSE(ctx.Done());
    EXPECT_EQ(ctx.Err(), ContextError::kNone);
    EXPECT_FALSE(ctx.Deadline().has_value());
    EXPECT_FALSE(ctx.WaitFor(10ms));
}

TEST(ContextTest, TimeoutExpires) {
    const auto ctx = Context::WithTimeout(Context::Background(), 30ms);
    EXPECT_FALSE(ctx.Done());
    EXPECT_TRUE(ctx.WaitFor(2s));
    EXPECT_EQ(ctx.Err(), ContextError::kDeadlineExceeded);
}

TEST(ContextTest, CancelPropagatesToChildren) {
    const auto parent = Context::WithCancel(Context::Background());
    const auto child = Context::WithTimeout(parent, 10s);
    parent.Cancel();
    EXPECT_TRUE(child.Done());
    EXPECT_EQ(child.Err(), ContextError::kCanceled);
}

TEST(ContextTest, ChildCancelDoesNotAffectParent) {
    const auto parent = Context::WithCancel(Context::Background());
    const auto child = Context::WithCancel(parent);
    child.Cancel();
    EXPECT_TRUE(child.Done());
    EXPECT_FALSE(parent.Done());
}

TEST(ContextTest, ChildKeepsEarlierParentDeadline) {
    const auto parent = Context::WithTimeout(Context::Background(), 50ms);
    const auto child = Context::WithTimeout(parent, 1h);
    ASSERT_TRUE(child.Deadline().has_value());
    EXPECT_EQ(*child.Deadline(), *parent.Deadline());
}

TEST(ContextTest, WaitForWakesOnCancelFromAnotherThread) {
    const auto ctx = Context::WithCancel(Context::Background());
    std::thread canceller([ctx] {
        std::this_thread::sleep_for(20ms);
        ctx.Cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(ctx.WaitFor(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();
}

}  // namespace
