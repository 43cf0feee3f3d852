#include "gtest/gtest.h"

#include <paygraph/render/frame_source.h>

#include <optional>
#include <vector>

using paygraph::render::FrameSource;
using paygraph::render::FrameSubscription;

TEST(FrameSourceTest, CallsEverySubscriberOncePerPump) {
    FrameSource frames;
    int a = 0;
    int b = 0;
    FrameSubscription sub_a = frames.Subscribe([&a]() { ++a; });
    FrameSubscription sub_b = frames.Subscribe([&b]() { ++b; });

    frames.PumpFrame();
    frames.PumpFrame();
    EXPECT_EQ(a, 2);
    EXPECT_EQ(b, 2);
    EXPECT_EQ(frames.FrameCount(), 2u);
    EXPECT_EQ(frames.SubscriberCount(), 2u);
}

TEST(FrameSourceTest, DestroyingSubscriptionDetaches) {
    FrameSource frames;
    int calls = 0;
    {
        FrameSubscription sub = frames.Subscribe([&calls]() { ++calls; });
        frames.PumpFrame();
        EXPECT_TRUE(sub.Active());
    }
    frames.PumpFrame();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(frames.SubscriberCount(), 0u);
}

TEST(FrameSourceTest, MovedSubscriptionKeepsSingleRegistration) {
    FrameSource frames;
    int calls = 0;
    FrameSubscription first = frames.Subscribe([&calls]() { ++calls; });
    FrameSubscription second = std::move(first);
    EXPECT_FALSE(first.Active());
    EXPECT_TRUE(second.Active());

    frames.PumpFrame();
    EXPECT_EQ(calls, 1);
    second.Reset();
    frames.PumpFrame();
    EXPECT_EQ(calls, 1);
}

TEST(FrameSourceTest, CallbackMayUnsubscribeItself) {
    FrameSource frames;
    int calls = 0;
    FrameSubscription sub;
    sub = frames.Subscribe([&]() {
        ++calls;
        sub.Reset();
    });

    frames.PumpFrame();
    frames.PumpFrame();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(frames.SubscriberCount(), 0u);
}

TEST(FrameSourceTest, SubscribeDuringPumpStartsNextFrame) {
    FrameSource frames;
    int late_calls = 0;
    std::optional<FrameSubscription> late;
    FrameSubscription early = frames.Subscribe([&]() {
        if (!late) {
            late.emplace(frames.Subscribe([&late_calls]() { ++late_calls; }));
        }
    });

    frames.PumpFrame();
    EXPECT_EQ(late_calls, 0);
    frames.PumpFrame();
    EXPECT_EQ(late_calls, 1);
}

TEST(FrameSourceTest, CallbackMayUnsubscribeAnother) {
    FrameSource frames;
    int second_calls = 0;
    FrameSubscription second;
    FrameSubscription first = frames.Subscribe([&]() { second.Reset(); });
    second = frames.Subscribe([&second_calls]() { ++second_calls; });

    frames.PumpFrame();
    EXPECT_EQ(second_calls, 0);
    EXPECT_EQ(frames.SubscriberCount(), 1u);
}
