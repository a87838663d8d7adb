#include <gtest/gtest.h>

#include "EventRouter.h"
#include "Fakes.h"

using namespace std;
using namespace vin;
using namespace vin::test;

namespace {

class EventRouterTest : public ::testing::Test {
protected:
    void press(Key key) {
        router_.onEdge({key, true, false});
    }

    void release(Key key) {
        router_.onEdge({key, false, false});
    }

    // Everything emitted so far
    vector<AppEvent> drain() {
        vector<AppEvent> events;
        while (auto ev = events_.next(0ms)) {
            events.push_back(std::move(*ev));
        }
        return events;
    }

    template <typename T>
    static size_t count(const vector<AppEvent>& events) {
        return ranges::count_if(events, [](const AppEvent& ev) {
            return holds_alternative<T>(ev);
        });
    }

    EventCollector events_;
    EventRouter router_{nullptr, events_.sink()};
};

} // anon ns

TEST_F(EventRouterTest, ModifierThenTriggerStartsAndStops) {
    press(Key::Modifier);
    press(Key::Trigger);
    EXPECT_TRUE(router_.gestureActive());

    release(Key::Trigger);
    EXPECT_FALSE(router_.gestureActive());

    const auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(holds_alternative<event::StartRecording>(events[0]));
    EXPECT_TRUE(holds_alternative<event::StopRecording>(events[1]));
}

TEST_F(EventRouterTest, TriggerWithoutModifierDoesNothing) {
    press(Key::Trigger);
    release(Key::Trigger);

    EXPECT_TRUE(drain().empty());
}

TEST_F(EventRouterTest, OtherCtrlStillHeldAfterOneIsReleased) {
    // Left and right Ctrl both map to the modifier
    press(Key::Modifier);
    press(Key::Modifier);
    release(Key::Modifier);
    EXPECT_TRUE(router_.modifierHeld());

    press(Key::Trigger);
    EXPECT_TRUE(router_.gestureActive());
    EXPECT_EQ(count<event::StartRecording>(drain()), 1u);

    release(Key::Trigger);
    release(Key::Modifier);
    EXPECT_FALSE(router_.modifierHeld());
}

TEST_F(EventRouterTest, OtherAltStillHeldAfterOneIsReleased) {
    press(Key::AltModifier);
    press(Key::AltModifier);
    release(Key::AltModifier);

    press(Key::Trigger);
    release(Key::Trigger);
    EXPECT_EQ(count<event::ToggleTranslate>(drain()), 1u);
}

TEST_F(EventRouterTest, UnmatchedModifierReleaseIsHarmless) {
    // Ctrl was already down when the router started
    release(Key::Modifier);
    EXPECT_FALSE(router_.modifierHeld());

    press(Key::Modifier);
    press(Key::Trigger);
    EXPECT_TRUE(router_.gestureActive());
    release(Key::Trigger);
    release(Key::Modifier);
    EXPECT_FALSE(router_.modifierHeld());
}

TEST_F(EventRouterTest, ReleasingModifierFirstStillStopsOnTriggerRelease) {
    press(Key::Modifier);
    press(Key::Trigger);
    release(Key::Modifier);

    EXPECT_TRUE(router_.gestureActive());
    EXPECT_EQ(count<event::StopRecording>(drain()), 0u);

    release(Key::Trigger);
    const auto events = drain();
    EXPECT_EQ(count<event::StopRecording>(events), 1u);
    EXPECT_FALSE(router_.gestureActive());
}

TEST_F(EventRouterTest, ExactlyOneStopPerGesture) {
    press(Key::Modifier);
    press(Key::Trigger);
    release(Key::Trigger);
    release(Key::Trigger);
    release(Key::Modifier);

    const auto events = drain();
    EXPECT_EQ(count<event::StartRecording>(events), 1u);
    EXPECT_EQ(count<event::StopRecording>(events), 1u);
}

TEST_F(EventRouterTest, AutoRepeatIsIgnored) {
    press(Key::Modifier);
    press(Key::Trigger);
    router_.onEdge({Key::Trigger, true, true});
    router_.onEdge({Key::Trigger, true, true});
    release(Key::Trigger);

    const auto events = drain();
    EXPECT_EQ(count<event::StartRecording>(events), 1u);
    EXPECT_EQ(count<event::StopRecording>(events), 1u);
}

TEST_F(EventRouterTest, AltAndTriggerTogglesTranslate) {
    press(Key::AltModifier);
    press(Key::Trigger);
    release(Key::Trigger);
    release(Key::AltModifier);

    const auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(holds_alternative<event::ToggleTranslate>(events[0]));
    EXPECT_FALSE(router_.gestureActive());
}

TEST(EventRouterProbeTest, LanguageIsReportedBeforeStart) {
    EventCollector events;
    EventRouter router{nullptr, events.sink(), [] { return optional<string>{"de"}; }};

    router.onEdge({Key::Modifier, true, false});
    router.onEdge({Key::Trigger, true, false});

    auto first = events.next(0ms);
    ASSERT_TRUE(first);
    ASSERT_TRUE(holds_alternative<event::LanguageDetected>(*first));
    EXPECT_EQ(get<event::LanguageDetected>(*first).code, "de");

    auto second = events.next(0ms);
    ASSERT_TRUE(second);
    EXPECT_TRUE(holds_alternative<event::StartRecording>(*second));
}

TEST(EventRouterThreadTest, ReadsEdgesFromTheInputSource) {
    auto input = make_shared<FakeInput>();
    EventCollector events;
    EventRouter router{input, events.sink()};
    router.start();

    input->press(Key::Modifier);
    input->press(Key::Trigger);
    input->release(Key::Trigger);

    EXPECT_TRUE(events.nextOf<event::StartRecording>());
    EXPECT_TRUE(events.nextOf<event::StopRecording>());

    router.stop();
}

TEST(EventRouterThreadTest, InputFailureIsReported) {
    auto input = make_shared<FakeInput>();
    EventCollector events;
    EventRouter router{input, events.sink()};
    router.start();

    input->fail();

    const auto failed = events.nextOf<event::WorkerFailed>();
    ASSERT_TRUE(failed);
    EXPECT_EQ(failed->worker, "EventRouter");

    router.stop();
}
