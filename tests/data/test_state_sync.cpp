#include "sdrbridge/data/state_sync.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace sdrbridge::data;

namespace {

struct Push {
    DeviceState state;
    StateChange change;
    PushReason reason;
};

struct Recorder {
    std::vector<Push> pushes;

    StateSynchronizer::Subscriber callback() {
        return [this](const DeviceState &state, const StateChange &change, PushReason reason) {
            pushes.push_back({state, change, reason});
        };
    }
};

} // namespace

TEST(StateSync, StepIndexChangeUpdatesStepHz) {
    StateSynchronizer sync;
    StateUpdate update;
    update.tuning_step_index = 3;
    auto change = sync.apply(update);
    EXPECT_TRUE(change.tuning_step);
    EXPECT_EQ(sync.snapshot().tuning_step_index, 3u);
    EXPECT_EQ(sync.snapshot().tuning_step_hz(), 1'000u);
}

TEST(StateSync, DiscreteChangePushesImmediately) {
    StateSynchronizer sync;
    Recorder rec;
    sync.subscribe(rec.callback());

    StateUpdate update;
    update.mode = Mode::CW;
    sync.apply(update);

    ASSERT_EQ(rec.pushes.size(), 1u);
    EXPECT_EQ(rec.pushes[0].reason, PushReason::Immediate);
    EXPECT_TRUE(rec.pushes[0].change.mode);
    EXPECT_EQ(rec.pushes[0].state.mode, Mode::CW);
}

TEST(StateSync, ContinuousChangeWaitsForFlush) {
    StateSynchronizer sync;
    Recorder rec;
    sync.subscribe(rec.callback());

    StateUpdate update;
    update.frequency_hz = 7'074'000;
    sync.apply(update);
    update.frequency_hz = 7'075'000;
    sync.apply(update);
    EXPECT_TRUE(rec.pushes.empty());

    EXPECT_TRUE(sync.flush());
    ASSERT_EQ(rec.pushes.size(), 1u);
    EXPECT_EQ(rec.pushes[0].reason, PushReason::Periodic);
    EXPECT_TRUE(rec.pushes[0].change.frequency);
    EXPECT_EQ(rec.pushes[0].state.frequency_hz, 7'075'000u);

    // Nothing pending any more.
    EXPECT_FALSE(sync.flush());
    EXPECT_EQ(rec.pushes.size(), 1u);
}

TEST(StateSync, PendingContinuousRidesWithDiscrete) {
    StateSynchronizer sync;
    Recorder rec;
    sync.subscribe(rec.callback());

    StateUpdate meters;
    meters.s_meter_dbm = -73.0f;
    sync.apply(meters);

    StateUpdate toggle;
    toggle.nb_enabled = true;
    sync.apply(toggle);

    ASSERT_EQ(rec.pushes.size(), 1u);
    EXPECT_TRUE(rec.pushes[0].change.toggles);
    EXPECT_TRUE(rec.pushes[0].change.meters);
    EXPECT_FALSE(sync.flush());
}

TEST(StateSync, UnchangedValueIsNoChange) {
    StateSynchronizer sync;
    Recorder rec;
    sync.subscribe(rec.callback());

    StateUpdate update;
    update.mode = Mode::USB;
    update.frequency_hz = 14'074'000;
    auto change = sync.apply(update);
    EXPECT_FALSE(change.any());
    EXPECT_TRUE(rec.pushes.empty());
    EXPECT_FALSE(sync.flush());
}

TEST(StateSync, OutOfBandFrequencyRejected) {
    StateSynchronizer sync;
    StateUpdate update;
    update.frequency_hz = 60'000'000;
    update.mode = Mode::AM;
    auto change = sync.apply(update);

    EXPECT_FALSE(change.frequency);
    EXPECT_TRUE(change.mode);
    EXPECT_EQ(sync.snapshot().frequency_hz, 14'074'000u);
    EXPECT_EQ(sync.snapshot().mode, Mode::AM);
    EXPECT_EQ(sync.rejected_count(), 1u);
}

TEST(StateSync, BadStepIndexRejected) {
    StateSynchronizer sync;
    StateUpdate update;
    update.tuning_step_index = kTuningSteps.size();
    sync.apply(update);
    EXPECT_EQ(sync.snapshot().tuning_step_index, 2u);
    EXPECT_EQ(sync.rejected_count(), 1u);
}

TEST(StateSync, MemorySlots) {
    StateSynchronizer sync;
    StateUpdate store;
    store.memory_slots.push_back({0, MemorySlot{7'074'000, Mode::DIGU}});
    store.memory_slots.push_back({8, MemorySlot{7'074'000, Mode::DIGU}});
    store.memory_slots.push_back({1, MemorySlot{99'000'000, Mode::FM}});
    auto change = sync.apply(store);

    EXPECT_TRUE(change.memory);
    auto state = sync.snapshot();
    ASSERT_TRUE(state.memory_slots[0].has_value());
    EXPECT_EQ(state.memory_slots[0]->mode, Mode::DIGU);
    EXPECT_FALSE(state.memory_slots[1].has_value());
    EXPECT_EQ(sync.rejected_count(), 2u);

    StateUpdate clear;
    clear.memory_slots.push_back({0, std::nullopt});
    EXPECT_TRUE(sync.apply(clear).memory);
    EXPECT_FALSE(sync.snapshot().memory_slots[0].has_value());
}

TEST(StateSync, RepeatedDisconnectNotifiesOnce) {
    StateSynchronizer sync;
    Recorder rec;

    StateUpdate up;
    up.connected = true;
    sync.apply(up);
    sync.subscribe(rec.callback());

    StateUpdate down;
    down.connected = false;
    sync.apply(down);
    sync.apply(down);
    ASSERT_EQ(rec.pushes.size(), 1u);
    EXPECT_FALSE(rec.pushes[0].state.connected);
}

TEST(StateSync, PublishFullMarksEverything) {
    StateSynchronizer sync;
    Recorder rec;
    sync.subscribe(rec.callback());

    StateUpdate update;
    update.frequency_hz = 3'573'000;
    sync.apply(update);

    sync.publish_full();
    ASSERT_EQ(rec.pushes.size(), 1u);
    EXPECT_EQ(rec.pushes[0].reason, PushReason::Full);
    EXPECT_TRUE(rec.pushes[0].change.memory);
    EXPECT_TRUE(rec.pushes[0].change.screen);
    EXPECT_EQ(rec.pushes[0].state.frequency_hz, 3'573'000u);
    // The full push covers the pending frequency.
    EXPECT_FALSE(sync.flush());
}

TEST(StateSync, Unsubscribe) {
    StateSynchronizer sync;
    Recorder rec;
    const size_t id = sync.subscribe(rec.callback());
    sync.unsubscribe(id);
    sync.publish_full();
    EXPECT_TRUE(rec.pushes.empty());
}

TEST(StateSync, InitialState) {
    DeviceState initial;
    initial.frequency_hz = 10'136'000;
    StateSynchronizer sync(initial);
    EXPECT_EQ(sync.snapshot().frequency_hz, 10'136'000u);
}

TEST(StateSync, ConcurrentApplyAndFlushPushInOrder) {
    constexpr int kIterations = 2000;
    StateSynchronizer sync;

    std::atomic<int> in_callback{0};
    std::atomic<int> overlaps{0};
    std::atomic<int> pushes{0};
    uint64_t last_frequency = 0;
    bool frequency_went_back = false;
    sync.subscribe([&](const DeviceState &state, const StateChange &, PushReason) {
        if (in_callback.fetch_add(1) != 0) {
            overlaps.fetch_add(1);
        }
        // Serialized by the synchronizer, so plain members are safe here.
        if (state.frequency_hz < last_frequency) {
            frequency_went_back = true;
        }
        last_frequency = state.frequency_hz;
        pushes.fetch_add(1);
        in_callback.fetch_sub(1);
    });

    std::atomic<bool> writers_done{false};
    std::thread tuner([&] {
        for (int i = 1; i <= kIterations; ++i) {
            StateUpdate update;
            update.frequency_hz = 20'000'000 + static_cast<uint64_t>(i);
            sync.apply(update);
        }
    });
    std::thread meters([&] {
        for (int i = 0; i < kIterations; ++i) {
            StateUpdate update;
            update.s_meter_dbm = -100.0f + static_cast<float>(i % 50);
            update.swr_ratio = 1.0f + static_cast<float>(i % 3);
            sync.apply(update);
        }
    });
    std::thread toggles([&] {
        for (int i = 0; i < kIterations; ++i) {
            StateUpdate update;
            update.nb_enabled = (i % 2) == 0;
            update.mode = (i % 2) == 0 ? Mode::LSB : Mode::USB;
            sync.apply(update);
        }
    });
    std::thread flusher([&] {
        while (!writers_done.load()) {
            sync.flush();
            std::this_thread::yield();
        }
    });

    tuner.join();
    meters.join();
    toggles.join();
    writers_done.store(true);
    flusher.join();
    sync.flush();

    EXPECT_EQ(overlaps.load(), 0);
    EXPECT_FALSE(frequency_went_back);
    EXPECT_GE(pushes.load(), kIterations);
    EXPECT_FALSE(sync.flush());

    auto state = sync.snapshot();
    EXPECT_EQ(state.frequency_hz, 20'000'000u + kIterations);
    EXPECT_EQ(last_frequency, state.frequency_hz);
    EXPECT_FALSE(state.nb_enabled);
    EXPECT_EQ(state.mode, Mode::USB);
    EXPECT_EQ(state.s_meter_dbm, -100.0f + static_cast<float>((kIterations - 1) % 50));
    EXPECT_EQ(sync.rejected_count(), 0u);
}
