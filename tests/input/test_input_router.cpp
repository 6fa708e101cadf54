#include "sdrbridge/input/actions.hpp"
#include "sdrbridge/input/input_bus.hpp"
#include "sdrbridge/input/input_router.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace sdrbridge::input;

namespace {

class RecordingHandler : public ActionHandler {
  public:
    void handle(const ActionEvent &event) override { events.push_back(event); }
    std::vector<ActionEvent> events;
};

class InputRouterTest : public ::testing::Test {
  protected:
    void SetUp() override {
        for (const auto &descriptor : actions::builtin_actions()) {
            registry.register_action(descriptor);
        }
    }

    ActionRegistry registry;
    InputBus bus;
    RecordingHandler handler;
};

} // namespace

TEST_F(InputRouterTest, RegisterHandlersOnlyOnce) {
    InputRouter router(registry);
    EXPECT_TRUE(router.register_handlers(bus));
    EXPECT_FALSE(router.register_handlers(bus));
    EXPECT_FALSE(router.register_handlers(bus));
    EXPECT_TRUE(router.handlers_registered());
    EXPECT_EQ(bus.trigger_listener_count(), 1u);
    EXPECT_EQ(bus.mapped_listener_count(), 1u);

    router.attach(&handler);
    bus.emit_trigger(std::string(actions::kNoiseBlanker));
    EXPECT_EQ(handler.events.size(), 1u);
}

TEST_F(InputRouterTest, DirectTriggerAndMappedShareOnePath) {
    InputRouter router(registry);
    router.register_handlers(bus);
    router.attach(&handler);

    bus.emit_trigger(std::string(actions::kPtt));
    bus.emit_mapped({std::string(actions::kPtt), std::nullopt});

    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0].id, actions::kPtt);
    EXPECT_EQ(handler.events[0].source, InputSource::DirectTrigger);
    EXPECT_EQ(handler.events[1].id, actions::kPtt);
    EXPECT_EQ(handler.events[1].source, InputSource::MappedAction);
    EXPECT_EQ(router.dispatched_count(), 2u);
}

TEST_F(InputRouterTest, RequestIdsNeedNoDescriptor) {
    InputRouter router(registry);
    router.attach(&handler);

    router.on_direct_trigger("getState");
    router.on_direct_trigger("screen.tx");
    router.on_direct_trigger("screen.nowhere");

    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(router.dropped_count(), 1u);
    EXPECT_TRUE(InputRouter::is_request_id("getState"));
    EXPECT_FALSE(InputRouter::is_request_id(std::string(actions::kTuneUp)));
}

TEST_F(InputRouterTest, UnknownIdsDropped) {
    InputRouter router(registry);
    router.attach(&handler);

    router.on_direct_trigger("vfo.warp_drive");
    router.on_mapped_action({"vfo.warp_drive", std::nullopt});
    // Request ids are display-only; the mapping subsystem cannot send them.
    router.on_mapped_action({"getState", std::nullopt});

    EXPECT_TRUE(handler.events.empty());
    EXPECT_EQ(router.dropped_count(), 3u);
}

TEST_F(InputRouterTest, MappedDefaultValueFilledIn) {
    InputRouter router(registry);
    router.attach(&handler);

    router.on_mapped_action({std::string(actions::kMemoryRecall), std::nullopt});
    ASSERT_EQ(handler.events.size(), 1u);
    EXPECT_EQ(handler.events[0].value, "1");
}

TEST_F(InputRouterTest, MappedValueMustBeAnOption) {
    InputRouter router(registry);
    router.attach(&handler);

    router.on_mapped_action({std::string(actions::kMode), "CW"});
    router.on_mapped_action({std::string(actions::kMode), "PSK31"});

    ASSERT_EQ(handler.events.size(), 1u);
    EXPECT_EQ(handler.events[0].value, "CW");
    EXPECT_EQ(router.dropped_count(), 1u);
}

TEST_F(InputRouterTest, DroppedWhileDetached) {
    InputRouter router(registry);
    router.on_direct_trigger(std::string(actions::kTuneUp));
    EXPECT_EQ(router.dropped_count(), 1u);

    router.attach(&handler);
    router.on_direct_trigger(std::string(actions::kTuneUp));
    router.detach();
    router.on_direct_trigger(std::string(actions::kTuneUp));

    EXPECT_EQ(handler.events.size(), 1u);
    EXPECT_EQ(router.dropped_count(), 2u);
}

TEST(InputBus, EveryListenerFires) {
    InputBus bus;
    int a = 0;
    int b = 0;
    bus.add_trigger_listener([&](const std::string &) { ++a; });
    bus.add_trigger_listener([&](const std::string &) { ++b; });
    bus.emit_trigger("x");
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1);

    std::optional<std::string> seen;
    bus.add_mapped_listener([&](const MappedActionEvent &e) { seen = e.value; });
    bus.emit_mapped({"y", "v"});
    EXPECT_EQ(seen, "v");
}

TEST(InputBus, RemovedListenerStopsFiring) {
    InputBus bus;
    int a = 0;
    int b = 0;
    auto first = bus.add_trigger_listener([&](const std::string &) { ++a; });
    bus.add_trigger_listener([&](const std::string &) { ++b; });

    EXPECT_TRUE(bus.remove_listener(first));
    EXPECT_FALSE(bus.remove_listener(first));
    bus.emit_trigger("x");
    EXPECT_EQ(a, 0);
    EXPECT_EQ(b, 1);
    EXPECT_EQ(bus.trigger_listener_count(), 1u);
}

TEST_F(InputRouterTest, DestroyedRouterLeavesNoListeners) {
    {
        InputRouter router(registry);
        router.register_handlers(bus);
        router.attach(&handler);
        EXPECT_EQ(bus.trigger_listener_count(), 1u);
    }
    EXPECT_EQ(bus.trigger_listener_count(), 0u);
    EXPECT_EQ(bus.mapped_listener_count(), 0u);

    // Nothing is left on the bus to call into the destroyed router.
    bus.emit_trigger(std::string(actions::kNoiseBlanker));
    bus.emit_mapped({std::string(actions::kPtt), std::nullopt});
    EXPECT_TRUE(handler.events.empty());

    InputRouter next(registry);
    EXPECT_TRUE(next.register_handlers(bus));
    next.attach(&handler);
    bus.emit_trigger(std::string(actions::kNoiseBlanker));
    EXPECT_EQ(handler.events.size(), 1u);
    EXPECT_EQ(bus.trigger_listener_count(), 1u);
}

TEST_F(InputRouterTest, UnregisterThenRegisterAgain) {
    InputRouter router(registry);
    router.register_handlers(bus);
    router.unregister_handlers();
    EXPECT_FALSE(router.handlers_registered());
    EXPECT_EQ(bus.trigger_listener_count(), 0u);

    EXPECT_TRUE(router.register_handlers(bus));
    EXPECT_EQ(bus.trigger_listener_count(), 1u);
    EXPECT_EQ(bus.mapped_listener_count(), 1u);
}
