#include "sdrbridge/input/actions.hpp"
#include "sdrbridge/input/descriptors.hpp"

#include <gtest/gtest.h>

using namespace sdrbridge::input;

namespace {

KeyDescriptor key(std::string id, std::optional<std::string> mode) {
    return KeyDescriptor{std::move(id), "test key", std::move(mode)};
}

} // namespace

TEST(KeyMode, NamesRoundTrip) {
    for (auto name : kKeyModeNames) {
        auto mode = parse_key_mode(name);
        ASSERT_TRUE(mode.has_value()) << name;
        EXPECT_EQ(key_mode_name(*mode), name);
    }
    EXPECT_EQ(parse_key_mode("encoder_push"), KeyMode::EncoderPush);
}

TEST(KeyMode, RejectsNearMisses) {
    EXPECT_FALSE(parse_key_mode("default").has_value());
    EXPECT_FALSE(parse_key_mode("Press").has_value());
    EXPECT_FALSE(parse_key_mode("").has_value());
    EXPECT_FALSE(parse_key_mode("press ").has_value());
}

TEST(ActionRegistry, KeyWithoutModeRegisters) {
    ActionRegistry registry;
    EXPECT_NO_THROW(registry.register_key(key("F1", std::nullopt)));
    auto found = registry.find_key("F1");
    ASSERT_TRUE(found.has_value());
    EXPECT_FALSE(found->mode.has_value());
}

TEST(ActionRegistry, KeyWithValidModeRegisters) {
    ActionRegistry registry;
    registry.register_key(key("ENC1", "encoder_cw"));
    auto found = registry.find_key("ENC1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->mode, KeyMode::EncoderCw);
}

TEST(ActionRegistry, KeyWithUnknownModeThrows) {
    ActionRegistry registry;
    try {
        registry.register_key(key("F2", "default"));
        FAIL() << "expected InvalidRegistration";
    } catch (const InvalidRegistration &e) {
        EXPECT_EQ(e.descriptor_id(), "F2");
        EXPECT_EQ(e.field(), "mode");
        EXPECT_NE(std::string(e.what()).find("default"), std::string::npos);
    }
    EXPECT_FALSE(registry.find_key("F2").has_value());
    EXPECT_EQ(registry.key_count(), 0u);
}

TEST(ActionRegistry, TryRegisterKeyReportsReason) {
    ActionRegistry registry;
    auto failure = registry.try_register_key(key("F3", "wiggle"));
    ASSERT_TRUE(failure.has_value());
    EXPECT_NE(failure->find("mode"), std::string::npos);

    EXPECT_FALSE(registry.try_register_key(key("F3", "hold")).has_value());
    EXPECT_EQ(registry.key_count(), 1u);
}

TEST(ActionRegistry, EmptyIdRejected) {
    ActionRegistry registry;
    try {
        registry.register_action(ActionDescriptor{});
        FAIL() << "expected InvalidRegistration";
    } catch (const InvalidRegistration &e) {
        EXPECT_EQ(e.field(), "id");
    }
}

TEST(ActionRegistry, DefaultValueMustBeAnOption) {
    ActionRegistry registry;
    ActionDescriptor descriptor;
    descriptor.id = "test.pick";
    descriptor.value_options = std::vector<std::string>{"a", "b"};
    descriptor.default_value = "c";
    try {
        registry.register_action(descriptor);
        FAIL() << "expected InvalidRegistration";
    } catch (const InvalidRegistration &e) {
        EXPECT_EQ(e.descriptor_id(), "test.pick");
        EXPECT_EQ(e.field(), "defaultValue");
    }
    EXPECT_FALSE(registry.has_action("test.pick"));
}

TEST(ActionRegistry, ReRegisteringReplaces) {
    ActionRegistry registry;
    ActionDescriptor descriptor;
    descriptor.id = "test.action";
    descriptor.display_name = "First";
    registry.register_action(descriptor);
    descriptor.display_name = "Second";
    registry.register_action(descriptor);

    EXPECT_EQ(registry.action_count(), 1u);
    EXPECT_EQ(registry.find_action("test.action")->display_name, "Second");
}

TEST(BuiltinActions, AllValidAndUnique) {
    ActionRegistry registry;
    const auto builtins = actions::builtin_actions();
    for (const auto &descriptor : builtins) {
        EXPECT_NO_THROW(registry.register_action(descriptor)) << descriptor.id;
    }
    EXPECT_EQ(registry.action_count(), builtins.size());
    EXPECT_EQ(builtins.size(), 12u);

    auto recall = registry.find_action(actions::kMemoryRecall);
    ASSERT_TRUE(recall.has_value());
    ASSERT_TRUE(recall->value_options.has_value());
    EXPECT_EQ(recall->value_options->size(), sdrbridge::data::kMemorySlotCount);
    EXPECT_EQ(recall->default_value, "1");
}

TEST(BuiltinActions, NavigationIds) {
    using sdrbridge::data::Screen;
    EXPECT_EQ(actions::navigation_id(Screen::MEMORY), "screen.memory");
    EXPECT_EQ(actions::screen_from_navigation_id("screen.dsp"), Screen::DSP);
    EXPECT_FALSE(actions::screen_from_navigation_id("screen.DSP").has_value());
    EXPECT_FALSE(actions::screen_from_navigation_id("screen.show").has_value());
    EXPECT_FALSE(actions::screen_from_navigation_id("dsp").has_value());
}
