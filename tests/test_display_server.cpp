#include "sdrbridge/display_server.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace sdrbridge;
using sdrbridge::input::InputBus;
using sdrbridge::input::MappedActionEvent;

namespace {

class DisplayServerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        bus.add_trigger_listener([this](const std::string &id) { triggers.push_back(id); });
        bus.add_mapped_listener([this](const MappedActionEvent &e) { mapped.push_back(e); });
    }

    InputBus bus;
    DisplayServer server{bus, "127.0.0.1", 0};
    std::vector<std::string> triggers;
    std::vector<MappedActionEvent> mapped;
};

} // namespace

TEST_F(DisplayServerTest, GetStateIsDirectTrigger) {
    server.handle_text(R"({"type": "getState"})");
    ASSERT_EQ(triggers.size(), 1u);
    EXPECT_EQ(triggers[0], "getState");
    EXPECT_TRUE(mapped.empty());
}

TEST_F(DisplayServerTest, NavigationAndActionIdsAreDirectTriggers) {
    server.handle_text(R"({"type": "screen.memory"})");
    server.handle_text(R"({"type": "dsp.nb_toggle", "payload": {}})");
    ASSERT_EQ(triggers.size(), 2u);
    EXPECT_EQ(triggers[0], "screen.memory");
    EXPECT_EQ(triggers[1], "dsp.nb_toggle");
}

TEST_F(DisplayServerTest, MappedActionEnvelope) {
    server.handle_text(
        R"({"type": "mappedAction", "payload": {"id": "memory.recall", "value": "4"}})");
    server.handle_text(R"({"type": "mappedAction", "payload": {"id": "vfo.tune_up"}})");
    server.handle_text(R"({"type": "mappedAction", "payload": {"id": "vfo.mode", "value": 3}})");

    ASSERT_EQ(mapped.size(), 3u);
    EXPECT_EQ(mapped[0].id, "memory.recall");
    EXPECT_EQ(mapped[0].value, "4");
    EXPECT_FALSE(mapped[1].value.has_value());
    EXPECT_EQ(mapped[2].value, "3");
    EXPECT_TRUE(triggers.empty());
}

TEST_F(DisplayServerTest, MalformedRequestsRejected) {
    server.handle_text("not json");
    server.handle_text(R"({"payload": {}})");
    server.handle_text(R"({"type": "mappedAction"})");
    server.handle_text(R"({"type": "mappedAction", "payload": {"value": "1"}})");

    EXPECT_EQ(server.rejected_count(), 4u);
    EXPECT_TRUE(triggers.empty());
    EXPECT_TRUE(mapped.empty());
}

TEST_F(DisplayServerTest, PushWithoutServerIsHarmless) {
    server.push(nlohmann::json{{"type", "appState"}});
    EXPECT_EQ(server.client_count(), 0u);
    server.stop();
}
