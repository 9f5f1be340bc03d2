#include "Dispatcher.hpp"
#include "MessageCodec.hpp"
#include "RecordingHost.hpp"
#include "TestHeaders.hpp"

using namespace tb;

namespace {
vector<RecordingHost::RaisedEvent> dispatchText(const string& text) {
  RecordingHost host;
  Dispatcher dispatcher(&host);
  dispatcher.dispatch(MessageCodec::decode(text));
  return host.getEvents();
}
}  // namespace

TEST_CASE("Dispatcher raises QueryActiveTab notifications",
          "[Dispatcher]") {
  const string text =
      "{\"command\":\"QueryActiveTab\",\"data\":{\"url\":\"http://a\"}}";
  auto events = dispatchText(text);
  REQUIRE(events.size() == 2);
  REQUIRE(events[0].suffix == "QueryActiveTabInfo");
  REQUIRE(*events[0].payload == text);
  REQUIRE(events[1].suffix == "QueryActiveTab");
  REQUIRE(*events[1].payload == "http://a");
}

TEST_CASE("Dispatcher raises QueryTabByIndex notifications",
          "[Dispatcher]") {
  const string text =
      "{\"command\":\"QueryTabByIndex\",\"data\":{\"index\":3,\"url\":"
      "\"http://b\"}}";
  auto events = dispatchText(text);
  REQUIRE(events.size() == 2);
  REQUIRE(events[0].suffix == "QueryTabByIndex");
  REQUIRE(*events[0].payload == "3");
  REQUIRE(events[1].suffix == "QueryTabByIndexInfo");
  REQUIRE(*events[1].payload == text);
}

TEST_CASE("Dispatcher raises ActiveTab notifications", "[Dispatcher]") {
  const string text =
      "{\"command\":\"ActiveTab\",\"data\":{\"url\":\"http://c\"}}";
  auto events = dispatchText(text);
  REQUIRE(events.size() == 2);
  REQUIRE(events[0].suffix == "ActiveTabUrl");
  REQUIRE(*events[0].payload == "http://c");
  REQUIRE(events[1].suffix == "ActiveTabInfo");
  REQUIRE(*events[1].payload == text);
}

TEST_CASE("Dispatcher raises TabUpdated notifications", "[Dispatcher]") {
  const string text =
      "{\"command\":\"TabUpdated\",\"data\":{\"url\":\"http://d\"}}";
  auto events = dispatchText(text);
  REQUIRE(events.size() == 2);
  REQUIRE(events[0].suffix == "ActiveTabUrl");
  REQUIRE(*events[0].payload == "http://d");
  REQUIRE(events[1].suffix == "ActiveTabUrInfo");
  REQUIRE(*events[1].payload == text);
}

TEST_CASE("Dispatcher forwards raw text for tab lifecycle events",
          "[Dispatcher]") {
  for (const string& tag : {"CreateNewTab", "MoveTab", "RemoveTab"}) {
    const string text = "{\"command\":\"" + tag + "\",\"data\":{\"id\":1}}";
    auto events = dispatchText(text);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].suffix == tag);
    REQUIRE(*events[0].payload == text);
  }
}

TEST_CASE("Dispatcher ignores unknown tags", "[Dispatcher]") {
  RecordingHost host;
  Dispatcher dispatcher(&host);
  REQUIRE(dispatcher.dispatch(MessageCodec::decode(
              "{\"command\":\"Mystery\",\"data\":{\"url\":\"x\"}}")) == 0);
  REQUIRE(host.getEvents().empty());
}

TEST_CASE("Dispatcher raises nothing when a field is missing",
          "[Dispatcher]") {
  RecordingHost host;
  Dispatcher dispatcher(&host);

  SECTION("ActiveTab without data") {
    REQUIRE_THROWS_AS(
        dispatcher.dispatch(MessageCodec::decode("{\"command\":\"ActiveTab\"}")),
        MissingField);
  }
  SECTION("QueryActiveTab with the url after the raw notification") {
    // The raw notification comes first in the table but must not be raised
    try {
      dispatcher.dispatch(
          MessageCodec::decode("{\"command\":\"QueryActiveTab\",\"data\":{}}"));
      FAIL("dispatch should have thrown");
    } catch (const MissingField& mf) {
      REQUIRE(mf.getCommand() == "QueryActiveTab");
      REQUIRE(mf.getField() == "data.url");
    }
  }
  SECTION("QueryTabByIndex with a null index") {
    REQUIRE_THROWS_AS(dispatcher.dispatch(MessageCodec::decode(
                          "{\"command\":\"QueryTabByIndex\",\"data\":{"
                          "\"index\":null}}")),
                      MissingField);
  }
  REQUIRE(host.getEvents().empty());
}

TEST_CASE("Dispatcher is stateless", "[Dispatcher]") {
  RecordingHost host;
  Dispatcher dispatcher(&host);
  Event event = MessageCodec::decode("{\"command\":\"MoveTab\"}");
  REQUIRE(dispatcher.dispatch(event) == 1);
  REQUIRE(dispatcher.dispatch(event) == 1);
  REQUIRE(host.getSuffixes() == vector<string>({"MoveTab", "MoveTab"}));
}

TEST_CASE("Dispatcher knows every inbound tag", "[Dispatcher]") {
  REQUIRE(Dispatcher::parseTag("QueryActiveTab") ==
          EventTag::QUERY_ACTIVE_TAB);
  REQUIRE(Dispatcher::parseTag("TabUpdated") == EventTag::TAB_UPDATED);
  REQUIRE_FALSE(Dispatcher::parseTag("queryactivetab").has_value());
  REQUIRE(Dispatcher::rulesFor(EventTag::REMOVE_TAB).size() == 1);
}
