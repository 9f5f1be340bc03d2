#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocket.h>

#include "BridgePlugin.hpp"
#include "RecordingHost.hpp"
#include "TestHeaders.hpp"

namespace tb {
namespace {
const int BRIDGE_TEST_PORT = 18741;

bool waitFor(std::function<bool()> condition, int timeoutMs = 5000) {
  for (int waited = 0; waited < timeoutMs; waited += 10) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

/**
 * Stands in for the browser extension: a WebSocket client that records the
 * commands the bridge sends it.
 */
class TestBrowser {
 public:
  explicit TestBrowser(int port) : opened(false), closed(false), closeCode(0) {
    ix::initNetSystem();
    webSocket.setUrl("ws://127.0.0.1:" + to_string(port) + "/");
    webSocket.disablePerMessageDeflate();
    webSocket.disableAutomaticReconnection();
    webSocket.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
      lock_guard<std::mutex> guard(browserMutex);
      switch (msg->type) {
        case ix::WebSocketMessageType::Open:
          opened = true;
          break;
        case ix::WebSocketMessageType::Close:
          closed = true;
          closeCode = msg->closeInfo.code;
          break;
        case ix::WebSocketMessageType::Message:
          received.push_back(msg->str);
          break;
        default:
          break;
      }
    });
  }

  ~TestBrowser() { webSocket.stop(); }

  bool connect() {
    webSocket.start();
    return waitFor([this]() {
      lock_guard<std::mutex> guard(browserMutex);
      return opened;
    });
  }

  void sendText(const string& text) { webSocket.sendText(text); }

  void disconnect() { webSocket.stop(); }

  bool waitForClose() {
    return waitFor([this]() {
      lock_guard<std::mutex> guard(browserMutex);
      return closed;
    });
  }

  bool waitForMessages(size_t count) {
    return waitFor([this, count]() {
      lock_guard<std::mutex> guard(browserMutex);
      return received.size() >= count;
    });
  }

  vector<string> getReceived() {
    lock_guard<std::mutex> guard(browserMutex);
    return received;
  }

  uint16_t getCloseCode() {
    lock_guard<std::mutex> guard(browserMutex);
    return closeCode;
  }

 protected:
  ix::WebSocket webSocket;
  bool opened;
  bool closed;
  uint16_t closeCode;
  vector<string> received;
  std::mutex browserMutex;
};
}  // namespace
}  // namespace tb

using namespace tb;

TEST_CASE("Bridge relays events and commands over a WebSocket",
          "[WebSocketBridge]") {
  RecordingHost host;
  BridgePlugin plugin(&host, &host);
  plugin.start("localhost", BRIDGE_TEST_PORT);

  TestBrowser browser(BRIDGE_TEST_PORT);
  REQUIRE(browser.connect());
  REQUIRE(host.waitForEvents(1));
  REQUIRE(host.getSuffixes() == vector<string>({PEER_CONNECTED_EVENT}));

  const string activeTab =
      "{\"command\":\"ActiveTab\",\"data\":{\"url\":\"http://a.com\","
      "\"title\":\"A\"}}";
  browser.sendText(activeTab);
  REQUIRE(host.waitForEvents(3));
  auto events = host.getEvents();
  REQUIRE(events[1].suffix == "ActiveTabUrl");
  REQUIRE(*events[1].payload == "http://a.com");
  REQUIRE(events[2].suffix == "ActiveTabInfo");
  REQUIRE(*events[2].payload == activeTab);

  host.setVariable("site", "example.com");
  host.runAction("NewTab", json::parse("{\"url\":\"http://{site}\","
                                       "\"active\":true,\"target\":1,"
                                       "\"index\":3}"));
  host.runAction("QueryTabByIndex", json::parse("{\"index\":2}"));
  REQUIRE(browser.waitForMessages(2));
  REQUIRE(browser.getReceived() ==
          vector<string>({"{\"command\":\"NewTab\",\"parameters\":{\"url\":"
                          "\"http://example.com\",\"active\":true,\"pinned\":"
                          "false,\"target\":1,\"index\":3}}",
                          "{\"command\":\"QueryTabByIndex\",\"data\":2}"}));

  browser.disconnect();
  REQUIRE(host.waitForEvents(4));
  REQUIRE(host.getEvents()[3].suffix == PEER_DISCONNECTED_EVENT);
  REQUIRE_FALSE(plugin.send(QueryActiveTabCommand()));

  plugin.stop();
}

TEST_CASE("Bridge keeps inbound frame order", "[WebSocketBridge]") {
  RecordingHost host;
  BridgePlugin plugin(&host, &host);
  plugin.start("127.0.0.1", BRIDGE_TEST_PORT + 1);

  TestBrowser browser(BRIDGE_TEST_PORT + 1);
  REQUIRE(browser.connect());
  REQUIRE(host.waitForEvents(1));

  const int frameCount = 50;
  for (int i = 0; i < frameCount; i++) {
    browser.sendText("{\"command\":\"MoveTab\",\"data\":{\"seq\":" +
                     to_string(i) + "}}");
  }
  REQUIRE(host.waitForEvents(1 + frameCount));
  auto events = host.getEvents();
  for (int i = 0; i < frameCount; i++) {
    json payload = json::parse(*events[1 + i].payload);
    REQUIRE(payload["data"]["seq"] == i);
  }

  plugin.stop();
}

TEST_CASE("Bridge replaces an older browser connection",
          "[WebSocketBridge]") {
  RecordingHost host;
  BridgePlugin plugin(&host, &host);
  plugin.start("127.0.0.1", BRIDGE_TEST_PORT + 2);

  TestBrowser first(BRIDGE_TEST_PORT + 2);
  REQUIRE(first.connect());
  REQUIRE(host.waitForEvents(1));

  TestBrowser second(BRIDGE_TEST_PORT + 2);
  REQUIRE(second.connect());
  REQUIRE(host.waitForEvents(3));
  REQUIRE(first.waitForClose());
  REQUIRE(first.getCloseCode() == CLOSE_CODE_REPLACED);

  // The evicted connection closing must not report the new session as gone
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  REQUIRE(host.getSuffixes() ==
          vector<string>({PEER_CONNECTED_EVENT, PEER_DISCONNECTED_EVENT,
                          PEER_CONNECTED_EVENT}));

  host.runAction("QueryActiveTab");
  REQUIRE(second.waitForMessages(1));
  REQUIRE(second.getReceived()[0] == "{\"command\":\"QueryActiveTab\"}");
  REQUIRE(first.getReceived().empty());

  plugin.stop();
}

TEST_CASE("Stopping the bridge disconnects the browser",
          "[WebSocketBridge]") {
  RecordingHost host;
  BridgePlugin plugin(&host, &host);
  plugin.start("127.0.0.1", BRIDGE_TEST_PORT + 3);

  TestBrowser browser(BRIDGE_TEST_PORT + 3);
  REQUIRE(browser.connect());
  REQUIRE(host.waitForEvents(1));

  plugin.stop();
  REQUIRE(browser.waitForClose());
  REQUIRE(host.waitForEvents(2));
  REQUIRE(host.getSuffixes() ==
          vector<string>({PEER_CONNECTED_EVENT, PEER_DISCONNECTED_EVENT}));

  // A new server on the same port accepts a new browser
  plugin.start("127.0.0.1", BRIDGE_TEST_PORT + 3);
  TestBrowser again(BRIDGE_TEST_PORT + 3);
  REQUIRE(again.connect());
  REQUIRE(host.waitForEvents(3));
  plugin.stop();
}
