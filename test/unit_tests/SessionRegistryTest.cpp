#include "FakePeer.hpp"
#include "SessionRegistry.hpp"
#include "TestHeaders.hpp"

using namespace tb;

TEST_CASE("SessionRegistry starts detached", "[SessionRegistry]") {
  SessionRegistry registry;
  REQUIRE_FALSE(registry.isConnected());
  REQUIRE(registry.current().get() == nullptr);
  REQUIRE_FALSE(registry.send("dropped"));
  REQUIRE(registry.detach().get() == nullptr);
}

TEST_CASE("SessionRegistry relays to the attached peer",
          "[SessionRegistry]") {
  SessionRegistry registry;
  auto peer = make_shared<FakePeer>("1");
  REQUIRE(registry.attach(peer).get() == nullptr);
  REQUIRE(registry.isConnected());
  REQUIRE(registry.send("first"));
  REQUIRE(registry.send("second"));
  REQUIRE(peer->getSent() == vector<string>({"first", "second"}));
}

TEST_CASE("SessionRegistry hands back the displaced peer",
          "[SessionRegistry]") {
  SessionRegistry registry;
  auto oldPeer = make_shared<FakePeer>("1");
  auto newPeer = make_shared<FakePeer>("2");
  registry.attach(oldPeer);
  shared_ptr<PeerHandle> displaced = registry.attach(newPeer);
  REQUIRE(displaced.get() == oldPeer.get());
  REQUIRE(registry.current().get() == newPeer.get());

  registry.send("only the new peer");
  REQUIRE(oldPeer->getSent().empty());
  REQUIRE(newPeer->getSent().size() == 1);
}

TEST_CASE("SessionRegistry only detaches the current peer by id",
          "[SessionRegistry]") {
  SessionRegistry registry;
  registry.attach(make_shared<FakePeer>("1"));
  registry.attach(make_shared<FakePeer>("2"));

  // The displaced peer closing later must not end the new session
  REQUIRE_FALSE(registry.detachIfCurrent("1"));
  REQUIRE(registry.isConnected());

  REQUIRE(registry.detachIfCurrent("2"));
  REQUIRE_FALSE(registry.isConnected());
  REQUIRE_FALSE(registry.detachIfCurrent("2"));
}

TEST_CASE("SessionRegistry reports failed writes", "[SessionRegistry]") {
  SessionRegistry registry;
  auto peer = make_shared<FakePeer>("1");
  registry.attach(peer);
  peer->setFailWrites(true);
  REQUIRE_FALSE(registry.send("lost"));
  // A failed write does not detach the peer; the close event does
  REQUIRE(registry.isConnected());
}

TEST_CASE("SessionRegistry serializes concurrent senders",
          "[SessionRegistry]") {
  SessionRegistry registry;
  auto peer = make_shared<FakePeer>("1");
  registry.attach(peer);

  const int threadCount = 8;
  const int messagesPerThread = 200;
  vector<std::thread> senders;
  for (int t = 0; t < threadCount; t++) {
    senders.push_back(std::thread([&registry, t, messagesPerThread]() {
      for (int m = 0; m < messagesPerThread; m++) {
        registry.send(to_string(t) + ":" + to_string(m));
      }
    }));
  }
  for (auto& sender : senders) {
    sender.join();
  }

  vector<string> sent = peer->getSent();
  REQUIRE(sent.size() == size_t(threadCount * messagesPerThread));
  // Messages from one sender keep their order
  vector<int> nextExpected(threadCount, 0);
  for (const auto& text : sent) {
    auto colon = text.find(':');
    int t = stoi(text.substr(0, colon));
    int m = stoi(text.substr(colon + 1));
    REQUIRE(m == nextExpected[t]);
    nextExpected[t]++;
  }
}
