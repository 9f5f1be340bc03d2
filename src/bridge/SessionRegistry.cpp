#include "SessionRegistry.hpp"

namespace tb {
shared_ptr<PeerHandle> SessionRegistry::attach(shared_ptr<PeerHandle> newPeer) {
  if (!newPeer) {
    STFATAL << "Tried to attach a null peer";
  }
  lock_guard<std::mutex> guard(registryMutex);
  shared_ptr<PeerHandle> displaced = peer;
  peer = newPeer;
  if (displaced) {
    LOG(INFO) << "Peer " << newPeer->getId() << " replaces peer "
              << displaced->getId();
  } else {
    VLOG(1) << "Attached peer " << newPeer->getId();
  }
  return displaced;
}

shared_ptr<PeerHandle> SessionRegistry::detach() {
  lock_guard<std::mutex> guard(registryMutex);
  shared_ptr<PeerHandle> detached = peer;
  peer.reset();
  return detached;
}

bool SessionRegistry::detachIfCurrent(const string& peerId) {
  lock_guard<std::mutex> guard(registryMutex);
  if (!peer || peer->getId() != peerId) {
    return false;
  }
  peer.reset();
  return true;
}

shared_ptr<PeerHandle> SessionRegistry::current() {
  lock_guard<std::mutex> guard(registryMutex);
  return peer;
}

bool SessionRegistry::send(const string& text) {
  lock_guard<std::mutex> guard(registryMutex);
  if (!peer) {
    VLOG(1) << "No peer attached, dropping message";
    return false;
  }
  VLOG(2) << "Sending to peer " << peer->getId() << ": " << text;
  if (!peer->sendText(text)) {
    LOG(WARNING) << "Write to peer " << peer->getId() << " failed";
    return false;
  }
  return true;
}
}  // namespace tb
