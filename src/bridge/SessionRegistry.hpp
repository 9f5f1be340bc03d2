#ifndef __TB_SESSION_REGISTRY__
#define __TB_SESSION_REGISTRY__

#include "Headers.hpp"
#include "PeerHandle.hpp"

namespace tb {
/**
 * @brief Tracks the single browser peer the bridge talks to.
 *
 * At most one peer is current. Attaching a new peer replaces the old one and
 * hands it back so the caller can close it. Every mutation and every write
 * happens under one mutex, so frames from concurrent senders never
 * interleave.
 */
class SessionRegistry {
 public:
  SessionRegistry() {}

  /**
   * @brief Makes `peer` the current session.
   * @return The peer that was displaced, or nullptr.
   */
  shared_ptr<PeerHandle> attach(shared_ptr<PeerHandle> peer);

  /**
   * @brief Clears the current session.
   * @return The peer that was detached, or nullptr if none was attached.
   */
  shared_ptr<PeerHandle> detach();

  /**
   * @brief Clears the session only if `peerId` is the current peer.
   *
   * Used when a connection closes, since a displaced peer is no longer
   * current.
   */
  bool detachIfCurrent(const string& peerId);

  shared_ptr<PeerHandle> current();

  inline bool isConnected() {
    lock_guard<std::mutex> guard(registryMutex);
    return peer.get() != nullptr;
  }

  /**
   * @brief Relays a text frame to the current peer.
   * @return false if no peer is attached (the text is dropped) or the write
   * failed.
   */
  bool send(const string& text);

 protected:
  /** @brief The attached peer, nullptr when detached. */
  shared_ptr<PeerHandle> peer;
  /** @brief Guards `peer` and serializes writes to it. */
  std::mutex registryMutex;
};
}  // namespace tb

#endif  // __TB_SESSION_REGISTRY__
