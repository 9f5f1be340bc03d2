#ifndef __TB_PEER_HANDLE__
#define __TB_PEER_HANDLE__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Send-capable reference to one connected browser peer.
 *
 * Provides an abstract API so the session logic can run against a real
 * WebSocket connection or an in-memory fake.
 */
class PeerHandle {
 public:
  virtual ~PeerHandle() {}

  /** @brief Identifier that is unique for the lifetime of the server. */
  virtual string getId() const = 0;

  /**
   * @brief Writes one text frame.
   * @return false if the connection is gone or the write failed.
   */
  virtual bool sendText(const string& text) = 0;

  /** @brief Starts a close handshake with the given WebSocket close code. */
  virtual void close(uint16_t code, const string& reason) = 0;
};
}  // namespace tb

#endif  // __TB_PEER_HANDLE__
