#ifndef __TB_WEBSOCKET_PEER__
#define __TB_WEBSOCKET_PEER__

#include <ixwebsocket/IXWebSocket.h>

#include "Headers.hpp"
#include "PeerHandle.hpp"

namespace tb {
/**
 * @brief PeerHandle backed by a server-side IXWebSocket connection.
 *
 * Holds the socket weakly: the WebSocket server owns the connection and
 * destroys it once its thread finishes.
 */
class WebSocketPeer : public PeerHandle {
 public:
  WebSocketPeer(std::weak_ptr<ix::WebSocket> _webSocket, const string& _id)
      : webSocket(_webSocket), id(_id) {}

  virtual ~WebSocketPeer() {}

  virtual string getId() const { return id; }

  virtual bool sendText(const string& text);

  virtual void close(uint16_t code, const string& reason);

 protected:
  std::weak_ptr<ix::WebSocket> webSocket;
  string id;
};
}  // namespace tb

#endif  // __TB_WEBSOCKET_PEER__
