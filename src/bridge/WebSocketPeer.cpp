#include "WebSocketPeer.hpp"

namespace tb {
bool WebSocketPeer::sendText(const string& text) {
  auto ws = webSocket.lock();
  if (!ws) {
    VLOG(1) << "Peer " << id << " is already gone";
    return false;
  }
  ix::WebSocketSendInfo info = ws->sendText(text);
  if (!info.success) {
    LOG(WARNING) << "Send to peer " << id << " failed, ready state "
                 << ix::WebSocket::readyStateToString(ws->getReadyState());
  }
  return info.success;
}

void WebSocketPeer::close(uint16_t code, const string& reason) {
  auto ws = webSocket.lock();
  if (!ws) {
    return;
  }
  LOG(INFO) << "Closing peer " << id << " (" << code << " " << reason << ")";
  ws->close(code, reason);
}
}  // namespace tb
