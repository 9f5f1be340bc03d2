#include "BridgeServer.hpp"

#include <ixwebsocket/IXNetSystem.h>

#include "WebSocketPeer.hpp"

namespace tb {
BridgeServer::BridgeServer(PluginHost* _pluginHost)
    : pluginHost(_pluginHost), dispatcher(_pluginHost), port(0) {
  ix::initNetSystem();
}

BridgeServer::~BridgeServer() { stop(); }

string BridgeServer::resolveBindAddress(const string& hostname, int port) {
  struct addrinfo hints, *results = NULL;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  int rc = getaddrinfo(hostname.c_str(), NULL, &hints, &results);
  if (rc != 0 || results == NULL) {
    if (results) {
      freeaddrinfo(results);
    }
    throw BindError(hostname, port,
                    string("cannot resolve host: ") + gai_strerror(rc));
  }
  char address[INET_ADDRSTRLEN];
  const sockaddr_in* ipv4 = (const sockaddr_in*)results->ai_addr;
  const char* converted =
      inet_ntop(AF_INET, &ipv4->sin_addr, address, sizeof(address));
  freeaddrinfo(results);
  if (converted == NULL) {
    throw BindError(hostname, port, strerror(GetErrno()));
  }
  return string(address);
}

void BridgeServer::start(const string& _host, int _port) {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  if (isListening()) {
    LOG(WARNING) << "Bridge server is already listening on " << getHost()
                 << ":" << getPort();
    return;
  }

  string bindAddress = resolveBindAddress(_host, _port);
  std::unique_ptr<ix::WebSocketServer> newServer(
      new ix::WebSocketServer(_port, bindAddress));
  newServer->disablePerMessageDeflate();
  newServer->setOnConnectionCallback(
      [this](std::weak_ptr<ix::WebSocket> webSocketWeak,
             std::shared_ptr<ix::ConnectionState> connectionState) {
        handleConnection(webSocketWeak, connectionState);
      });

  auto result = newServer->listen();
  if (!result.first) {
    LOG(ERROR) << "Cannot listen on " << bindAddress << ":" << _port << ": "
               << result.second;
    throw BindError(_host, _port, result.second);
  }
  newServer->start();

  {
    lock_guard<std::mutex> guard(serverMutex);
    webSocketServer = std::move(newServer);
    host = _host;
    port = _port;
  }
  LOG(INFO) << "Bridge server listening on " << _host << ":" << _port << " ("
            << bindAddress << ")";
}

void BridgeServer::stop() {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  std::unique_ptr<ix::WebSocketServer> stopping;
  {
    lock_guard<std::mutex> guard(serverMutex);
    if (!webSocketServer) {
      return;
    }
    stopping = std::move(webSocketServer);
  }
  LOG(INFO) << "Stopping bridge server on " << host << ":" << port;

  // Closes every connection and joins the accept and connection threads
  stopping->stop();
  stopping.reset();

  {
    lock_guard<std::mutex> guard(connectMutex);
    shared_ptr<PeerHandle> leftover = sessionRegistry.detach();
    if (leftover) {
      LOG(INFO) << "Dropping session for peer " << leftover->getId();
      pluginHost->triggerEvent(PEER_DISCONNECTED_EVENT);
    }
  }
  LOG(INFO) << "Bridge server stopped";
}

bool BridgeServer::send(const Command& command) {
  return sessionRegistry.send(MessageCodec::encode(command));
}

void BridgeServer::peerOpened(shared_ptr<PeerHandle> peer) {
  lock_guard<std::mutex> guard(connectMutex);
  LOG(INFO) << "Peer connected: " << peer->getId();
  shared_ptr<PeerHandle> displaced = sessionRegistry.attach(peer);
  if (displaced) {
    displaced->close(CLOSE_CODE_REPLACED, "replaced by a newer connection");
    pluginHost->triggerEvent(PEER_DISCONNECTED_EVENT);
  }
  pluginHost->triggerEvent(PEER_CONNECTED_EVENT);
}

void BridgeServer::peerClosed(const string& peerId) {
  lock_guard<std::mutex> guard(connectMutex);
  if (!sessionRegistry.detachIfCurrent(peerId)) {
    VLOG(1) << "Closed peer " << peerId << " was not the session";
    return;
  }
  LOG(INFO) << "Peer disconnected: " << peerId;
  pluginHost->triggerEvent(PEER_DISCONNECTED_EVENT);
}

int BridgeServer::processFrame(const string& peerId, const string& text) {
  VLOG(2) << "Received from " << peerId << ": " << text;
  shared_ptr<PeerHandle> current = sessionRegistry.current();
  if (!current || current->getId() != peerId) {
    VLOG(1) << "Dropping frame from peer " << peerId
            << " that is not the session";
    return 0;
  }
  try {
    Event event = MessageCodec::decode(text);
    return dispatcher.dispatch(event);
  } catch (const MalformedMessage& mm) {
    LOG(WARNING) << "Dropping frame: " << mm.what() << " (" << mm.getText()
                 << ")";
  } catch (const MissingField& mf) {
    LOG(WARNING) << "Dropping event: " << mf.what();
  }
  return 0;
}

void BridgeServer::handleConnection(
    std::weak_ptr<ix::WebSocket> webSocketWeak,
    std::shared_ptr<ix::ConnectionState> connectionState) {
  if (!connectionState) {
    return;
  }
  auto webSocket = webSocketWeak.lock();
  if (!webSocket) {
    return;
  }
  shared_ptr<PeerHandle> peer(
      new WebSocketPeer(webSocketWeak, connectionState->getId()));
  VLOG(1) << "New connection " << peer->getId();

  webSocket->setOnMessageCallback([this, peer](
                                      const ix::WebSocketMessagePtr& msg) {
    if (!msg) {
      return;
    }
    try {
      switch (msg->type) {
        case ix::WebSocketMessageType::Open:
          el::Helpers::setThreadName("bridge-peer-" + peer->getId());
          peerOpened(peer);
          break;
        case ix::WebSocketMessageType::Close:
          VLOG(1) << "Connection " << peer->getId() << " closed ("
                  << msg->closeInfo.code << " " << msg->closeInfo.reason
                  << ")";
          peerClosed(peer->getId());
          break;
        case ix::WebSocketMessageType::Error:
          LOG(WARNING) << "Connection " << peer->getId()
                       << " error: " << msg->errorInfo.reason;
          break;
        case ix::WebSocketMessageType::Message:
          if (msg->binary) {
            LOG(WARNING) << "Ignoring binary frame from " << peer->getId();
            break;
          }
          processFrame(peer->getId(), msg->str);
          break;
        default:
          break;
      }
    } catch (const std::exception& e) {
      LOG(ERROR) << "Error handling message from " << peer->getId() << ": "
                 << e.what();
    }
  });
}
}  // namespace tb
