#ifndef __TB_BRIDGE_SERVER__
#define __TB_BRIDGE_SERVER__

#include <ixwebsocket/IXWebSocketServer.h>

#include "BridgeErrors.hpp"
#include "Command.hpp"
#include "Dispatcher.hpp"
#include "Headers.hpp"
#include "MessageCodec.hpp"
#include "PluginHost.hpp"
#include "SessionRegistry.hpp"

namespace tb {
/** @brief Close code sent to a peer that a newer connection displaced. */
static const uint16_t CLOSE_CODE_REPLACED = 4000;

/**
 * @brief Local WebSocket server that the browser extension connects to.
 *
 * Listens on host:port, keeps the most recent connection as the session
 * (evicting and closing any earlier one), feeds inbound frames to the
 * Dispatcher in arrival order and relays outbound commands to the session.
 * Accepting and reading run on the WebSocket server's own threads, so start()
 * returns as soon as the endpoint is bound.
 */
class BridgeServer {
 public:
  explicit BridgeServer(PluginHost* _pluginHost);

  /** @brief Stops the server if it is still running. */
  virtual ~BridgeServer();

  /**
   * @brief Binds host:port and starts accepting peers.
   *
   * A no-op (logged) if the server is already listening.
   * @throws BindError if the host cannot be resolved or the port cannot be
   * bound.
   */
  void start(const string& _host, int _port);

  /**
   * @brief Closes every connection, releases the port, clears the session
   * and waits for all server threads to exit.
   *
   * A no-op if the server is not listening.
   */
  void stop();

  inline bool isListening() {
    lock_guard<std::mutex> guard(serverMutex);
    return webSocketServer.get() != nullptr;
  }

  inline string getHost() {
    lock_guard<std::mutex> guard(serverMutex);
    return host;
  }

  inline int getPort() {
    lock_guard<std::mutex> guard(serverMutex);
    return port;
  }

  inline SessionRegistry& getSessionRegistry() { return sessionRegistry; }

  /**
   * @brief Encodes a command and writes it to the session.
   * @return false if no peer is attached (the command is dropped) or the
   * write failed.
   */
  bool send(const Command& command);

  /**
   * @brief Handles a peer whose WebSocket handshake completed.
   *
   * Attaches it, closes the peer it displaced and raises PeerDisconnected
   * for that peer before PeerConnected for the new one.
   */
  void peerOpened(shared_ptr<PeerHandle> peer);

  /**
   * @brief Handles a closed or reset connection.
   *
   * Raises PeerDisconnected only if the peer was still the session.
   */
  void peerClosed(const string& peerId);

  /**
   * @brief Decodes one inbound text frame from `peerId` and dispatches it.
   *
   * Frames from a peer that is not the session (e.g. one evicted but not
   * yet closed) are dropped, as are malformed frames and events with
   * missing fields.
   * @return The number of notifications raised.
   */
  int processFrame(const string& peerId, const string& text);

  /**
   * @brief Resolves a host name to the IPv4 address the server binds.
   * @throws BindError if the name does not resolve.
   */
  static string resolveBindAddress(const string& hostname, int port);

 protected:
  void handleConnection(std::weak_ptr<ix::WebSocket> webSocketWeak,
                        std::shared_ptr<ix::ConnectionState> connectionState);

  PluginHost* pluginHost;
  Dispatcher dispatcher;
  SessionRegistry sessionRegistry;
  /** @brief The running transport, nullptr when stopped. */
  std::unique_ptr<ix::WebSocketServer> webSocketServer;
  /** @brief Endpoint of the running transport. */
  string host;
  int port;
  /** @brief Held for the whole of start() and stop(). */
  std::mutex lifecycleMutex;
  /** @brief Guards `webSocketServer` and the endpoint fields. */
  std::mutex serverMutex;
  /** @brief Serializes connect/disconnect events. */
  std::mutex connectMutex;
};
}  // namespace tb

#endif  // __TB_BRIDGE_SERVER__
