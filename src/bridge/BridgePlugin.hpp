#ifndef __TB_BRIDGE_PLUGIN__
#define __TB_BRIDGE_PLUGIN__

#include "ActionFacade.hpp"
#include "BridgeServer.hpp"
#include "Headers.hpp"
#include "PluginHost.hpp"

namespace tb {
/** @brief Registration metadata the host shows for the plugin. */
struct PluginInfo {
  string name;
  string guid;
  string author;
  string version;
  string kind;
  string description;
  bool canMultiLoad;
};

enum class PluginState {
  CREATED,
  RUNNING,
  STOPPED,
  FAILED,
};

string pluginStateToString(PluginState state);

/**
 * @brief Owns the bridge for as long as the host keeps the plugin started.
 *
 * Registers the actions on construction. start() creates a fresh server,
 * stop() tears it down, so nothing from one run survives into the next.
 */
class BridgePlugin : public CommandSink {
 public:
  BridgePlugin(PluginHost* _host, const VariableSource* _variables);

  virtual ~BridgePlugin();

  static const PluginInfo& getInfo();

  /**
   * @brief Starts listening for the browser extension.
   *
   * A no-op if already running.
   * @throws BindError if the endpoint cannot be bound; the plugin is then
   * FAILED and owns no server.
   */
  void start(const string& bindHost = DEFAULT_BRIDGE_HOST,
             int bindPort = DEFAULT_BRIDGE_PORT);

  /** @brief Stops and destroys the server. A no-op unless running. */
  void stop();

  PluginState getState();

  /** @brief The running server, or nullptr. */
  shared_ptr<BridgeServer> getServer();

  inline ActionFacade& getActions() { return actions; }

  /**
   * @brief Relays a command to the running server.
   * @return false if the plugin is not running or no peer is attached.
   */
  virtual bool send(const Command& command);

 protected:
  PluginHost* host;
  ActionFacade actions;
  shared_ptr<BridgeServer> server;
  PluginState state;
  /** @brief Held for the whole of start() and stop(). */
  std::mutex lifecycleMutex;
  /** @brief Guards `server` and `state`. */
  std::mutex pluginMutex;
};
}  // namespace tb

#endif  // __TB_BRIDGE_PLUGIN__
