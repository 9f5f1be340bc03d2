#include "BridgePlugin.hpp"

namespace tb {
string pluginStateToString(PluginState state) {
  switch (state) {
    case PluginState::CREATED:
      return "created";
    case PluginState::RUNNING:
      return "running";
    case PluginState::STOPPED:
      return "stopped";
    case PluginState::FAILED:
      return "failed";
  }
  return "unknown";
}

BridgePlugin::BridgePlugin(PluginHost* _host,
                           const VariableSource* _variables)
    : host(_host), actions(this, _variables), state(PluginState::CREATED) {
  actions.registerActions(host);
}

BridgePlugin::~BridgePlugin() { stop(); }

const PluginInfo& BridgePlugin::getInfo() {
  static const PluginInfo info = {
      "Google Chrome",
      "{2CD4676D-6C65-499F-B538-3B59878F76A9}",
      "Medy",
      "0.0.1b",
      "other",
      "Connecting EG with Chrome Browser and vice versa for native control.",
      false,
  };
  return info;
}

void BridgePlugin::start(const string& bindHost, int bindPort) {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  {
    lock_guard<std::mutex> guard(pluginMutex);
    if (state == PluginState::RUNNING) {
      LOG(WARNING) << "Plugin is already running";
      return;
    }
  }

  shared_ptr<BridgeServer> newServer(new BridgeServer(host));
  try {
    newServer->start(bindHost, bindPort);
  } catch (const BindError& be) {
    LOG(ERROR) << "Plugin failed to start: " << be.what();
    lock_guard<std::mutex> guard(pluginMutex);
    state = PluginState::FAILED;
    throw;
  }

  lock_guard<std::mutex> guard(pluginMutex);
  server = newServer;
  state = PluginState::RUNNING;
}

void BridgePlugin::stop() {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  shared_ptr<BridgeServer> stopping;
  {
    lock_guard<std::mutex> guard(pluginMutex);
    if (state != PluginState::RUNNING) {
      return;
    }
    stopping = server;
    server.reset();
    state = PluginState::STOPPED;
  }
  // pluginMutex must be free here: host rules run by the notifications
  // raised while stopping may call send()
  stopping->stop();
}

PluginState BridgePlugin::getState() {
  lock_guard<std::mutex> guard(pluginMutex);
  return state;
}

shared_ptr<BridgeServer> BridgePlugin::getServer() {
  lock_guard<std::mutex> guard(pluginMutex);
  return server;
}

bool BridgePlugin::send(const Command& command) {
  shared_ptr<BridgeServer> current = getServer();
  if (!current) {
    VLOG(1) << "Plugin is not running, dropping " << commandName(command);
    return false;
  }
  return current->send(command);
}
}  // namespace tb
