#ifndef __TB_PLUGIN_HOST__
#define __TB_PLUGIN_HOST__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tb {
/**
 * @brief Callback the host invokes to run an action; receives the action's
 * configured arguments as a JSON object keyed by parameter name.
 */
typedef std::function<void(const json& args)> ActionHandler;

/**
 * @brief The automation host that loads the plugin.
 *
 * Implementations must accept triggerEvent calls from any thread: connection
 * threads raise notifications while the host's own thread runs actions.
 */
class PluginHost {
 public:
  virtual ~PluginHost() {}

  /** @brief Makes an action available to the host's automation rules. */
  virtual void registerAction(const string& name, ActionHandler handler) = 0;

  /**
   * @brief Raises `<plugin prefix>.<suffix>` in the host, optionally with a
   * payload.
   */
  virtual void triggerEvent(const string& suffix,
                            const optional<string>& payload = nullopt) = 0;
};

/**
 * @brief Source of the variables that templated action text refers to.
 */
class VariableSource {
 public:
  virtual ~VariableSource() {}

  /** @brief Returns the value of a variable or nullopt if it is not set. */
  virtual optional<string> lookupVariable(const string& name) const = 0;
};
}  // namespace tb

#endif  // __TB_PLUGIN_HOST__
