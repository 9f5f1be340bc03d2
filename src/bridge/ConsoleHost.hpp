#ifndef __TB_CONSOLE_HOST__
#define __TB_CONSOLE_HOST__

#include "BridgeErrors.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PluginHost.hpp"

namespace tb {
/**
 * @brief Minimal automation host for running the bridge from a terminal.
 *
 * Notifications are printed to the `stdout` logger as
 * `<prefix>.<suffix> <payload>`. The last notification is also stored in the
 * variables `event.suffix` and `event.payload`, so action text can refer to
 * it as `{event.payload}`.
 *
 * Each input line is one of:
 *
 *     <Action> [<json object of arguments>]
 *     set <name> <value>
 *     quit
 */
class ConsoleHost : public PluginHost, public VariableSource {
 public:
  explicit ConsoleHost(const string& _eventPrefix)
      : eventPrefix(_eventPrefix) {}

  virtual ~ConsoleHost() {}

  virtual void registerAction(const string& name, ActionHandler handler);

  virtual void triggerEvent(const string& suffix,
                            const optional<string>& payload = nullopt);

  virtual optional<string> lookupVariable(const string& name) const;

  void setVariable(const string& name, const string& value);

  vector<string> getActionNames();

  /**
   * @brief Runs one input line.
   * @return false if the line asks the host to quit.
   */
  bool executeLine(const string& line);

  /** @brief Executes lines until end of input or `quit`. */
  void run(std::istream& in);

 protected:
  string eventPrefix;
  std::map<string, ActionHandler> actions;
  std::map<string, string> variables;
  mutable std::mutex hostMutex;
};
}  // namespace tb

#endif  // __TB_CONSOLE_HOST__
