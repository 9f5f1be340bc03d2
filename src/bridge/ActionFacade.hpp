#ifndef __TB_ACTION_FACADE__
#define __TB_ACTION_FACADE__

#include "BridgeErrors.hpp"
#include "Command.hpp"
#include "Headers.hpp"
#include "PluginHost.hpp"
#include "TemplateExpander.hpp"

namespace tb {
/**
 * @brief Destination for commands built by the action facade.
 */
class CommandSink {
 public:
  virtual ~CommandSink() {}

  /** @return false if the command was dropped. */
  virtual bool send(const Command& command) = 0;
};

/**
 * @brief The tab-management actions the host can run.
 *
 * Each action expands templated URL text, builds its command and hands it to
 * the sink. Actions report nothing back: a command sent while no browser is
 * attached is silently dropped.
 */
class ActionFacade {
 public:
  ActionFacade(CommandSink* _sink, const VariableSource* _variables)
      : sink(_sink), expander(_variables) {}

  void newTab(const string& url, bool active, bool pinned, int target,
              int index);
  /** @brief Points a tab at a new URL; sent as the NewUrl command. */
  void updateTab(const string& url, bool active, bool pinned, bool muted,
                 int target, int index);
  void reloadTab(int target, int index, bool bypassCache);
  void moveTab(int target, int startIndex, int endIndex);
  void removeTab(int target, int index);
  void queryActiveTab();
  void queryTabByIndex(int index);
  void queryTab(const string& url);
  /** @brief Sends expanded text to the browser exactly as given. */
  void sendMessage(const string& message);

  /**
   * @brief Registers every action with the host.
   *
   * The registered handlers read named arguments from the host's JSON
   * object, using defaults for missing ones, and throw InvalidParameter for
   * arguments of the wrong type or out of range.
   */
  void registerActions(PluginHost* host);

 protected:
  void dispatch(const Command& command);

  CommandSink* sink;
  TemplateExpander expander;
};
}  // namespace tb

#endif  // __TB_ACTION_FACADE__
