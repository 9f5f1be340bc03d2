#ifndef __TB_DISPATCHER__
#define __TB_DISPATCHER__

#include "BridgeErrors.hpp"
#include "Event.hpp"
#include "Headers.hpp"
#include "PluginHost.hpp"

namespace tb {
/** @brief Raised when a browser peer attaches. */
static const char* const PEER_CONNECTED_EVENT = "PeerConnected";
/** @brief Raised when the attached browser peer goes away. */
static const char* const PEER_DISCONNECTED_EVENT = "PeerDisconnected";

/** @brief Inbound command tags the dispatcher understands. */
enum class EventTag {
  QUERY_ACTIVE_TAB,
  QUERY_TAB_BY_INDEX,
  ACTIVE_TAB,
  TAB_UPDATED,
  CREATE_NEW_TAB,
  MOVE_TAB,
  REMOVE_TAB,
};

/** @brief Where a notification takes its payload from. */
enum class PayloadSource {
  RAW_MESSAGE,
  DATA_URL,
  DATA_INDEX,
};

struct NotificationRule {
  const char* suffix;
  PayloadSource source;
};

/** @brief A notification ready to be raised in the host. */
struct Notification {
  string suffix;
  optional<string> payload;
};

/**
 * @brief Maps decoded events to host notifications.
 *
 * Stateless: dispatching the same event twice raises the same notifications
 * twice.
 */
class Dispatcher {
 public:
  explicit Dispatcher(PluginHost* _host) : host(_host) {}

  /** @brief Maps a wire tag to its EventTag, or nullopt if unknown. */
  static optional<EventTag> parseTag(const string& command);

  /** @brief The notifications raised for a tag, in the order raised. */
  static const vector<NotificationRule>& rulesFor(EventTag tag);

  /**
   * @brief Resolves every payload for an event without raising anything.
   *
   * Unknown tags resolve to no notifications.
   * @throws MissingField if a payload needs a `data` field the event lacks.
   */
  static vector<Notification> resolve(const Event& event);

  /**
   * @brief Raises the notifications for an event in table order.
   *
   * Nothing is raised if any required field is missing.
   * @return The number of notifications raised.
   * @throws MissingField as resolve().
   */
  int dispatch(const Event& event);

 protected:
  PluginHost* host;
};
}  // namespace tb

#endif  // __TB_DISPATCHER__
