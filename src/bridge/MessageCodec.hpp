#ifndef __TB_MESSAGE_CODEC__
#define __TB_MESSAGE_CODEC__

#include "BridgeErrors.hpp"
#include "Command.hpp"
#include "Event.hpp"
#include "Headers.hpp"

namespace tb {
/**
 * @brief Converts between typed commands/events and the JSON text carried in
 * WebSocket text frames.
 *
 * Outbound commands are `{"command": <name>, "parameters": {...}}`, except
 * `QueryActiveTab` (no parameters), `QueryTabByIndex` (top-level `data`),
 * `QueryTab` (top-level `url`) and raw messages (sent verbatim). Inbound
 * events are `{"command": <tag>, "data": {...}}`.
 */
class MessageCodec {
 public:
  /** @brief Serializes a command to the text sent to the peer. */
  static string encode(const Command& command);

  /**
   * @brief Parses an inbound frame.
   *
   * The tag is not validated; unknown tags are left for the dispatcher to
   * ignore.
   * @throws MalformedMessage if the text is not a JSON object or has no
   * string `command` field.
   */
  static Event decode(const string& text);

  /**
   * @brief Parses an outbound command the way the browser extension reads
   * it.
   *
   * Text that does not carry a known command name is returned as a
   * RawMessageCommand.
   * @throws MalformedMessage if a known command is missing a parameter or
   * a parameter has the wrong type.
   */
  static Command decodeCommand(const string& text);
};
}  // namespace tb

#endif  // __TB_MESSAGE_CODEC__
