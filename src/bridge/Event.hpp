#ifndef __TB_EVENT__
#define __TB_EVENT__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tb {
/**
 * @brief A decoded inbound message from the browser peer.
 *
 * `data` is null when the peer omitted it. `raw` keeps the frame text so
 * notifications can forward the message exactly as received.
 */
struct Event {
  string command;
  json data;
  string raw;

  /**
   * @brief Looks up `data.<key>`.
   * @return nullptr when `data` is not an object or lacks the key.
   */
  const json* findData(const string& key) const {
    if (!data.is_object()) {
      return nullptr;
    }
    auto it = data.find(key);
    if (it == data.end()) {
      return nullptr;
    }
    return &(*it);
  }
};
}  // namespace tb

#endif  // __TB_EVENT__
