#ifndef __TB_COMMAND__
#define __TB_COMMAND__

#include "Headers.hpp"

namespace tb {
/** @brief `target` value selecting the default tab (last position or the
 * active tab, depending on the command). */
static const int TARGET_DEFAULT = 0;
/** @brief `target` value selecting the tab at an explicit index. */
static const int TARGET_INDEX = 1;

/** @brief Highest tab index the actions accept. */
static const int MAX_TAB_INDEX = 100;

struct NewTabCommand {
  string url;
  bool active = false;
  bool pinned = false;
  int target = TARGET_DEFAULT;
  int index = 0;
};

/** @brief Points an existing tab at a new URL (the UpdateTab action). */
struct NewUrlCommand {
  string url;
  bool active = false;
  bool pinned = false;
  bool muted = false;
  int target = TARGET_DEFAULT;
  int index = 0;
};

struct ReloadTabCommand {
  int target = TARGET_DEFAULT;
  int index = 0;
  bool bypassCache = false;
};

struct MoveTabCommand {
  int target = TARGET_DEFAULT;
  int startIndex = 0;
  int endIndex = 0;
};

struct RemoveTabCommand {
  int target = TARGET_DEFAULT;
  int index = 0;
};

struct QueryActiveTabCommand {};

/** @brief Serialized with a top-level `data` field instead of `parameters`.
 */
struct QueryTabByIndexCommand {
  int index = 0;
};

/** @brief Serialized with a top-level `url` field instead of `parameters`. */
struct QueryTabCommand {
  string url;
};

/** @brief Text that is written to the peer verbatim. */
struct RawMessageCommand {
  string text;
};

/**
 * @brief An outbound instruction for the browser peer.
 *
 * Built by the action facade, encoded once by MessageCodec and then
 * discarded.
 */
typedef std::variant<NewTabCommand, NewUrlCommand, ReloadTabCommand,
                     MoveTabCommand, RemoveTabCommand, QueryActiveTabCommand,
                     QueryTabByIndexCommand, QueryTabCommand,
                     RawMessageCommand>
    Command;

/**
 * @brief Returns the wire name of the command (`NewTab`, `NewUrl`, ...).
 *
 * Raw messages have no wire name and return `SendMessage`.
 */
string commandName(const Command& command);

bool operator==(const NewTabCommand& a, const NewTabCommand& b);
bool operator==(const NewUrlCommand& a, const NewUrlCommand& b);
bool operator==(const ReloadTabCommand& a, const ReloadTabCommand& b);
bool operator==(const MoveTabCommand& a, const MoveTabCommand& b);
bool operator==(const RemoveTabCommand& a, const RemoveTabCommand& b);
bool operator==(const QueryActiveTabCommand& a,
                const QueryActiveTabCommand& b);
bool operator==(const QueryTabByIndexCommand& a,
                const QueryTabByIndexCommand& b);
bool operator==(const QueryTabCommand& a, const QueryTabCommand& b);
bool operator==(const RawMessageCommand& a, const RawMessageCommand& b);
}  // namespace tb

#endif  // __TB_COMMAND__
