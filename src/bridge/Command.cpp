#include "Command.hpp"

namespace tb {
namespace {
struct CommandNameVisitor {
  string operator()(const NewTabCommand&) const { return "NewTab"; }
  string operator()(const NewUrlCommand&) const { return "NewUrl"; }
  string operator()(const ReloadTabCommand&) const { return "ReloadTab"; }
  string operator()(const MoveTabCommand&) const { return "MoveTab"; }
  string operator()(const RemoveTabCommand&) const { return "RemoveTab"; }
  string operator()(const QueryActiveTabCommand&) const {
    return "QueryActiveTab";
  }
  string operator()(const QueryTabByIndexCommand&) const {
    return "QueryTabByIndex";
  }
  string operator()(const QueryTabCommand&) const { return "QueryTab"; }
  string operator()(const RawMessageCommand&) const { return "SendMessage"; }
};
}  // namespace

string commandName(const Command& command) {
  return std::visit(CommandNameVisitor(), command);
}

bool operator==(const NewTabCommand& a, const NewTabCommand& b) {
  return a.url == b.url && a.active == b.active && a.pinned == b.pinned &&
         a.target == b.target && a.index == b.index;
}

bool operator==(const NewUrlCommand& a, const NewUrlCommand& b) {
  return a.url == b.url && a.active == b.active && a.pinned == b.pinned &&
         a.muted == b.muted && a.target == b.target && a.index == b.index;
}

bool operator==(const ReloadTabCommand& a, const ReloadTabCommand& b) {
  return a.target == b.target && a.index == b.index &&
         a.bypassCache == b.bypassCache;
}

bool operator==(const MoveTabCommand& a, const MoveTabCommand& b) {
  return a.target == b.target && a.startIndex == b.startIndex &&
         a.endIndex == b.endIndex;
}

bool operator==(const RemoveTabCommand& a, const RemoveTabCommand& b) {
  return a.target == b.target && a.index == b.index;
}

bool operator==(const QueryActiveTabCommand&, const QueryActiveTabCommand&) {
  return true;
}

bool operator==(const QueryTabByIndexCommand& a,
                const QueryTabByIndexCommand& b) {
  return a.index == b.index;
}

bool operator==(const QueryTabCommand& a, const QueryTabCommand& b) {
  return a.url == b.url;
}

bool operator==(const RawMessageCommand& a, const RawMessageCommand& b) {
  return a.text == b.text;
}
}  // namespace tb
