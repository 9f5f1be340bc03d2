#include "ActionFacade.hpp"

namespace tb {
namespace {
const json* findArg(const json& args, const string& name) {
  if (!args.is_object()) {
    return nullptr;
  }
  auto it = args.find(name);
  if (it == args.end() || it->is_null()) {
    return nullptr;
  }
  return &(*it);
}

string stringArg(const json& args, const string& name) {
  const json* value = findArg(args, name);
  if (value == nullptr) {
    return "";
  }
  if (!value->is_string()) {
    throw InvalidParameter("Argument " + name + " must be a string");
  }
  return value->get<string>();
}

bool boolArg(const json& args, const string& name) {
  const json* value = findArg(args, name);
  if (value == nullptr) {
    return false;
  }
  if (!value->is_boolean()) {
    throw InvalidParameter("Argument " + name + " must be true or false");
  }
  return value->get<bool>();
}

int intArg(const json& args, const string& name, int minValue, int maxValue) {
  const json* value = findArg(args, name);
  if (value == nullptr) {
    return 0;
  }
  if (!value->is_number_integer()) {
    throw InvalidParameter("Argument " + name + " must be an integer");
  }
  int64_t i = value->get<int64_t>();
  if (i < minValue || i > maxValue) {
    throw InvalidParameter("Argument " + name + " must be between " +
                           to_string(minValue) + " and " +
                           to_string(maxValue) + ", got " + to_string(i));
  }
  return int(i);
}

int targetArg(const json& args) {
  return intArg(args, "target", TARGET_DEFAULT, TARGET_INDEX);
}

int indexArg(const json& args, const string& name) {
  return intArg(args, name, 0, MAX_TAB_INDEX);
}
}  // namespace

void ActionFacade::newTab(const string& url, bool active, bool pinned,
                          int target, int index) {
  NewTabCommand command;
  command.url = expander.expand(url);
  command.active = active;
  command.pinned = pinned;
  command.target = target;
  command.index = index;
  dispatch(command);
}

void ActionFacade::updateTab(const string& url, bool active, bool pinned,
                             bool muted, int target, int index) {
  NewUrlCommand command;
  command.url = expander.expand(url);
  command.active = active;
  command.pinned = pinned;
  command.muted = muted;
  command.target = target;
  command.index = index;
  dispatch(command);
}

void ActionFacade::reloadTab(int target, int index, bool bypassCache) {
  ReloadTabCommand command;
  command.target = target;
  command.index = index;
  command.bypassCache = bypassCache;
  dispatch(command);
}

void ActionFacade::moveTab(int target, int startIndex, int endIndex) {
  MoveTabCommand command;
  command.target = target;
  command.startIndex = startIndex;
  command.endIndex = endIndex;
  dispatch(command);
}

void ActionFacade::removeTab(int target, int index) {
  RemoveTabCommand command;
  command.target = target;
  command.index = index;
  dispatch(command);
}

void ActionFacade::queryActiveTab() { dispatch(QueryActiveTabCommand()); }

void ActionFacade::queryTabByIndex(int index) {
  QueryTabByIndexCommand command;
  command.index = index;
  dispatch(command);
}

void ActionFacade::queryTab(const string& url) {
  QueryTabCommand command;
  command.url = expander.expand(url);
  dispatch(command);
}

void ActionFacade::sendMessage(const string& message) {
  RawMessageCommand command;
  command.text = expander.expand(message);
  dispatch(command);
}

void ActionFacade::dispatch(const Command& command) {
  if (!sink->send(command)) {
    VLOG(1) << commandName(command) << " was not delivered";
  }
}

void ActionFacade::registerActions(PluginHost* host) {
  host->registerAction("NewTab", [this](const json& args) {
    newTab(stringArg(args, "url"), boolArg(args, "active"),
           boolArg(args, "pinned"), targetArg(args), indexArg(args, "index"));
  });
  host->registerAction("MoveTab", [this](const json& args) {
    moveTab(targetArg(args), indexArg(args, "startindex"),
            indexArg(args, "endindex"));
  });
  host->registerAction("RemoveTab", [this](const json& args) {
    removeTab(targetArg(args), indexArg(args, "index"));
  });
  host->registerAction("UpdateTab", [this](const json& args) {
    updateTab(stringArg(args, "url"), boolArg(args, "active"),
              boolArg(args, "pinned"), boolArg(args, "muted"),
              targetArg(args), indexArg(args, "index"));
  });
  host->registerAction("ReloadTab", [this](const json& args) {
    reloadTab(targetArg(args), indexArg(args, "index"),
              boolArg(args, "bypasscache"));
  });
  host->registerAction("QueryTabByIndex", [this](const json& args) {
    queryTabByIndex(indexArg(args, "index"));
  });
  host->registerAction("QueryActiveTab",
                       [this](const json& args) { queryActiveTab(); });
  host->registerAction("QueryTab", [this](const json& args) {
    queryTab(stringArg(args, "url"));
  });
  host->registerAction("SendMessage", [this](const json& args) {
    sendMessage(stringArg(args, "message"));
  });
}
}  // namespace tb
