#include "Dispatcher.hpp"

namespace tb {
namespace {
const std::unordered_map<string, EventTag> TAGS_BY_NAME = {
    {"QueryActiveTab", EventTag::QUERY_ACTIVE_TAB},
    {"QueryTabByIndex", EventTag::QUERY_TAB_BY_INDEX},
    {"ActiveTab", EventTag::ACTIVE_TAB},
    {"TabUpdated", EventTag::TAB_UPDATED},
    {"CreateNewTab", EventTag::CREATE_NEW_TAB},
    {"MoveTab", EventTag::MOVE_TAB},
    {"RemoveTab", EventTag::REMOVE_TAB},
};

string payloadFromData(const Event& event, const string& key) {
  const json* value = event.findData(key);
  if (value == nullptr || value->is_null()) {
    throw MissingField(event.command, "data." + key);
  }
  if (value->is_string()) {
    return value->get<string>();
  }
  return value->dump();
}
}  // namespace

optional<EventTag> Dispatcher::parseTag(const string& command) {
  auto it = TAGS_BY_NAME.find(command);
  if (it == TAGS_BY_NAME.end()) {
    return nullopt;
  }
  return it->second;
}

const vector<NotificationRule>& Dispatcher::rulesFor(EventTag tag) {
  static const vector<NotificationRule> QUERY_ACTIVE_TAB_RULES = {
      {"QueryActiveTabInfo", PayloadSource::RAW_MESSAGE},
      {"QueryActiveTab", PayloadSource::DATA_URL},
  };
  static const vector<NotificationRule> QUERY_TAB_BY_INDEX_RULES = {
      {"QueryTabByIndex", PayloadSource::DATA_INDEX},
      {"QueryTabByIndexInfo", PayloadSource::RAW_MESSAGE},
  };
  static const vector<NotificationRule> ACTIVE_TAB_RULES = {
      {"ActiveTabUrl", PayloadSource::DATA_URL},
      {"ActiveTabInfo", PayloadSource::RAW_MESSAGE},
  };
  // Existing automation rules match on "ActiveTabUrInfo", keep the spelling
  static const vector<NotificationRule> TAB_UPDATED_RULES = {
      {"ActiveTabUrl", PayloadSource::DATA_URL},
      {"ActiveTabUrInfo", PayloadSource::RAW_MESSAGE},
  };
  static const vector<NotificationRule> CREATE_NEW_TAB_RULES = {
      {"CreateNewTab", PayloadSource::RAW_MESSAGE},
  };
  static const vector<NotificationRule> MOVE_TAB_RULES = {
      {"MoveTab", PayloadSource::RAW_MESSAGE},
  };
  static const vector<NotificationRule> REMOVE_TAB_RULES = {
      {"RemoveTab", PayloadSource::RAW_MESSAGE},
  };

  switch (tag) {
    case EventTag::QUERY_ACTIVE_TAB:
      return QUERY_ACTIVE_TAB_RULES;
    case EventTag::QUERY_TAB_BY_INDEX:
      return QUERY_TAB_BY_INDEX_RULES;
    case EventTag::ACTIVE_TAB:
      return ACTIVE_TAB_RULES;
    case EventTag::TAB_UPDATED:
      return TAB_UPDATED_RULES;
    case EventTag::CREATE_NEW_TAB:
      return CREATE_NEW_TAB_RULES;
    case EventTag::MOVE_TAB:
      return MOVE_TAB_RULES;
    case EventTag::REMOVE_TAB:
      return REMOVE_TAB_RULES;
  }
  STFATAL << "Unhandled event tag: " << int(tag);
  return REMOVE_TAB_RULES;  // not reached
}

vector<Notification> Dispatcher::resolve(const Event& event) {
  vector<Notification> notifications;
  auto tag = parseTag(event.command);
  if (!tag) {
    VLOG(1) << "Ignoring event with unknown command: " << event.command;
    return notifications;
  }
  for (const auto& rule : rulesFor(*tag)) {
    Notification notification;
    notification.suffix = rule.suffix;
    switch (rule.source) {
      case PayloadSource::RAW_MESSAGE:
        notification.payload = event.raw;
        break;
      case PayloadSource::DATA_URL:
        notification.payload = payloadFromData(event, "url");
        break;
      case PayloadSource::DATA_INDEX:
        notification.payload = payloadFromData(event, "index");
        break;
    }
    notifications.push_back(notification);
  }
  return notifications;
}

int Dispatcher::dispatch(const Event& event) {
  // Resolve everything first so a missing field raises nothing at all
  vector<Notification> notifications = resolve(event);
  for (const auto& notification : notifications) {
    VLOG(2) << "Raising " << notification.suffix;
    host->triggerEvent(notification.suffix, notification.payload);
  }
  return int(notifications.size());
}
}  // namespace tb
