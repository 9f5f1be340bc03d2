#include "MessageCodec.hpp"

namespace tb {
namespace {
ordered_json commandEnvelope(const string& name) {
  ordered_json message;
  message["command"] = name;
  return message;
}

// Host variables can carry bytes that are not UTF-8; they are sent as U+FFFD
string toWire(const ordered_json& message) {
  return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

struct EncodeVisitor {
  string operator()(const NewTabCommand& c) const {
    ordered_json message = commandEnvelope("NewTab");
    ordered_json& parameters = message["parameters"];
    parameters["url"] = c.url;
    parameters["active"] = c.active;
    parameters["pinned"] = c.pinned;
    parameters["target"] = c.target;
    parameters["index"] = c.index;
    return toWire(message);
  }

  string operator()(const NewUrlCommand& c) const {
    ordered_json message = commandEnvelope("NewUrl");
    ordered_json& parameters = message["parameters"];
    parameters["url"] = c.url;
    parameters["active"] = c.active;
    parameters["pinned"] = c.pinned;
    parameters["muted"] = c.muted;
    parameters["target"] = c.target;
    parameters["index"] = c.index;
    return toWire(message);
  }

  string operator()(const ReloadTabCommand& c) const {
    ordered_json message = commandEnvelope("ReloadTab");
    ordered_json& parameters = message["parameters"];
    parameters["target"] = c.target;
    parameters["index"] = c.index;
    parameters["bypasscache"] = c.bypassCache;
    return toWire(message);
  }

  string operator()(const MoveTabCommand& c) const {
    ordered_json message = commandEnvelope("MoveTab");
    ordered_json& parameters = message["parameters"];
    parameters["target"] = c.target;
    parameters["startindex"] = c.startIndex;
    parameters["endindex"] = c.endIndex;
    return toWire(message);
  }

  string operator()(const RemoveTabCommand& c) const {
    ordered_json message = commandEnvelope("RemoveTab");
    ordered_json& parameters = message["parameters"];
    parameters["target"] = c.target;
    parameters["index"] = c.index;
    return toWire(message);
  }

  string operator()(const QueryActiveTabCommand&) const {
    return toWire(commandEnvelope("QueryActiveTab"));
  }

  string operator()(const QueryTabByIndexCommand& c) const {
    // The extension reads this one from `data`, not `parameters`
    ordered_json message = commandEnvelope("QueryTabByIndex");
    message["data"] = c.index;
    return toWire(message);
  }

  string operator()(const QueryTabCommand& c) const {
    ordered_json message = commandEnvelope("QueryTab");
    message["url"] = c.url;
    return toWire(message);
  }

  string operator()(const RawMessageCommand& c) const { return c.text; }
};

template <typename T>
T getField(const json& object, const string& name, const string& command) {
  try {
    return object.at(name).get<T>();
  } catch (const json::exception& e) {
    throw MalformedMessage(
        command + " has a missing or invalid field " + name + ": " + e.what(),
        object.dump());
  }
}

const json& getParameters(const json& message, const string& command) {
  auto it = message.find("parameters");
  if (it == message.end() || !it->is_object()) {
    throw MalformedMessage(command + " has no parameters object",
                           message.dump());
  }
  return *it;
}
}  // namespace

string MessageCodec::encode(const Command& command) {
  return std::visit(EncodeVisitor(), command);
}

Event MessageCodec::decode(const string& text) {
  json message;
  try {
    message = json::parse(text);
  } catch (const json::parse_error& e) {
    throw MalformedMessage(e.what(), text);
  }
  if (!message.is_object()) {
    throw MalformedMessage("not a JSON object", text);
  }
  auto commandIt = message.find("command");
  if (commandIt == message.end()) {
    throw MalformedMessage("no command field", text);
  }
  if (!commandIt->is_string()) {
    throw MalformedMessage("command field is not a string", text);
  }

  Event event;
  event.command = commandIt->get<string>();
  auto dataIt = message.find("data");
  if (dataIt != message.end()) {
    event.data = *dataIt;
  }
  event.raw = text;
  return event;
}

Command MessageCodec::decodeCommand(const string& text) {
  json message = json::parse(text, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return RawMessageCommand{text};
  }
  auto commandIt = message.find("command");
  if (commandIt == message.end() || !commandIt->is_string()) {
    return RawMessageCommand{text};
  }
  const string name = commandIt->get<string>();

  if (name == "NewTab") {
    const json& p = getParameters(message, name);
    NewTabCommand c;
    c.url = getField<string>(p, "url", name);
    c.active = getField<bool>(p, "active", name);
    c.pinned = getField<bool>(p, "pinned", name);
    c.target = getField<int>(p, "target", name);
    c.index = getField<int>(p, "index", name);
    return c;
  }
  if (name == "NewUrl") {
    const json& p = getParameters(message, name);
    NewUrlCommand c;
    c.url = getField<string>(p, "url", name);
    c.active = getField<bool>(p, "active", name);
    c.pinned = getField<bool>(p, "pinned", name);
    c.muted = getField<bool>(p, "muted", name);
    c.target = getField<int>(p, "target", name);
    c.index = getField<int>(p, "index", name);
    return c;
  }
  if (name == "ReloadTab") {
    const json& p = getParameters(message, name);
    ReloadTabCommand c;
    c.target = getField<int>(p, "target", name);
    c.index = getField<int>(p, "index", name);
    c.bypassCache = getField<bool>(p, "bypasscache", name);
    return c;
  }
  if (name == "MoveTab") {
    const json& p = getParameters(message, name);
    MoveTabCommand c;
    c.target = getField<int>(p, "target", name);
    c.startIndex = getField<int>(p, "startindex", name);
    c.endIndex = getField<int>(p, "endindex", name);
    return c;
  }
  if (name == "RemoveTab") {
    const json& p = getParameters(message, name);
    RemoveTabCommand c;
    c.target = getField<int>(p, "target", name);
    c.index = getField<int>(p, "index", name);
    return c;
  }
  if (name == "QueryActiveTab") {
    return QueryActiveTabCommand();
  }
  if (name == "QueryTabByIndex") {
    return QueryTabByIndexCommand{getField<int>(message, "data", name)};
  }
  if (name == "QueryTab") {
    return QueryTabCommand{getField<string>(message, "url", name)};
  }
  return RawMessageCommand{text};
}
}  // namespace tb
