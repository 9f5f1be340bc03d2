#include "ConsoleHost.hpp"

namespace tb {
void ConsoleHost::registerAction(const string& name, ActionHandler handler) {
  lock_guard<std::mutex> guard(hostMutex);
  if (actions.find(name) != actions.end()) {
    STFATAL << "Action registered twice: " << name;
  }
  actions[name] = handler;
  VLOG(1) << "Registered action " << name;
}

void ConsoleHost::triggerEvent(const string& suffix,
                               const optional<string>& payload) {
  lock_guard<std::mutex> guard(hostMutex);
  variables["event.suffix"] = suffix;
  variables["event.payload"] = payload ? *payload : "";
  if (payload) {
    CLOG(INFO, "stdout") << eventPrefix << "." << suffix << " " << *payload
                         << endl;
  } else {
    CLOG(INFO, "stdout") << eventPrefix << "." << suffix << endl;
  }
}

optional<string> ConsoleHost::lookupVariable(const string& name) const {
  lock_guard<std::mutex> guard(hostMutex);
  auto it = variables.find(name);
  if (it == variables.end()) {
    return nullopt;
  }
  return it->second;
}

void ConsoleHost::setVariable(const string& name, const string& value) {
  lock_guard<std::mutex> guard(hostMutex);
  variables[name] = value;
}

vector<string> ConsoleHost::getActionNames() {
  lock_guard<std::mutex> guard(hostMutex);
  vector<string> names;
  for (const auto& it : actions) {
    names.push_back(it.first);
  }
  return names;
}

bool ConsoleHost::executeLine(const string& rawLine) {
  string line = trim(rawLine);
  if (line.empty() || line[0] == '#') {
    return true;
  }
  if (line == "quit") {
    return false;
  }

  auto space = line.find_first_of(" \t");
  string name = line.substr(0, space);
  string rest = (space == string::npos) ? "" : trim(line.substr(space + 1));

  if (name == "set") {
    auto nameEnd = rest.find_first_of(" \t");
    if (rest.empty() || nameEnd == string::npos) {
      CLOG(INFO, "stdout") << "Usage: set <name> <value>" << endl;
      return true;
    }
    setVariable(rest.substr(0, nameEnd), trim(rest.substr(nameEnd + 1)));
    return true;
  }

  ActionHandler handler;
  {
    lock_guard<std::mutex> guard(hostMutex);
    auto it = actions.find(name);
    if (it == actions.end()) {
      CLOG(INFO, "stdout") << "Unknown action: " << name << endl;
      return true;
    }
    handler = it->second;
  }

  json args = json::object();
  if (!rest.empty()) {
    args = json::parse(rest, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
      CLOG(INFO, "stdout") << "Arguments for " << name
                           << " must be a JSON object" << endl;
      return true;
    }
  }

  try {
    handler(args);
  } catch (const InvalidParameter& ip) {
    LOG(WARNING) << "Action " << name << " rejected: " << ip.what();
    CLOG(INFO, "stdout") << "Error: " << ip.what() << endl;
  }
  return true;
}

void ConsoleHost::run(std::istream& in) {
  string line;
  while (std::getline(in, line)) {
    if (!executeLine(line)) {
      break;
    }
  }
}
}  // namespace tb
