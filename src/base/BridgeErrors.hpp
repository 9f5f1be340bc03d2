#ifndef __TB_BRIDGE_ERRORS__
#define __TB_BRIDGE_ERRORS__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Raised by BridgeServer::start when the listening endpoint cannot be
 * bound.
 */
class BindError : public std::runtime_error {
 public:
  BindError(const string& _host, int _port, const string& reason)
      : std::runtime_error("Could not listen on " + _host + ":" +
                           to_string(_port) + ": " + reason),
        host(_host),
        port(_port) {}

  const string& getHost() const { return host; }
  int getPort() const { return port; }

 private:
  string host;
  int port;
};

/**
 * @brief An inbound frame that is not a JSON object with a `command` field.
 */
class MalformedMessage : public std::runtime_error {
 public:
  MalformedMessage(const string& reason, const string& _text)
      : std::runtime_error("Malformed message: " + reason), text(_text) {}

  /** @brief The frame text that failed to decode. */
  const string& getText() const { return text; }

 private:
  string text;
};

/**
 * @brief A decoded event lacks a nested field its command tag requires.
 */
class MissingField : public std::runtime_error {
 public:
  MissingField(const string& _command, const string& _field)
      : std::runtime_error("Event " + _command + " is missing field " +
                           _field),
        command(_command),
        field(_field) {}

  const string& getCommand() const { return command; }
  /** @brief Dotted path of the missing field, e.g. `data.url`. */
  const string& getField() const { return field; }

 private:
  string command;
  string field;
};

/**
 * @brief A host-supplied action argument or config value is out of range or
 * has the wrong type.
 */
class InvalidParameter : public std::runtime_error {
 public:
  explicit InvalidParameter(const string& what) : std::runtime_error(what) {}
};
}  // namespace tb

#endif  // __TB_BRIDGE_ERRORS__
