#include "TemplateExpander.hpp"

namespace tb {
string TemplateExpander::expand(const string& text) const {
  string result;
  result.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    char c = text[pos];
    if (c == '}') {
      result.push_back(c);
      // "}}" is an escaped brace
      pos += (pos + 1 < text.size() && text[pos + 1] == '}') ? 2 : 1;
      continue;
    }
    if (c != '{') {
      result.push_back(c);
      pos++;
      continue;
    }
    if (pos + 1 < text.size() && text[pos + 1] == '{') {
      result.push_back('{');
      pos += 2;
      continue;
    }

    size_t end = text.find('}', pos + 1);
    if (end == string::npos) {
      LOG(WARNING) << "Unterminated variable reference in: " << text;
      result.append(text, pos, string::npos);
      break;
    }
    string name = text.substr(pos + 1, end - pos - 1);
    optional<string> value;
    if (variables != nullptr) {
      value = variables->lookupVariable(name);
    }
    if (value) {
      result.append(*value);
    } else {
      LOG(WARNING) << "Unknown variable {" << name << "} in: " << text;
      result.append(text, pos, end - pos + 1);
    }
    pos = end + 1;
  }
  return result;
}
}  // namespace tb
