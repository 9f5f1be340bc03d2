#ifndef __TB_TEMPLATE_EXPANDER__
#define __TB_TEMPLATE_EXPANDER__

#include "Headers.hpp"
#include "PluginHost.hpp"

namespace tb {
/**
 * @brief Expands `{name}` references in action text.
 *
 * `{{` and `}}` stand for literal braces. A reference to an unknown variable
 * or an unterminated `{` is copied through unchanged and logged; expansion
 * never fails.
 */
class TemplateExpander {
 public:
  /** @param _variables May be null, in which case no names resolve. */
  explicit TemplateExpander(const VariableSource* _variables)
      : variables(_variables) {}

  string expand(const string& text) const;

 protected:
  const VariableSource* variables;
};
}  // namespace tb

#endif  // __TB_TEMPLATE_EXPANDER__
