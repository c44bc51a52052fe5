#include "internal/parser/name_parser.hpp"

namespace resolver::parser {

void ApplyHints(model::ParseResult& result, const NameHints& hints) {
  if (hints.type) {
    result.type = *hints.type;
  }

  if (result.failed || result.placeholder) {
    return;
  }

  if (hints.given && !hints.given->empty() && !result.name.given) {
    result.name.given = *hints.given;
  }
  if (hints.family && !hints.family->empty() && !result.name.family) {
    result.name.family = *hints.family;
  }
}

} // namespace resolver::parser
