#include "errors.h"

namespace storyforge {

const char* error_category(const RenderError& err) {
    if (dynamic_cast<const ParseError*>(&err))           return "parse error";
    if (dynamic_cast<const AnchorError*>(&err))          return "anchor error";
    if (dynamic_cast<const ConfigurationError*>(&err))   return "configuration error";
    if (dynamic_cast<const AssetResolutionError*>(&err)) return "asset resolution error";
    if (dynamic_cast<const EmptyDocumentError*>(&err))   return "empty document";
    if (dynamic_cast<const ExternalToolFailure*>(&err))  return "external tool failure";
    return "render error";
}

} // namespace storyforge
