#ifndef LAMP_REWRITE_HPP
#define LAMP_REWRITE_HPP

#include "lamp/document.hpp"
#include "lamp/fwd.hpp"
#include "lamp/services.hpp"

namespace lamp {

/// @brief Replaces every placeholder and reference in `tree` with its final element.
///
/// Within each document, all placeholders and references are resolved first,
/// while the document is still unmodified, and are then replaced in place.
/// Every resolver is invoked exactly once.
/// A placeholder whose resolution contains another placeholder is replaced with an invalid
/// element.
/// References which are introduced by resolvers are resolved afterwards.
/// Failures are reported to `logger`.
void resolve_placeholders(Document_Tree& tree, Logger& logger);

} // namespace lamp

#endif
