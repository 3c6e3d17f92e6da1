#include "energygraph/svg_writer.h"

namespace egraph {
namespace svg {
#define SVG_ATTR(NAME, STR, DEFAULT) const char *NAME::tagName = STR;
#include "energygraph/svg_entities.def"
} // namespace svg
} // namespace egraph
