#ifndef ENERGYGRAPH_RENDERER_H
#define ENERGYGRAPH_RENDERER_H

#include "energygraph/scene.h"
#include "energygraph/svg_writer.h"

#include <string>

namespace egraph {

/// Writes @p node and its descendants, depth first, to @p writer. The
/// caller is responsible for calling writer.finish().
svg::WriterConcept::RetTy renderNode(const Node &node,
                                     svg::WriterConcept &writer);

/// Renders @p node and finishes @p writer. Writer failures are reported as
/// WRITER_FAILURE.
GraphErrorOr<void> writeNode(const Node &node, svg::WriterConcept &writer);

/// Serializes @p node to a markup fragment.
GraphErrorOr<std::string> render(const Node &node, bool formatted = false);

} // namespace egraph
#endif // ENERGYGRAPH_RENDERER_H
