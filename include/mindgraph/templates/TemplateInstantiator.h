#pragma once

#include "../core/Graph.h"
#include "../core/IdGenerator.h"
#include "TemplateCatalog.h"
#include "TemplateSpec.h"

#include <optional>
#include <string>
#include <vector>

namespace mindgraph {

/// Nodes and edges produced from a template, ready to be appended to a graph
struct TemplateInstance {
    NodeId rootId;
    std::vector<Node> nodes;
    std::vector<Edge> edges;
};

/// Expands a TemplateSpec into a root node, one node per section and one
/// node per section child, linked root -> section -> child.
///
/// Placement:
/// - root at (0, 0);
/// - section s in grid cell (row = s / sectionsPerRow, col = s % sectionsPerRow)
///   at ((col - 1) * sectionSpacing, (row - 0.5) * sectionSpacing);
/// - the k children of a section in a column at x = sectionX + childOffsetX,
///   centred vertically on the section.
class TemplateInstantiator {
public:
    TemplateInstantiator() = default;
    explicit TemplateInstantiator(const TemplateGridOptions& options) : options_(options) {}

    void setOptions(const TemplateGridOptions& options) { options_ = options; }
    const TemplateGridOptions& options() const { return options_; }

    /// Build the instance. Ids are fresh against `existing` and each other.
    TemplateInstance instantiate(const TemplateSpec& spec, IdGenerator& ids,
                                 const Graph& existing) const;

    /// Look the key up in the catalog first. Unknown keys are logged and
    /// yield nullopt.
    std::optional<TemplateInstance> instantiate(const std::string& key,
                                                const TemplateCatalog& catalog,
                                                IdGenerator& ids,
                                                const Graph& existing) const;

private:
    TemplateGridOptions options_;
};

}  // namespace mindgraph
