#include "mindgraph/templates/TemplateInstantiator.h"
#include "mindgraph/common/Logger.h"

#include <unordered_set>

namespace mindgraph {

namespace {

struct NodeStyle {
    double fontSize;
    const char* color;
    const char* shape;
};

constexpr NodeStyle ROOT_STYLE{20.0, "#f0f9ff", "rounded"};
constexpr NodeStyle SECTION_STYLE{16.0, "#fef3c7", "rounded"};
constexpr NodeStyle CHILD_STYLE{14.0, "#e5e7eb", "ellipse"};

Node makeNode(NodeId id, Point position, const std::string& label, const NodeStyle& style) {
    Node node;
    node.id = std::move(id);
    node.position = position;
    node.data.label = label;
    node.data.editing = false;
    node.data.fontSize = style.fontSize;
    node.data.color = style.color;
    node.data.shape = style.shape;
    return node;
}

}  // namespace

TemplateInstance TemplateInstantiator::instantiate(const TemplateSpec& spec, IdGenerator& ids,
                                                   const Graph& existing) const {
    std::unordered_set<std::string> used;

    auto freshId = [&](const char* prefix) {
        std::string id = ids.next(prefix, [&](const std::string& candidate) {
            return used.count(candidate) > 0 || existing.hasNode(candidate) ||
                   existing.hasEdge(candidate);
        });
        used.insert(id);
        return id;
    };

    auto link = [&](TemplateInstance& instance, const NodeId& source, const NodeId& target) {
        Edge edge;
        edge.id = freshId("e");
        edge.source = source;
        edge.target = target;
        edge.type = EdgeType::SmoothStep;
        instance.edges.push_back(std::move(edge));
    };

    TemplateInstance instance;
    instance.rootId = freshId("n");
    instance.nodes.push_back(makeNode(instance.rootId, {0.0, 0.0}, spec.root, ROOT_STYLE));

    const int perRow = options_.sectionsPerRow > 0 ? options_.sectionsPerRow : 1;

    for (size_t s = 0; s < spec.sections.size(); ++s) {
        const auto& section = spec.sections[s];
        const int row = static_cast<int>(s) / perRow;
        const int col = static_cast<int>(s) % perRow;

        const double sectionX = (col - 1) * options_.sectionSpacing;
        const double sectionY = (row - 0.5) * options_.sectionSpacing;

        NodeId sectionId = freshId("n");
        instance.nodes.push_back(makeNode(sectionId, {sectionX, sectionY}, section.title, SECTION_STYLE));
        link(instance, instance.rootId, sectionId);

        const double totalChildHeight =
            static_cast<double>(section.children.size() > 0 ? section.children.size() - 1 : 0) *
            options_.childSpacing;
        const double startY = sectionY - totalChildHeight / 2.0;

        for (size_t i = 0; i < section.children.size(); ++i) {
            Point position{sectionX + options_.childOffsetX,
                           startY + static_cast<double>(i) * options_.childSpacing};
            NodeId childId = freshId("n");
            instance.nodes.push_back(makeNode(childId, position, section.children[i], CHILD_STYLE));
            link(instance, sectionId, childId);
        }
    }

    LOG_DEBUG("Instantiated template '{}': {} nodes, {} edges",
              spec.name, instance.nodes.size(), instance.edges.size());
    return instance;
}

std::optional<TemplateInstance> TemplateInstantiator::instantiate(const std::string& key,
                                                                  const TemplateCatalog& catalog,
                                                                  IdGenerator& ids,
                                                                  const Graph& existing) const {
    const TemplateSpec* spec = catalog.find(key);
    if (!spec) {
        LOG_WARN("Unknown template '{}'", key);
        return std::nullopt;
    }
    return instantiate(*spec, ids, existing);
}

}  // namespace mindgraph
